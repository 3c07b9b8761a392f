//
// Created by gregorian-rayne on 2/12/26.
//

#include "sbt/threshold/threshold_evaluator.hpp"

namespace sbt::threshold
{
    ThresholdVerdict evaluate(const std::size_t defect_count, const bool enabled, const std::int64_t threshold) noexcept {
        ThresholdVerdict verdict;
        verdict.defect_count = defect_count;
        verdict.threshold = threshold;
        verdict.enabled = enabled;

        verdict.exceeded = enabled &&
                           (threshold < 0 || defect_count > static_cast<std::size_t>(threshold));
        return verdict;
    }

}  // namespace sbt::threshold
