//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef SBT_THRESHOLD_EVALUATOR_HPP
#define SBT_THRESHOLD_EVALUATOR_HPP

/**
 * @file threshold_evaluator.hpp
 * @brief Decides whether a run has too many defects.
 */

#include "sbt/types.hpp"

#include <cstddef>
#include <cstdint>

namespace sbt::threshold {

    /**
     * Compares a defect count to the configured limit.
     *
     * exceeded = enabled && defect_count > threshold. The comparison is
     * strict: a count equal to the threshold passes. The verdict is only
     * reported; marking the run unstable is up to the caller.
     */
    [[nodiscard]] ThresholdVerdict evaluate(std::size_t defect_count, bool enabled, std::int64_t threshold) noexcept;

}  // namespace sbt::threshold

#endif //SBT_THRESHOLD_EVALUATOR_HPP
