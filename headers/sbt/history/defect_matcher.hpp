//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef SBT_DEFECT_MATCHER_HPP
#define SBT_DEFECT_MATCHER_HPP

/**
 * @file defect_matcher.hpp
 * @brief Decides whether a defect already existed in the previous run.
 *
 * Whether two findings from different runs are "the same bug" is a
 * policy, so it lives behind IDefectMatcher. The shipped policy,
 * ExactFieldMatcher, treats two defects as equal when bug type,
 * description, category and source file all match exactly, with an
 * absent field only matching another absent field. The report file name
 * is never compared: scan-build derives it per run, so it differs
 * between runs even for an unchanged finding.
 */

#include "sbt/types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace sbt::history {

    /**
     * Equality policy for defects across runs.
     */
    class IDefectMatcher {
    public:
        virtual ~IDefectMatcher() = default;

        /**
         * Returns the policy name (for diagnostics and --verbose output).
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Returns true if current and previous describe the same finding.
         */
        [[nodiscard]] virtual bool same_defect(const Defect& current, const Defect& previous) const = 0;
    };

    /**
     * Default policy: exact match on type, description, category and source
     * file. report_file and is_new are ignored.
     */
    class ExactFieldMatcher final : public IDefectMatcher {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "exact-fields";
        }

        [[nodiscard]] bool same_defect(const Defect& current, const Defect& previous) const override;
    };

    /**
     * Returns true if summary holds a defect the matcher considers equal.
     */
    [[nodiscard]] bool summary_contains(const RunSummary& summary,
                                        const Defect& defect,
                                        const IDefectMatcher& matcher);

    /**
     * Sets is_new on every current defect.
     *
     * is_new = true when previous has no matching defect, false when it
     * does. Without a previous summary nothing is changed: a missing
     * history says nothing about novelty, so is_new stays unset.
     *
     * @return Number of defects marked new.
     */
    std::size_t mark_new_defects(std::vector<Defect>& current,
                                 const std::optional<RunSummary>& previous,
                                 const IDefectMatcher& matcher);

}  // namespace sbt::history

#endif //SBT_DEFECT_MATCHER_HPP
