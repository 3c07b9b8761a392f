//
// Created by gregorian-rayne on 2/11/26.
//

#include "sbt/history/defect_matcher.hpp"

#include <algorithm>

namespace sbt::history
{
    bool ExactFieldMatcher::same_defect(const Defect& current, const Defect& previous) const {
        return current.bug_type == previous.bug_type &&
               current.bug_description == previous.bug_description &&
               current.bug_category == previous.bug_category &&
               current.source_file == previous.source_file;
    }

    bool summary_contains(const RunSummary& summary,
                          const Defect& defect,
                          const IDefectMatcher& matcher) {
        return std::ranges::any_of(summary.defects, [&](const Defect& previous) {
            return matcher.same_defect(defect, previous);
        });
    }

    std::size_t mark_new_defects(std::vector<Defect>& current,
                                 const std::optional<RunSummary>& previous,
                                 const IDefectMatcher& matcher) {
        if (!previous) {
            return 0;
        }

        std::size_t marked = 0;
        for (auto& defect : current) {
            defect.is_new = !summary_contains(*previous, defect, matcher);
            if (*defect.is_new) {
                ++marked;
            }
        }
        return marked;
    }

}  // namespace sbt::history
