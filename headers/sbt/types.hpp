//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_TYPES_HPP
#define SCANBUILDTRACKER_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures for scan-build defect tracking.
 *
 * - Defect: one finding, extracted from one report-*.html file
 * - RunSummary: every Defect produced by one run, in discovery order
 * - ThresholdVerdict: outcome of comparing a run's count to its limit
 *
 * A Defect is filled in once by the record builder; afterwards the only
 * field that changes is is_new, set by the differencer.
 */

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>

namespace sbt {

    namespace fs = std::filesystem;

    /**
     * Monotonically increasing run number. Runs start at 1.
     */
    using RunId = std::int64_t;

    /**
     * A single static-analysis finding.
     *
     * Marker fields are absent when the report did not carry the marker.
     * is_new is only set when a previous run summary was available.
     */
    struct Defect {
        std::string report_file;                  // report basename, run-scoped
        std::optional<std::string> bug_type;
        std::optional<std::string> bug_description;
        std::optional<std::string> bug_category;
        std::optional<std::string> source_file;   // relative to the workspace when possible
        std::optional<bool> is_new;

        [[nodiscard]] bool is_marked_new() const noexcept {
            return is_new.value_or(false);
        }

        bool operator==(const Defect&) const = default;
    };

    /**
     * The complete defect set of one run.
     */
    struct RunSummary {
        RunId run = 0;
        std::vector<Defect> defects;

        RunSummary() = default;
        explicit RunSummary(RunId run_id) : run(run_id) {}

        void add(Defect defect) {
            defects.push_back(std::move(defect));
        }

        [[nodiscard]] std::size_t defect_count() const noexcept {
            return defects.size();
        }

        [[nodiscard]] std::size_t new_defect_count() const noexcept {
            std::size_t count = 0;
            for (const auto& d : defects) {
                if (d.is_marked_new()) {
                    ++count;
                }
            }
            return count;
        }
    };

    /**
     * Threshold evaluation result, with the inputs that produced it.
     */
    struct ThresholdVerdict {
        std::size_t defect_count = 0;
        std::int64_t threshold = 0;
        bool enabled = false;
        bool exceeded = false;
    };

}  // namespace sbt

#endif //SCANBUILDTRACKER_TYPES_HPP
