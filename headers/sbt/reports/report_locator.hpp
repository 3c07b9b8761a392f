//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef SBT_REPORT_LOCATOR_HPP
#define SBT_REPORT_LOCATOR_HPP

/**
 * @file report_locator.hpp
 * @brief Finds scan-build HTML reports below a directory.
 *
 * scan-build writes one report-<hash>.html per finding next to its
 * index.html. The locator collects every such file anywhere under the
 * archived output folder of a run.
 */

#include "sbt/result.hpp"
#include "sbt/error.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace sbt::reports {

    namespace fs = std::filesystem;

    /**
     * Basename prefix and suffix of a scan-build report: report-*.html.
     */
    inline constexpr std::string_view REPORT_PREFIX = "report-";
    inline constexpr std::string_view REPORT_SUFFIX = ".html";

    /**
     * Checks whether a basename matches report-*.html (case-sensitive).
     *
     * @param filename A file name without directory components.
     */
    [[nodiscard]] bool is_report_file_name(std::string_view filename) noexcept;

    /**
     * Recursively collects all report files below root.
     *
     * The result is sorted by path so repeated calls over an unchanged
     * tree return the same sequence.
     *
     * @param root Directory to search.
     * @return Matching files (possibly empty), NotFound if root does not
     *         exist, IoError if it cannot be traversed.
     */
    [[nodiscard]] Result<std::vector<fs::path>, Error> locate_reports(const fs::path& root);

}  // namespace sbt::reports

#endif //SBT_REPORT_LOCATOR_HPP
