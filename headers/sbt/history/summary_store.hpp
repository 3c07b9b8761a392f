//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef SBT_SUMMARY_STORE_HPP
#define SBT_SUMMARY_STORE_HPP

/**
 * @file summary_store.hpp
 * @brief Persistence of a run's defect summary.
 *
 * Each run writes exactly one bugSummary.json into its archived
 * scan-build folder. The next run reads it back to decide which defects
 * are new.
 *
 * Format (format_version 1):
 * @code
 *     {
 *       "format_version": 1,
 *       "run": 42,
 *       "defect_count": 1,
 *       "defects": [
 *         {
 *           "report_file": "report-a1b2c3.html",
 *           "bug_type": "Memory leak",
 *           "bug_description": "Potential leak of memory pointed to by 'p'",
 *           "bug_category": "Memory error",
 *           "source_file": "/src/foo.c",
 *           "is_new": true
 *         }
 *       ]
 *     }
 * @endcode
 *
 * Absent marker fields are omitted, and is_new is only written once the
 * differencer has set it.
 */

#include "sbt/types.hpp"
#include "sbt/result.hpp"
#include "sbt/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sbt::history {

    namespace fs = std::filesystem;

    inline constexpr std::string_view SUMMARY_FILE_NAME = "bugSummary.json";

    /**
     * Highest format_version this build can read and the one it writes.
     */
    inline constexpr int SUMMARY_FORMAT_VERSION = 1;

    /**
     * Serializes a summary to pretty-printed JSON text.
     */
    [[nodiscard]] std::string serialize_summary(const RunSummary& summary);

    /**
     * Parses summary JSON text.
     *
     * @return The summary, or ParseError for malformed JSON, a missing
     *         field, or an unsupported format_version.
     */
    [[nodiscard]] Result<RunSummary, Error> deserialize_summary(std::string_view text);

    /**
     * Writes summary to <folder>/bugSummary.json.
     *
     * @return Path of the written file, or IoError.
     */
    [[nodiscard]] Result<fs::path, Error> save_summary(const fs::path& folder, const RunSummary& summary);

    /**
     * Reads a summary file.
     *
     * @return The summary, NotFound if the file is missing, or ParseError.
     */
    [[nodiscard]] Result<RunSummary, Error> load_summary(const fs::path& summary_file);

}  // namespace sbt::history

#endif //SBT_SUMMARY_STORE_HPP
