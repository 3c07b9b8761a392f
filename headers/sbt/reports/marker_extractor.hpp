//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef SBT_MARKER_EXTRACTOR_HPP
#define SBT_MARKER_EXTRACTOR_HPP

/**
 * @file marker_extractor.hpp
 * @brief Reads the metadata comments scan-build embeds in each report.
 *
 * Every report-*.html produced by scan-build carries its key facts as
 * single-line HTML comments near the top of the document:
 *
 * @code
 *     <!-- BUGTYPE Memory leak -->
 *     <!-- BUGDESC Potential leak of memory pointed to by 'p' -->
 *     <!-- BUGFILE /home/ci/ws/src/foo.c -->
 *     <!-- BUGCATEGORY Memory error -->
 * @endcode
 *
 * Each marker is matched independently with <!--\sKEYWORD\s(.*)\s-->,
 * where the capture cannot cross a line break. Only the first occurrence
 * counts, and the captured value is whitespace-trimmed.
 */

#include <optional>
#include <string>
#include <string_view>

namespace sbt::reports {

    enum class Marker {
        BugType,
        BugDescription,
        BugFile,
        BugCategory
    };

    /**
     * Returns the keyword used in the comment, e.g. "BUGDESC".
     */
    [[nodiscard]] std::string_view marker_keyword(Marker marker) noexcept;

    /**
     * Extracts the value of one marker from a report document.
     *
     * @param content Full text of the report.
     * @param marker The marker to look for.
     * @return The trimmed value of the first occurrence, or nullopt if the
     *         marker is absent.
     */
    [[nodiscard]] std::optional<std::string> extract_marker(std::string_view content, Marker marker);

}  // namespace sbt::reports

#endif //SBT_MARKER_EXTRACTOR_HPP
