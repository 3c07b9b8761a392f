//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef SBT_DEFECT_BUILDER_HPP
#define SBT_DEFECT_BUILDER_HPP

/**
 * @file defect_builder.hpp
 * @brief Turns one scan-build report into a Defect.
 */

#include "sbt/types.hpp"
#include "sbt/diagnostics.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sbt::reports {

    namespace fs = std::filesystem;

    /**
     * Builds a Defect from report text.
     *
     * All four markers are optional. BUGFILE is shortened to a
     * workspace-relative path with path_utils::strip_workspace_prefix().
     * is_new is left unset.
     *
     * @param content Full report text.
     * @param report_file Report identifier (its basename).
     * @param workspace_root Workspace path as the scanner saw it.
     */
    [[nodiscard]] Defect build_defect(std::string_view content,
                                      std::string report_file,
                                      std::string_view workspace_root);

    /**
     * Reads a report file and builds its Defect.
     *
     * An unreadable file never fails the run: a warning goes to
     * diagnostics and the returned Defect only has report_file set.
     */
    [[nodiscard]] Defect build_defect_from_file(const fs::path& report,
                                                std::string_view workspace_root,
                                                Diagnostics& diagnostics);

}  // namespace sbt::reports

#endif //SBT_DEFECT_BUILDER_HPP
