//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef SBT_REPORT_ARCHIVER_HPP
#define SBT_REPORT_ARCHIVER_HPP

/**
 * @file report_archiver.hpp
 * @brief Copies scan-build output from the workspace into a run's archive.
 *
 * scan-build never writes straight into the folder it is given. It
 * creates a uniquely named subfolder (for example
 * 2026-02-13-101502-4242-1) and puts index.html and the report-*.html
 * files there. The archiver picks that subfolder and copies its contents
 * into the run directory, so later runs read stable, run-owned paths
 * instead of a workspace the next build will overwrite.
 */

#include "sbt/diagnostics.hpp"

#include <filesystem>
#include <optional>

namespace sbt::archive {

    namespace fs = std::filesystem;

    /**
     * Outcome of archiving one run's scanner output.
     */
    struct ArchiveResult {
        std::optional<fs::path> source_folder;   // subfolder that was copied
        bool copied = false;
    };

    /**
     * Archives scan-build output.
     *
     * Creates workspace_output_folder if it does not exist. With no
     * subfolder present, a warning is recorded and nothing is copied. With
     * several, the first in name order is used. A failed copy is recorded
     * as an error diagnostic and reported via ArchiveResult::copied; it is
     * never fatal.
     *
     * @param workspace_output_folder <workspace>/<scan-build output folder>
     * @param archive_output_folder <run dir>/<scan-build output folder>
     * @param diagnostics Receives warnings and errors.
     */
    ArchiveResult archive_scan_build_output(const fs::path& workspace_output_folder,
                                            const fs::path& archive_output_folder,
                                            Diagnostics& diagnostics);

}  // namespace sbt::archive

#endif //SBT_REPORT_ARCHIVER_HPP
