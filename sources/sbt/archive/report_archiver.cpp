//
// Created by gregorian-rayne on 2/13/26.
//

#include "sbt/archive/report_archiver.hpp"
#include "sbt/utils/file_utils.hpp"

namespace sbt::archive
{
    ArchiveResult archive_scan_build_output(const fs::path& workspace_output_folder,
                                            const fs::path& archive_output_folder,
                                            Diagnostics& diagnostics) {
        ArchiveResult result;

        if (auto created = file_utils::ensure_directory(workspace_output_folder); created.is_err()) {
            diagnostics.error("Unable to create scan-build output folder: " + created.error().message(),
                              workspace_output_folder.string());
            return result;
        }

        auto subfolders = file_utils::list_subdirectories(workspace_output_folder);
        if (subfolders.is_err()) {
            diagnostics.error("Unable to list scan-build output folder: " + subfolders.error().message(),
                              workspace_output_folder.string());
            return result;
        }

        if (subfolders.value().empty()) {
            diagnostics.warning("Could not locate a unique scan-build output folder",
                                workspace_output_folder.string());
            return result;
        }

        if (subfolders.value().size() > 1) {
            diagnostics.info("Several scan-build output folders found; archiving " +
                             subfolders.value().front().filename().string(),
                             workspace_output_folder.string());
        }

        result.source_folder = subfolders.value().front();

        if (auto copied = file_utils::copy_directory_contents(*result.source_folder, archive_output_folder);
            copied.is_err()) {
            diagnostics.error("Unable to copy scan-build output to the run archive folder: " +
                              copied.error().message(),
                              copied.error().context().value_or(archive_output_folder.string()));
            return result;
        }

        result.copied = true;
        return result;
    }

}  // namespace sbt::archive
