//
// Created by gregorian-rayne on 2/10/26.
//

#include "sbt/reports/defect_builder.hpp"
#include "sbt/reports/marker_extractor.hpp"
#include "sbt/utils/file_utils.hpp"
#include "sbt/utils/path_utils.hpp"

namespace sbt::reports
{
    Defect build_defect(const std::string_view content,
                        std::string report_file,
                        const std::string_view workspace_root) {
        Defect defect;
        defect.report_file = std::move(report_file);
        defect.bug_type = extract_marker(content, Marker::BugType);
        defect.bug_description = extract_marker(content, Marker::BugDescription);
        defect.bug_category = extract_marker(content, Marker::BugCategory);

        if (auto source = extract_marker(content, Marker::BugFile)) {
            defect.source_file = path_utils::strip_workspace_prefix(*source, workspace_root);
        }

        return defect;
    }

    Defect build_defect_from_file(const fs::path& report,
                                  const std::string_view workspace_root,
                                  Diagnostics& diagnostics) {
        auto report_name = report.filename().string();

        auto content = file_utils::read_file(report);
        if (content.is_err()) {
            diagnostics.warning("Unable to read report or locate scan-build markers: " + content.error().message(),
                                report.string());
            Defect defect;
            defect.report_file = std::move(report_name);
            return defect;
        }

        return build_defect(content.value(), std::move(report_name), workspace_root);
    }

}  // namespace sbt::reports
