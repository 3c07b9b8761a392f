//
// Created by gregorian-rayne on 2/10/26.
//

#include "sbt/reports/report_locator.hpp"

#include <algorithm>

namespace sbt::reports
{
    bool is_report_file_name(const std::string_view filename) noexcept {
        if (filename.size() < REPORT_PREFIX.size() + REPORT_SUFFIX.size()) {
            return false;
        }
        if (filename.find('/') != std::string_view::npos || filename.find('\\') != std::string_view::npos) {
            return false;
        }
        return filename.starts_with(REPORT_PREFIX) && filename.ends_with(REPORT_SUFFIX);
    }

    Result<std::vector<fs::path>, Error> locate_reports(const fs::path& root) {
        std::error_code ec;

        if (!fs::exists(root, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Report folder not found", root.string())
            );
        }

        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Report folder is not a directory", root.string())
            );
        }

        // Probe the root separately: skip_permission_denied would turn an
        // unreadable root into an empty listing.
        if (fs::directory_iterator probe(root, ec); ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Cannot read report folder: " + ec.message(), root.string())
            );
        }

        std::vector<fs::path> reports;

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        const fs::recursive_directory_iterator end;

        while (!ec && it != end) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec) && is_report_file_name(it->path().filename().string())) {
                reports.push_back(it->path());
            }
            it.increment(ec);
        }

        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed while scanning report folder: " + ec.message(), root.string())
            );
        }

        std::ranges::sort(reports);
        return Result<std::vector<fs::path>, Error>::success(std::move(reports));
    }

}  // namespace sbt::reports
