//
// Created by gregorian-rayne on 2/13/26.
//

#include "sbt/config.hpp"
#include "sbt/utils/file_utils.hpp"
#include "sbt/utils/path_utils.hpp"

#include <toml++/toml.h>

namespace sbt
{
    Result<void, Error> PublisherConfig::validate() const {
        if (scan_build_output_folder.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("scan_build_output_folder must not be empty")
            );
        }

        if (!path_utils::is_contained_relative(fs::path(scan_build_output_folder))) {
            return Result<void, Error>::failure(
                Error::config_error("scan_build_output_folder must be a relative path inside the workspace",
                                    scan_build_output_folder)
            );
        }

        if (bug_threshold < 0) {
            return Result<void, Error>::failure(
                Error::config_error("bug_threshold must not be negative", std::to_string(bug_threshold))
            );
        }

        return Result<void, Error>::success();
    }

    Result<PublisherConfig, Error> PublisherConfig::load_from_string(const std::string_view content) {
        try {
            auto tbl = toml::parse(content);
            PublisherConfig config;

            if (!tbl["publisher"]) {
                return Result<PublisherConfig, Error>::success(config);
            }

            auto* publisher = tbl["publisher"].as_table();
            if (!publisher) {
                return Result<PublisherConfig, Error>::failure(
                    Error::config_error("[publisher] must be a table")
                );
            }

            if (const auto node = (*publisher)["scan_build_output_folder"]; node) {
                const auto value = node.value_exact<std::string>();
                if (!value) {
                    return Result<PublisherConfig, Error>::failure(
                        Error::config_error("scan_build_output_folder must be a string")
                    );
                }
                config.scan_build_output_folder = *value;
            }

            if (const auto node = (*publisher)["mark_build_unstable_when_threshold_is_exceeded"]; node) {
                const auto value = node.value_exact<bool>();
                if (!value) {
                    return Result<PublisherConfig, Error>::failure(
                        Error::config_error("mark_build_unstable_when_threshold_is_exceeded must be a boolean")
                    );
                }
                config.mark_build_unstable_when_threshold_is_exceeded = *value;
            }

            if (const auto node = (*publisher)["bug_threshold"]; node) {
                const auto value = node.value_exact<std::int64_t>();
                if (!value) {
                    return Result<PublisherConfig, Error>::failure(
                        Error::config_error("bug_threshold must be an integer")
                    );
                }
                config.bug_threshold = *value;
            }

            return Result<PublisherConfig, Error>::success(config);
        } catch (const toml::parse_error& err) {
            return Result<PublisherConfig, Error>::failure(
                Error::parse_error(std::string("Failed to parse configuration: ") + std::string(err.description()))
            );
        }
    }

    Result<PublisherConfig, Error> PublisherConfig::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<PublisherConfig, Error>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<PublisherConfig, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

}  // namespace sbt
