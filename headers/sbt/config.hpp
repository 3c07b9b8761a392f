//
// Created by gregorian-rayne on 2/13/26.
//

#ifndef SCANBUILDTRACKER_CONFIG_HPP
#define SCANBUILDTRACKER_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Publisher configuration.
 *
 * Loaded from a TOML file (default .sbt-config.toml):
 * @code
 *     [publisher]
 *     scan_build_output_folder = "clangScanBuildReports"
 *     mark_build_unstable_when_threshold_is_exceeded = true
 *     bug_threshold = 0
 * @endcode
 * Keys that are not present keep their defaults. CLI options override
 * whatever the file says.
 */

#include "sbt/result.hpp"
#include "sbt/error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace sbt {

    namespace fs = std::filesystem;

    inline constexpr std::string_view DEFAULT_CONFIG_FILE = ".sbt-config.toml";
    inline constexpr std::string_view DEFAULT_OUTPUT_FOLDER = "clangScanBuildReports";

    struct PublisherConfig {
        /// Folder scan-build writes into, relative to the workspace; the same
        /// name is used below each run directory for the archived copy.
        std::string scan_build_output_folder = std::string(DEFAULT_OUTPUT_FOLDER);

        bool mark_build_unstable_when_threshold_is_exceeded = false;

        /// Largest defect count that still passes.
        std::int64_t bug_threshold = 0;

        /**
         * Checks value constraints.
         *
         * @return ConfigError if the output folder is empty, absolute or
         *         escapes its parent via "..", or if the threshold is negative.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Parses TOML text. Values are not validated.
         */
        [[nodiscard]] static Result<PublisherConfig, Error> load_from_string(std::string_view content);

        /**
         * Reads and parses a TOML file.
         *
         * @return NotFound if the file does not exist.
         */
        [[nodiscard]] static Result<PublisherConfig, Error> load_from_file(const fs::path& path);
    };

}  // namespace sbt

#endif //SCANBUILDTRACKER_CONFIG_HPP
