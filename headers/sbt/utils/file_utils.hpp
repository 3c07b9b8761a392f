//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_FILE_UTILS_HPP
#define SCANBUILDTRACKER_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading, writing, listing and copying. All operations use
 * Result<T, Error> for error handling and never throw.
 */

#include "sbt/result.hpp"
#include "sbt/error.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sbt::file_utils {

    namespace fs = std::filesystem;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Writes a string to a file, creating parent directories.
     *
     * @param path Path to the file.
     * @param content Content to write.
     * @return Success or an error.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Creates a directory and its parents if missing.
     */
    inline Result<void, Error> ensure_directory(const fs::path& dir) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            return Result<void, Error>::success();
        }
        fs::create_directories(dir, ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to create directory: " + ec.message(), dir.string())
            );
        }
        return Result<void, Error>::success();
    }

    /**
     * Lists the immediate subdirectories of a directory, sorted by name.
     *
     * @param dir Directory to inspect.
     * @return Subdirectory paths or an error.
     */
    inline Result<std::vector<fs::path>, Error> list_subdirectories(const fs::path& dir) {
        std::error_code ec;

        if (!fs::exists(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Directory not found", dir.string())
            );
        }

        if (!fs::is_directory(dir, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Not a directory", dir.string())
            );
        }

        std::vector<fs::path> result;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (std::error_code type_ec; it->is_directory(type_ec)) {
                result.push_back(it->path());
            }
        }

        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to list directory", dir.string())
            );
        }

        std::ranges::sort(result);
        return Result<std::vector<fs::path>, Error>::success(std::move(result));
    }

    /**
     * Recursively copies the contents of source into destination.
     *
     * Destination is created if missing; existing files are overwritten.
     */
    inline Result<void, Error> copy_directory_contents(const fs::path& source, const fs::path& destination) {
        if (auto created = ensure_directory(destination); created.is_err()) {
            return created;
        }

        std::error_code ec;
        fs::copy(source, destination,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing,
                 ec);
        if (ec) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to copy directory: " + ec.message(),
                                source.string() + " -> " + destination.string())
            );
        }
        return Result<void, Error>::success();
    }

}  // namespace sbt::file_utils

#endif //SCANBUILDTRACKER_FILE_UTILS_HPP
