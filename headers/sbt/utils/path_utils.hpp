//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_PATH_UTILS_HPP
#define SCANBUILDTRACKER_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path helpers.
 */

#include <filesystem>
#include <string>
#include <string_view>

namespace sbt::path_utils {

    namespace fs = std::filesystem;

    /**
     * Shortens a scanner-reported source path to a workspace-relative one.
     *
     * Finds the last occurrence of workspace_root inside source_path and
     * returns whatever follows it, so "/ws/src/foo.c" with root "/ws"
     * becomes "/src/foo.c". This is a plain substring search: when the root
     * does not occur (different casing, a symlinked checkout, an empty
     * root) the path is returned unchanged.
     */
    inline std::string strip_workspace_prefix(const std::string_view source_path,
                                              const std::string_view workspace_root) {
        if (workspace_root.empty()) {
            return std::string(source_path);
        }
        const auto position = source_path.rfind(workspace_root);
        if (position == std::string_view::npos) {
            return std::string(source_path);
        }
        return std::string(source_path.substr(position + workspace_root.size()));
    }

    /**
     * Returns true if the path has no root and no ".." component, i.e. it
     * stays below whatever directory it is joined to.
     */
    inline bool is_contained_relative(const fs::path& path) {
        if (path.empty() || path.has_root_path()) {
            return false;
        }
        for (const auto& component : path) {
            if (component == "..") {
                return false;
            }
        }
        return true;
    }

}  // namespace sbt::path_utils

#endif //SCANBUILDTRACKER_PATH_UTILS_HPP
