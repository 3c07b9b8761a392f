//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_STRING_UTILS_HPP
#define SCANBUILDTRACKER_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used by the report parser and the CLI.
 */

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>
#include <optional>
#include <charconv>

namespace sbt::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Parses a base-10 integer occupying the whole string.
     *
     * @return The value, or nullopt for empty input, junk, or overflow.
     */
    template<typename Int>
    std::optional<Int> parse_int(std::string_view s) noexcept {
        s = trim(s);
        if (s.empty()) {
            return std::nullopt;
        }
        Int value{};
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * Shortens a string to max_len characters, ending in "...".
     */
    inline std::string truncate(const std::string_view s, const std::size_t max_len) {
        if (s.size() <= max_len) {
            return std::string(s);
        }
        if (max_len <= 3) {
            return std::string(s.substr(0, max_len));
        }
        return std::string(s.substr(0, max_len - 3)) + "...";
    }

}  // namespace sbt::string_utils

#endif //SCANBUILDTRACKER_STRING_UTILS_HPP
