//
// Created by gregorian-rayne on 2/10/26.
//

#include "sbt/reports/marker_extractor.hpp"
#include "sbt/utils/string_utils.hpp"

#include <array>
#include <regex>

namespace sbt::reports
{
    namespace {

    constexpr std::size_t marker_index(const Marker marker) noexcept {
        return static_cast<std::size_t>(marker);
    }

    std::regex build_pattern(const std::string_view keyword) {
        return std::regex("<!--\\s" + std::string(keyword) + "\\s(.*)\\s-->");
    }

    /**
     * Compiled marker patterns, indexed by Marker.
     */
    const std::array<std::regex, 4>& marker_patterns() {
        static const std::array<std::regex, 4> patterns = {
            build_pattern(marker_keyword(Marker::BugType)),
            build_pattern(marker_keyword(Marker::BugDescription)),
            build_pattern(marker_keyword(Marker::BugFile)),
            build_pattern(marker_keyword(Marker::BugCategory)),
        };
        return patterns;
    }

    }  // namespace

    std::string_view marker_keyword(const Marker marker) noexcept {
        switch (marker) {
            case Marker::BugType:        return "BUGTYPE";
            case Marker::BugDescription: return "BUGDESC";
            case Marker::BugFile:        return "BUGFILE";
            case Marker::BugCategory:    return "BUGCATEGORY";
        }
        return "";
    }

    std::optional<std::string> extract_marker(const std::string_view content, const Marker marker) {
        if (content.empty()) {
            return std::nullopt;
        }

        const auto& pattern = marker_patterns()[marker_index(marker)];

        std::cmatch match;
        if (!std::regex_search(content.data(), content.data() + content.size(), match, pattern)) {
            return std::nullopt;
        }

        const std::string_view captured(match[1].first, static_cast<std::size_t>(match[1].length()));
        return std::string(string_utils::trim(captured));
    }

}  // namespace sbt::reports
