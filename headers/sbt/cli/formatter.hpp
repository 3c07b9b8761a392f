//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef SBT_FORMATTER_HPP
#define SBT_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Terminal output helpers for the CLI: colors, aligned tables and
 *        the defect and verdict renderers shared by the commands.
 */

#include "sbt/types.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sbt::cli
{
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* GREEN;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * True when colors are enabled and stdout is a terminal.
         */
        bool enabled();

        void set_enabled(bool enable);

    }  // namespace colors

    /**
     * True if stdout is attached to a terminal.
     */
    bool is_tty();

    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

        void set_show_headers(const bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
        bool show_headers_ = true;
    };

    /**
     * Wraps text in a color when colors are enabled.
     */
    [[nodiscard]] std::string colorize(std::string_view text, const char* color);

    /**
     * Value of an optional marker field, or "-" if the marker was missing.
     */
    [[nodiscard]] std::string display_field(const std::optional<std::string>& value);

    /**
     * "yes", "no", or "-" when newness was never determined.
     */
    [[nodiscard]] std::string display_new(const std::optional<bool>& is_new);

    /**
     * One row per defect: category, type, file, description, new.
     */
    [[nodiscard]] Table make_defect_table(const std::vector<Defect>& defects);

    /**
     * One-line threshold verdict, e.g. "12 defects, threshold 10: EXCEEDED".
     */
    [[nodiscard]] std::string format_verdict(const ThresholdVerdict& verdict);

}  // namespace sbt::cli

#endif //SBT_FORMATTER_HPP
