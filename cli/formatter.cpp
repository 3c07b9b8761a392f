//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/formatter.hpp"
#include "sbt/utils/string_utils.hpp"

#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <cstdio>

namespace sbt::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* GREEN = "\033[32m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

    }  // namespace colors

    bool is_tty() {
        return isatty(fileno(stdout)) != 0;
    }

    // ============================================================================
    // Table
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back("");
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                if (i < row.size() && row[i].length() > max_width) {
                    max_width = row[i].length();
                }
            }
            columns_[i].width = max_width;
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                const std::string cell = string_utils::truncate(i < row.size() ? row[i] : "", col.width);

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                const bool last = i + 1 == temp.columns_.size();
                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else if (last) {
                    out << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (!last) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i + 1 < temp.columns_.size()) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i], false);
            if (i < temp.separators_.size() && temp.separators_[i]) {
                render_separator();
            }
        }
    }

    // ============================================================================
    // Renderers
    // ============================================================================

    std::string colorize(const std::string_view text, const char* color) {
        if (!colors::enabled()) {
            return std::string(text);
        }
        return std::string(color) + std::string(text) + colors::RESET;
    }

    std::string display_field(const std::optional<std::string>& value) {
        if (!value || value->empty()) {
            return "-";
        }
        return *value;
    }

    std::string display_new(const std::optional<bool>& is_new) {
        if (!is_new) {
            return "-";
        }
        return *is_new ? "yes" : "no";
    }

    Table make_defect_table(const std::vector<Defect>& defects) {
        Table table({
            {"Category", 0, false},
            {"Type", 0, false},
            {"File", 48, false},
            {"New", 0, false},
            {"Description", 0, false},
        });

        for (const auto& defect : defects) {
            table.add_row({
                display_field(defect.bug_category),
                display_field(defect.bug_type),
                display_field(defect.source_file),
                display_new(defect.is_new),
                display_field(defect.bug_description),
            });
        }

        return table;
    }

    std::string format_verdict(const ThresholdVerdict& verdict) {
        std::ostringstream ss;
        ss << verdict.defect_count << (verdict.defect_count == 1 ? " defect" : " defects");

        if (!verdict.enabled) {
            ss << ", threshold check disabled";
            return ss.str();
        }

        ss << ", threshold " << verdict.threshold << ": ";
        if (verdict.exceeded) {
            ss << colorize("EXCEEDED", colors::RED);
        } else {
            ss << colorize("ok", colors::GREEN);
        }
        return ss.str();
    }

}  // namespace sbt::cli
