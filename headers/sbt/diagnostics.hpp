//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef SCANBUILDTRACKER_DIAGNOSTICS_HPP
#define SCANBUILDTRACKER_DIAGNOSTICS_HPP

/**
 * @file diagnostics.hpp
 * @brief Recoverable problems collected while publishing a run.
 *
 * The library never writes to the terminal. Anything worth telling the
 * user that does not stop the run (a missing scanner folder, an unreadable
 * report, a corrupt previous summary) is appended here and rendered by the
 * CLI according to its verbosity.
 */

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>

namespace sbt {

    enum class Severity {
        Info,
        Warning,
        Error
    };

    inline const char* severity_to_string(Severity severity) noexcept {
        switch (severity) {
            case Severity::Info:    return "info";
            case Severity::Warning: return "warning";
            case Severity::Error:   return "error";
        }
        return "unknown";
    }

    struct Diagnostic {
        Severity severity = Severity::Info;
        std::string message;
        std::optional<std::string> context;

        [[nodiscard]] std::string to_string() const;
    };

    /**
     * Append-only list of diagnostics.
     */
    class Diagnostics {
    public:
        void info(std::string message);
        void info(std::string message, std::string context);
        void warning(std::string message);
        void warning(std::string message, std::string context);
        void error(std::string message);
        void error(std::string message, std::string context);

        void add(Diagnostic diagnostic);

        [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] std::size_t count(Severity severity) const noexcept;
        [[nodiscard]] bool contains(std::string_view text) const;

    private:
        std::vector<Diagnostic> entries_;
    };

}  // namespace sbt

#endif //SCANBUILDTRACKER_DIAGNOSTICS_HPP
