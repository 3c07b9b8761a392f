//
// Created by gregorian-rayne on 2/9/26.
//

#include "sbt/diagnostics.hpp"

#include <algorithm>

namespace sbt
{
    std::string Diagnostic::to_string() const {
        std::string result = severity_to_string(severity);
        result += ": ";
        result += message;
        if (context) {
            result += " (";
            result += *context;
            result += ")";
        }
        return result;
    }

    void Diagnostics::info(std::string message) {
        add({Severity::Info, std::move(message), std::nullopt});
    }

    void Diagnostics::info(std::string message, std::string context) {
        add({Severity::Info, std::move(message), std::move(context)});
    }

    void Diagnostics::warning(std::string message) {
        add({Severity::Warning, std::move(message), std::nullopt});
    }

    void Diagnostics::warning(std::string message, std::string context) {
        add({Severity::Warning, std::move(message), std::move(context)});
    }

    void Diagnostics::error(std::string message) {
        add({Severity::Error, std::move(message), std::nullopt});
    }

    void Diagnostics::error(std::string message, std::string context) {
        add({Severity::Error, std::move(message), std::move(context)});
    }

    void Diagnostics::add(Diagnostic diagnostic) {
        entries_.push_back(std::move(diagnostic));
    }

    std::size_t Diagnostics::count(const Severity severity) const noexcept {
        return static_cast<std::size_t>(std::ranges::count_if(entries_, [severity](const Diagnostic& d) {
            return d.severity == severity;
        }));
    }

    bool Diagnostics::contains(const std::string_view text) const {
        return std::ranges::any_of(entries_, [text](const Diagnostic& d) {
            return d.message.find(text) != std::string::npos;
        });
    }

}  // namespace sbt
