//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/commands/command.hpp"
#include "sbt/utils/string_utils.hpp"
#include "sbt/version.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace sbt::cli
{
    // ============================================================================
    // ParsedArgs
    // ============================================================================

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        args_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return args_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        if (const auto it = args_.find(name); it != args_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<std::int64_t> ParsedArgs::get_int(const std::string& name) const {
        const auto val = get(name);
        if (!val) return std::nullopt;
        return string_utils::parse_int<std::int64_t>(*val);
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ============================================================================
    // Command
    // ============================================================================

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_SHORT_NAME << " " << name();

        for (const auto args = arguments(); const auto& arg : args) {
            if (arg.required) {
                ss << " --" << arg.name << " <" << arg.value_name << ">";
            }
        }

        ss << " [OPTIONS]";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n";
        std::cout << usage() << "\n\n";

        if (const auto args = arguments(); !args.empty()) {
            std::cout << "Options:\n";
            for (const auto& arg : args) {
                std::cout << "  ";
                if (arg.short_name) {
                    std::cout << "-" << arg.short_name << ", ";
                } else {
                    std::cout << "    ";
                }
                std::string label = arg.name;
                if (arg.takes_value) {
                    label += " <" + arg.value_name + ">";
                }
                std::cout << "--" << std::left << std::setw(24) << label;
                std::cout << arg.description;
                if (!arg.default_value.empty()) {
                    std::cout << " (default: " << arg.default_value << ")";
                }
                if (arg.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
        }

        std::cout << "\n";
        std::cout << "Common options:\n";
        std::cout << "  -h, --help                    Show this help message\n";
        std::cout << "  -v, --verbose                 Also show informational messages\n";
        std::cout << "  -q, --quiet                   Only show errors\n";
        std::cout << "      --json                    Output in JSON format\n";
    }

    void Command::apply_common_options(const ParsedArgs& args) {
        if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        }

        if (args.get_flag("json")) {
            set_output_format(OutputFormat::JSON);
        }
    }

    void Command::print(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (verbosity_ != Verbosity::Quiet) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cout << msg << "\n";
        }
    }

    void Command::report(const Diagnostics& diagnostics) const {
        for (const auto& entry : diagnostics.entries()) {
            std::string text = entry.message;
            if (entry.context) {
                text += " (" + *entry.context + ")";
            }

            switch (entry.severity) {
                case Severity::Error:
                    print_error(text);
                    break;
                case Severity::Warning:
                    print_warning(text);
                    break;
                case Severity::Info:
                    print_verbose(text);
                    break;
            }
        }
    }

    // ============================================================================
    // CommandRegistry
    // ============================================================================

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry instance;
        return instance;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    // ============================================================================
    // Argument Parser
    // ============================================================================

    namespace {

        bool is_common_flag(const std::string& name) {
            return name == "help" || name == "verbose" || name == "quiet" || name == "json";
        }

    }  // namespace

    ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    ) {
        ParseResult result;

        std::unordered_map<std::string, const ArgDef*> long_map;
        std::unordered_map<char, const ArgDef*> short_map;

        for (const auto& def : defs) {
            long_map[def.name] = &def;
            if (def.short_name) {
                short_map[def.short_name] = &def;
            }
            if (!def.default_value.empty()) {
                result.args.set(def.name, def.default_value);
            }
        }

        auto fail = [&result](std::string message) {
            result.error = std::move(message);
            result.success = false;
            return result;
        };

        bool options_ended = false;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg.empty()) continue;

            if (arg == "--" && !options_ended) {
                options_ended = true;
                continue;
            }

            if (options_ended || arg[0] != '-' || arg.size() == 1) {
                result.args.add_positional(arg);
                continue;
            }

            if (arg[1] == '-') {
                std::string name = arg.substr(2);
                std::optional<std::string> value;

                if (const auto eq_pos = name.find('='); eq_pos != std::string::npos) {
                    value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }

                const auto it = long_map.find(name);
                if (it == long_map.end()) {
                    if (is_common_flag(name) && !value) {
                        result.args.set_flag(name);
                        continue;
                    }
                    return fail("Unknown option: --" + name);
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    if (value) {
                        return fail("Option --" + name + " does not take a value");
                    }
                    result.args.set_flag(name);
                    continue;
                }

                if (!value && i + 1 < args.size()) {
                    value = args[++i];
                }
                if (!value || value->empty()) {
                    return fail("Option --" + name + " requires a value");
                }
                result.args.set(name, *value);
                continue;
            }

            for (std::size_t j = 1; j < arg.size(); ++j) {
                const char c = arg[j];

                if (c == 'h') {
                    result.args.set_flag("help");
                    continue;
                }
                if (c == 'v') {
                    result.args.set_flag("verbose");
                    continue;
                }
                if (c == 'q') {
                    result.args.set_flag("quiet");
                    continue;
                }

                const auto it = short_map.find(c);
                if (it == short_map.end()) {
                    return fail(std::string("Unknown option: -") + c);
                }

                const ArgDef* def = it->second;
                if (!def->takes_value) {
                    result.args.set_flag(def->name);
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                }
                if (value.empty()) {
                    return fail(std::string("Option -") + c + " requires a value");
                }
                result.args.set(def->name, value);
                break;
            }
        }

        return result;
    }

}  // namespace sbt::cli
