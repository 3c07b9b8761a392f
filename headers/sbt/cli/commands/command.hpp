//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef SBT_COMMAND_HPP
#define SBT_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Base class and registry for sbt subcommands.
 *
 * Each subcommand lives in its own translation unit and registers itself
 * with the CommandRegistry from a static registrar object.
 */

#include "sbt/diagnostics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sbt::cli
{
    /**
     * Command-line argument definition.
     */
    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;

        /**
         * Integer value of an option. Returns nullopt when the option is
         * absent or its value is not entirely a base-10 integer.
         */
        [[nodiscard]] std::optional<std::int64_t> get_int(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // errors only
        Normal,
        Verbose     // info diagnostics too
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;
        [[nodiscard]] virtual std::string usage() const;
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Executes the command.
         *
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message if invalid, empty if valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        /**
         * Applies --verbose, --quiet and --json.
         */
        void apply_common_options(const ParsedArgs& args);

        void set_verbosity(const Verbosity v) { verbosity_ = v; }
        void set_output_format(const OutputFormat f) { output_format_ = f; }

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        /**
         * Renders library diagnostics: errors always, warnings unless quiet,
         * info only when verbose.
         */
        void report(const Diagnostics& diagnostics) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the command name.
     *
     * Accepts --name value, --name=value, bundled short flags and a "--"
     * terminator. --help, --verbose, --quiet and --json are always known.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

}  // namespace sbt::cli

#endif //SBT_COMMAND_HPP
