//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/commands/command.hpp"
#include "sbt/version.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_help() {
        std::cout << sbt::PROJECT_NAME << " - tracks Clang scan-build defects across runs\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << sbt::PROJECT_SHORT_NAME << " <COMMAND> [OPTIONS]\n\n";
        std::cout << "COMMANDS:\n";
        for (const auto* cmd : sbt::cli::CommandRegistry::instance().list()) {
            std::cout << "    " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "    " << std::left << std::setw(12) << "help" << "Show this help message\n";
        std::cout << "    " << std::left << std::setw(12) << "version" << "Show version information\n";
        std::cout << "\nRun '" << sbt::PROJECT_SHORT_NAME << " <COMMAND> --help' for command options.\n";
    }

    void print_version() {
        std::cout << sbt::PROJECT_SHORT_NAME << " " << sbt::VERSION_STRING << "\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        const std::string command_name = argv[1];
        if (command_name == "help" || command_name == "--help" || command_name == "-h") {
            print_help();
            return 0;
        }
        if (command_name == "version" || command_name == "--version") {
            print_version();
            return 0;
        }

        auto* command = sbt::cli::CommandRegistry::instance().find(command_name);
        if (!command) {
            std::cerr << "error: Unknown command: " << command_name << "\n";
            std::cerr << "Run '" << sbt::PROJECT_SHORT_NAME << " help' for a list of commands.\n";
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        const auto parsed = sbt::cli::parse_arguments(args, command->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            std::cerr << command->usage() << "\n";
            return 1;
        }

        if (parsed.args.get_flag("help")) {
            command->print_help();
            return 0;
        }

        if (const auto problem = command->validate(parsed.args); !problem.empty()) {
            std::cerr << "error: " << problem << "\n";
            std::cerr << command->usage() << "\n";
            return 1;
        }

        return command->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
