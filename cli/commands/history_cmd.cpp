//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/commands/command.hpp"
#include "sbt/cli/formatter.hpp"

#include "sbt/sbt.hpp"
#include "sbt/history/run_history.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sbt::cli
{
    /**
     * History command - lists recorded runs with their defect counts.
     */
    class HistoryCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "history";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "List recorded runs with defect counts and threshold verdicts";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"history", 0, "Run history directory", false, true, ".sbt/runs", "DIR"},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_options(args);

            const history::DirectoryRunHistory run_history(args.get_or("history", ".sbt/runs"));

            std::vector<history::RunRecord> records;
            for (const RunId run : run_history.list_runs()) {
                auto record = run_history.load_record(run);
                if (record.is_err()) {
                    print_warning("Skipping run " + std::to_string(run) + ": " + record.error().to_string());
                    continue;
                }
                records.push_back(std::move(record).value());
            }

            if (is_json()) {
                print_json(records);
                return 0;
            }

            if (records.empty()) {
                print("No runs recorded in " + run_history.root().string());
                return 0;
            }

            Table table({
                {"Run", 0, true},
                {"Defects", 0, true},
                {"New", 0, true},
                {"Threshold", 0, true},
                {"Result", 0, false},
            });

            for (const auto& record : records) {
                std::string result = "ok";
                if (record.threshold_exceeded) {
                    result = colorize("unstable", colors::RED);
                } else if (!record.threshold_enabled) {
                    result = colorize("unchecked", colors::DIM);
                }

                table.add_row({
                    std::to_string(record.run),
                    std::to_string(record.defect_count),
                    std::to_string(record.new_defect_count),
                    record.threshold_enabled ? std::to_string(record.threshold) : "-",
                    result,
                });
            }

            table.render(std::cout);
            return 0;
        }

    private:
        static void print_json(const std::vector<history::RunRecord>& records) {
            auto runs = nlohmann::json::array();
            for (const auto& record : records) {
                runs.push_back({
                    {"run", record.run},
                    {"defect_count", record.defect_count},
                    {"new_defect_count", record.new_defect_count},
                    {"threshold", record.threshold},
                    {"threshold_enabled", record.threshold_enabled},
                    {"threshold_exceeded", record.threshold_exceeded},
                    {"summary_file", record.summary_path().generic_string()},
                });
            }
            std::cout << nlohmann::json{{"runs", runs}}.dump(2) << "\n";
        }
    };

    namespace {
        struct HistoryCommandRegistrar {
            HistoryCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<HistoryCommand>()
                );
            }
        } history_registrar;
    }

}  // namespace sbt::cli
