//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/commands/command.hpp"
#include "sbt/cli/formatter.hpp"

#include "sbt/sbt.hpp"
#include "sbt/history/run_history.hpp"
#include "sbt/history/summary_store.hpp"
#include "sbt/utils/string_utils.hpp"

#include <iostream>

namespace sbt::cli
{
    /**
     * Show command - prints the defects recorded for one run.
     */
    class ShowCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "show";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the defects recorded for a run";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sbt show [RUN] [OPTIONS]\n"
                   "\n"
                   "Without RUN the latest recorded run is shown.\n"
                   "\n"
                   "Examples:\n"
                   "  sbt show\n"
                   "  sbt show 42 --new-only\n"
                   "  sbt show --history /ci/runs --json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"history", 0, "Run history directory", false, true, ".sbt/runs", "DIR"},
                {"new-only", 'n', "Only list defects new in this run", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() > 1) {
                return "Expected at most one run number";
            }
            if (!args.positional().empty()) {
                const auto run = string_utils::parse_int<RunId>(args.positional()[0]);
                if (!run || *run <= 0) {
                    return "Invalid run number: " + args.positional()[0];
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_options(args);

            const history::DirectoryRunHistory run_history(args.get_or("history", ".sbt/runs"));

            std::optional<RunId> run;
            if (!args.positional().empty()) {
                run = string_utils::parse_int<RunId>(args.positional()[0]);
                if (!run || *run <= 0) {
                    print_error("Invalid run number: " + args.positional()[0]);
                    return 1;
                }
            } else {
                run = run_history.latest_recorded_run();
                if (!run) {
                    print_error("No runs recorded in " + run_history.root().string());
                    return 1;
                }
            }

            auto record = run_history.load_record(*run);
            if (record.is_err()) {
                print_error("Failed to load run " + std::to_string(*run) + ": " + record.error().to_string());
                return 1;
            }

            auto summary = record.value().load_summary();
            if (summary.is_err()) {
                print_error("Failed to load summary of run " + std::to_string(*run) + ": " +
                            summary.error().to_string());
                return 1;
            }

            RunSummary shown = std::move(summary).value();
            if (args.get_flag("new-only")) {
                std::erase_if(shown.defects, [](const Defect& d) { return !d.is_marked_new(); });
            }

            if (is_json()) {
                std::cout << history::serialize_summary(shown) << "\n";
                return 0;
            }

            print_text(record.value(), shown, args.get_flag("new-only"));
            return 0;
        }

    private:
        void print_text(const history::RunRecord& record, const RunSummary& shown, const bool new_only) const {
            std::cout << colorize("Run " + std::to_string(record.run), colors::BOLD) << "\n";
            std::cout << "  Defects:      " << record.defect_count << "\n";
            std::cout << "  New defects:  " << record.new_defect_count << "\n";

            ThresholdVerdict verdict;
            verdict.defect_count = record.defect_count;
            verdict.threshold = record.threshold;
            verdict.enabled = record.threshold_enabled;
            verdict.exceeded = record.threshold_exceeded;
            std::cout << "  Verdict:      " << format_verdict(verdict) << "\n\n";

            if (shown.defects.empty()) {
                print(new_only ? "No new defects." : "No defects.");
                return;
            }

            make_defect_table(shown.defects).render(std::cout);
        }
    };

    namespace {
        struct ShowCommandRegistrar {
            ShowCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<ShowCommand>()
                );
            }
        } show_registrar;
    }

}  // namespace sbt::cli
