//
// Created by gregorian-rayne on 2/15/26.
//

#include "sbt/cli/commands/command.hpp"
#include "sbt/cli/formatter.hpp"

#include "sbt/sbt.hpp"
#include "sbt/config.hpp"
#include "sbt/history/defect_matcher.hpp"
#include "sbt/history/run_history.hpp"
#include "sbt/publisher/run_publisher.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sbt::cli
{
    namespace {
        constexpr int EXIT_UNSTABLE = 2;
    }

    /**
     * Publish command - archives a scan-build run, flags new defects and
     * applies the bug threshold.
     */
    class PublishCommand final : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "publish";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Archive scan-build reports of a run and compare them with the previous run";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: sbt publish --workspace <DIR> [OPTIONS]\n"
                   "\n"
                   "Copies the scan-build output folder from the workspace into a new run\n"
                   "directory, extracts one defect per report-*.html, marks defects that\n"
                   "did not exist in the previous run and writes bugSummary.json.\n"
                   "\n"
                   "Exit codes:\n"
                   "  0  published, threshold not exceeded\n"
                   "  2  published, threshold exceeded (run is unstable)\n"
                   "  1  error\n"
                   "\n"
                   "Examples:\n"
                   "  sbt publish --workspace .\n"
                   "  sbt publish --workspace /ci/ws --history /ci/runs --threshold 10 --mark-unstable";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"workspace", 'w', "Directory scan-build ran in", true, true, "", "DIR"},
                {"history", 0, "Run history directory", false, true, ".sbt/runs", "DIR"},
                {"run", 'r', "Run number (default: next free number)", false, true, "", "N"},
                {"config", 'c', "Configuration file", false, true, "", "FILE"},
                {"output-folder", 'o', "scan-build output folder inside the workspace", false, true, "", "NAME"},
                {"threshold", 't', "Largest defect count that still passes", false, true, "", "N"},
                {"mark-unstable", 0, "Fail when the threshold is exceeded", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.get_flag("help")) {
                return "";
            }
            if (auto base = Command::validate(args); !base.empty()) {
                return base;
            }
            if (args.has("run")) {
                const auto run = args.get_int("run");
                if (!run || *run <= 0) {
                    return "--run must be a positive integer";
                }
            }
            if (args.has("threshold") && !args.get_int("threshold")) {
                return "--threshold must be an integer";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_options(args);

            auto config = resolve_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            const fs::path workspace = args.get_or("workspace", ".");
            std::error_code ec;
            if (!fs::is_directory(workspace, ec)) {
                print_error("Workspace is not a directory: " + workspace.string());
                return 1;
            }

            const history::DirectoryRunHistory run_history(args.get_or("history", ".sbt/runs"));
            const RunId run = args.get_int("run").value_or(run_history.next_run_id());

            const publisher::RunContext context{run, workspace, run_history.run_directory(run)};
            print_verbose("Publishing run " + std::to_string(run) + " into " + context.run_directory.string());

            const history::ExactFieldMatcher matcher;
            const publisher::RunPublisher run_publisher(config.value(), run_history, matcher);

            auto outcome = run_publisher.publish(context);
            if (outcome.is_err()) {
                print_error("Publish failed: " + outcome.error().to_string());
                return 1;
            }

            const auto& published = outcome.value();
            report(published.diagnostics);

            const auto record = run_publisher.make_record(context, published);
            if (auto written = run_history.write_record(record); written.is_err()) {
                print_error("Failed to write run record: " + written.error().to_string());
                return 1;
            }

            if (is_json()) {
                print_json(record, published);
            } else {
                print_text(record, published);
            }

            return published.verdict.exceeded ? EXIT_UNSTABLE : 0;
        }

    private:
        static Result<PublisherConfig, Error> resolve_config(const ParsedArgs& args) {
            PublisherConfig config;

            if (const auto path = args.get("config"); path && !path->empty()) {
                auto loaded = PublisherConfig::load_from_file(*path);
                if (loaded.is_err()) {
                    return loaded;
                }
                config = std::move(loaded).value();
            } else {
                std::error_code ec;
                if (const fs::path default_path{DEFAULT_CONFIG_FILE}; fs::exists(default_path, ec)) {
                    auto loaded = PublisherConfig::load_from_file(default_path);
                    if (loaded.is_err()) {
                        return loaded;
                    }
                    config = std::move(loaded).value();
                }
            }

            if (const auto folder = args.get("output-folder")) {
                config.scan_build_output_folder = *folder;
            }
            if (const auto threshold = args.get_int("threshold")) {
                config.bug_threshold = *threshold;
            }
            if (args.get_flag("mark-unstable")) {
                config.mark_build_unstable_when_threshold_is_exceeded = true;
            }

            if (auto valid = config.validate(); valid.is_err()) {
                return Result<PublisherConfig, Error>::failure(valid.error());
            }
            return Result<PublisherConfig, Error>::success(std::move(config));
        }

        void print_text(const history::RunRecord& record, const publisher::PublishOutcome& outcome) const {
            if (is_quiet()) {
                return;
            }

            std::cout << colorize("Run " + std::to_string(record.run), colors::BOLD) << "\n";
            std::cout << "  Summary:      " << outcome.summary_file.string() << "\n";
            std::cout << "  Defects:      " << record.defect_count << "\n";
            if (outcome.had_previous_summary) {
                std::cout << "  New defects:  " << record.new_defect_count << "\n";
            } else {
                std::cout << "  New defects:  - (no previous run)\n";
            }
            std::cout << "  Verdict:      " << format_verdict(outcome.verdict) << "\n";

            if (is_verbose() && !outcome.summary.defects.empty()) {
                std::cout << "\n";
                make_defect_table(outcome.summary.defects).render(std::cout);
            }
        }

        static void print_json(const history::RunRecord& record, const publisher::PublishOutcome& outcome) {
            nlohmann::json j;
            j["run"] = record.run;
            j["summary_file"] = outcome.summary_file.generic_string();
            j["defect_count"] = record.defect_count;
            j["new_defect_count"] = record.new_defect_count;
            j["had_previous_summary"] = outcome.had_previous_summary;
            j["threshold"] = {
                {"enabled", outcome.verdict.enabled},
                {"value", outcome.verdict.threshold},
                {"exceeded", outcome.verdict.exceeded},
            };

            auto diagnostics = nlohmann::json::array();
            for (const auto& entry : outcome.diagnostics.entries()) {
                nlohmann::json d;
                d["severity"] = severity_to_string(entry.severity);
                d["message"] = entry.message;
                if (entry.context) {
                    d["context"] = *entry.context;
                }
                diagnostics.push_back(std::move(d));
            }
            j["diagnostics"] = std::move(diagnostics);

            std::cout << j.dump(2) << "\n";
        }
    };

    namespace {
        struct PublishCommandRegistrar {
            PublishCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<PublishCommand>()
                );
            }
        } publish_registrar;
    }

}  // namespace sbt::cli
