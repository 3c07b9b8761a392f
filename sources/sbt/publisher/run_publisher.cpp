//
// Created by gregorian-rayne on 2/14/26.
//

#include "sbt/publisher/run_publisher.hpp"
#include "sbt/archive/report_archiver.hpp"
#include "sbt/reports/report_locator.hpp"
#include "sbt/reports/defect_builder.hpp"
#include "sbt/history/summary_store.hpp"
#include "sbt/threshold/threshold_evaluator.hpp"

namespace sbt::publisher
{
    namespace {

        /**
         * Workspace path as a plain string without a trailing separator, the
         * form the scanner prints in BUGFILE.
         */
        std::string workspace_prefix(const fs::path& workspace) {
            std::string prefix = workspace.string();
            while (prefix.size() > 1 && (prefix.back() == '/' || prefix.back() == '\\')) {
                prefix.pop_back();
            }
            return prefix;
        }

        /**
         * Absolute, lexically normal workspace. BUGFILE paths are absolute,
         * so a relative root would match anywhere inside them.
         */
        Result<fs::path, Error> absolute_workspace(const fs::path& workspace) {
            std::error_code ec;
            auto absolute = fs::absolute(workspace, ec);
            if (ec) {
                return Result<fs::path, Error>::failure(
                    Error::io_error("Unable to resolve workspace: " + ec.message(), workspace.string())
                );
            }
            return Result<fs::path, Error>::success(absolute.lexically_normal());
        }

    }  // namespace

    RunPublisher::RunPublisher(PublisherConfig config,
                               const history::IRunHistory& history,
                               const history::IDefectMatcher& matcher)
        : config_(std::move(config))
        , history_(history)
        , matcher_(matcher)
    {}

    fs::path RunPublisher::workspace_output_folder(const RunContext& context) const {
        return context.workspace / config_.scan_build_output_folder;
    }

    fs::path RunPublisher::archive_output_folder(const RunContext& context) const {
        return context.run_directory / config_.scan_build_output_folder;
    }

    void RunPublisher::collect_defects(const RunContext& context, PublishOutcome& outcome) const {
        const auto report_folder = archive_output_folder(context);

        auto reports = reports::locate_reports(report_folder);
        if (reports.is_err()) {
            outcome.diagnostics.warning("No scan-build reports to process: " + reports.error().message(),
                                        report_folder.string());
            return;
        }

        const auto workspace_root = workspace_prefix(context.workspace);
        for (const auto& report : reports.value()) {
            outcome.summary.add(reports::build_defect_from_file(report, workspace_root, outcome.diagnostics));
        }

        outcome.diagnostics.info("Processed " + std::to_string(reports.value().size()) + " scan-build report(s)",
                                 report_folder.string());
    }

    Result<PublishOutcome, Error> RunPublisher::publish(const RunContext& context) const {
        if (context.run <= 0) {
            return Result<PublishOutcome, Error>::failure(
                Error::invalid_argument("Run number must be positive", std::to_string(context.run))
            );
        }
        if (context.workspace.empty() || context.run_directory.empty()) {
            return Result<PublishOutcome, Error>::failure(
                Error::invalid_argument("Workspace and run directory are required")
            );
        }

        std::error_code ec;
        if (fs::exists(context.run_directory / history::RUN_RECORD_FILE_NAME, ec) ||
            fs::exists(archive_output_folder(context), ec)) {
            return Result<PublishOutcome, Error>::failure(
                Error::invalid_argument("Run " + std::to_string(context.run) + " has already been published",
                                        context.run_directory.string())
            );
        }

        auto workspace = absolute_workspace(context.workspace);
        if (workspace.is_err()) {
            return Result<PublishOutcome, Error>::failure(workspace.error());
        }
        RunContext resolved = context;
        resolved.workspace = std::move(workspace).value();

        PublishOutcome outcome;
        outcome.summary = RunSummary(context.run);

        archive::archive_scan_build_output(workspace_output_folder(resolved),
                                           archive_output_folder(resolved),
                                           outcome.diagnostics);

        collect_defects(resolved, outcome);

        const auto previous = history::load_previous_summary(history_, context.run, outcome.diagnostics);
        outcome.had_previous_summary = previous.has_value();
        if (previous) {
            const auto marked = history::mark_new_defects(outcome.summary.defects, previous, matcher_);
            outcome.diagnostics.info(std::to_string(marked) + " new defect(s) compared with run " +
                                     std::to_string(previous->run) + " (" + std::string(matcher_.name()) + ")");
        }

        auto saved = history::save_summary(archive_output_folder(context), outcome.summary);
        if (saved.is_err()) {
            return Result<PublishOutcome, Error>::failure(saved.error());
        }
        outcome.summary_file = std::move(saved).value();

        outcome.verdict = threshold::evaluate(outcome.summary.defect_count(),
                                              config_.mark_build_unstable_when_threshold_is_exceeded,
                                              config_.bug_threshold);

        return Result<PublishOutcome, Error>::success(std::move(outcome));
    }

    history::RunRecord RunPublisher::make_record(const RunContext& context, const PublishOutcome& outcome) const {
        history::RunRecord record;
        record.run = context.run;
        record.defect_count = outcome.summary.defect_count();
        record.new_defect_count = outcome.summary.new_defect_count();
        record.threshold = outcome.verdict.threshold;
        record.threshold_enabled = outcome.verdict.enabled;
        record.threshold_exceeded = outcome.verdict.exceeded;
        record.scan_build_output_folder = config_.scan_build_output_folder;
        record.run_directory = context.run_directory;

        std::error_code ec;
        auto relative = fs::relative(outcome.summary_file, context.run_directory, ec);
        record.summary_file = ec || relative.empty()
            ? fs::path(config_.scan_build_output_folder) / history::SUMMARY_FILE_NAME
            : relative;

        return record;
    }

}  // namespace sbt::publisher
