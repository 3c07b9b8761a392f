//
// Created by gregorian-rayne on 2/12/26.
//

#include "sbt/history/run_history.hpp"
#include "sbt/history/summary_store.hpp"
#include "sbt/utils/file_utils.hpp"
#include "sbt/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iterator>

namespace sbt::history
{
    // ============================================================================
    // RunRecord
    // ============================================================================

    Result<RunSummary, Error> RunRecord::load_summary() const {
        if (summary_file.empty()) {
            return Result<RunSummary, Error>::failure(
                Error::not_found("Run record has no summary file", std::to_string(run))
            );
        }
        return history::load_summary(summary_path());
    }

    std::string serialize_run_record(const RunRecord& record) {
        nlohmann::json j;
        j["run"] = record.run;
        j["defect_count"] = record.defect_count;
        j["new_defect_count"] = record.new_defect_count;
        j["threshold"] = record.threshold;
        j["threshold_enabled"] = record.threshold_enabled;
        j["threshold_exceeded"] = record.threshold_exceeded;
        j["scan_build_output_folder"] = record.scan_build_output_folder;
        j["summary_file"] = record.summary_file.generic_string();
        return j.dump(2);
    }

    Result<RunRecord, Error> deserialize_run_record(const std::string_view text) {
        try {
            const auto j = nlohmann::json::parse(text);

            RunRecord record;
            record.run = j.at("run").get<RunId>();
            record.defect_count = j.at("defect_count").get<std::size_t>();
            record.new_defect_count = j.value("new_defect_count", std::size_t{0});
            record.threshold = j.value("threshold", std::int64_t{0});
            record.threshold_enabled = j.value("threshold_enabled", false);
            record.threshold_exceeded = j.value("threshold_exceeded", false);
            record.scan_build_output_folder = j.value("scan_build_output_folder", "");
            record.summary_file = fs::path(j.value("summary_file", ""));

            return Result<RunRecord, Error>::success(std::move(record));
        } catch (const nlohmann::json::exception& e) {
            return Result<RunRecord, Error>::failure(
                Error::parse_error(std::string("Failed to parse run record: ") + e.what())
            );
        }
    }

    // ============================================================================
    // DirectoryRunHistory
    // ============================================================================

    DirectoryRunHistory::DirectoryRunHistory(fs::path root)
        : root_(std::move(root))
    {}

    std::vector<RunId> DirectoryRunHistory::list_runs() const {
        std::vector<RunId> runs;

        auto dirs = file_utils::list_subdirectories(root_);
        if (dirs.is_err()) {
            return runs;
        }

        for (const auto& dir : dirs.value()) {
            if (const auto id = string_utils::parse_int<RunId>(dir.filename().string()); id && *id > 0) {
                runs.push_back(*id);
            }
        }

        std::ranges::sort(runs);
        return runs;
    }

    std::optional<RunId> DirectoryRunHistory::latest_run() const {
        const auto runs = list_runs();
        if (runs.empty()) {
            return std::nullopt;
        }
        return runs.back();
    }

    std::optional<RunId> DirectoryRunHistory::latest_recorded_run() const {
        const auto runs = list_runs();
        for (auto it = runs.rbegin(); it != runs.rend(); ++it) {
            if (has_record(*it)) {
                return *it;
            }
        }
        return std::nullopt;
    }

    bool DirectoryRunHistory::has_record(const RunId run) const {
        std::error_code ec;
        return fs::is_regular_file(run_directory(run) / RUN_RECORD_FILE_NAME, ec);
    }

    RunId DirectoryRunHistory::next_run_id() const {
        return latest_run().value_or(0) + 1;
    }

    fs::path DirectoryRunHistory::run_directory(const RunId run) const {
        return root_ / std::to_string(run);
    }

    Result<RunRecord, Error> DirectoryRunHistory::load_record(const RunId run) const {
        const auto dir = run_directory(run);
        auto content = file_utils::read_file(dir / RUN_RECORD_FILE_NAME);
        if (content.is_err()) {
            return Result<RunRecord, Error>::failure(content.error());
        }

        auto record = deserialize_run_record(content.value());
        if (record.is_err()) {
            return Result<RunRecord, Error>::failure(record.error().with_context(dir.string()));
        }

        auto loaded = std::move(record).value();
        loaded.run_directory = dir;
        return Result<RunRecord, Error>::success(std::move(loaded));
    }

    Result<void, Error> DirectoryRunHistory::write_record(const RunRecord& record) const {
        return file_utils::write_file(run_directory(record.run) / RUN_RECORD_FILE_NAME,
                                      serialize_run_record(record));
    }

    std::optional<RunRecord> DirectoryRunHistory::previous_run(const RunId current) const {
        const auto runs = list_runs();

        const auto it = std::ranges::lower_bound(runs, current);
        if (it == runs.begin()) {
            return std::nullopt;
        }

        auto record = load_record(*std::prev(it));
        if (record.is_err()) {
            return std::nullopt;
        }
        return std::move(record).value();
    }

    // ============================================================================
    // Previous summary lookup
    // ============================================================================

    std::optional<RunSummary> load_previous_summary(const IRunHistory& history,
                                                    const RunId current,
                                                    Diagnostics& diagnostics) {
        const auto previous = history.previous_run(current);
        if (!previous) {
            diagnostics.info("No previous scan-build result; new defects will not be flagged");
            return std::nullopt;
        }

        auto summary = previous->load_summary();
        if (summary.is_err()) {
            diagnostics.warning("Ignoring summary of run " + std::to_string(previous->run) + ": " +
                                summary.error().to_string());
            return std::nullopt;
        }

        return std::move(summary).value();
    }

}  // namespace sbt::history
