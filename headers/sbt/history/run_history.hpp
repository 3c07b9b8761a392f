//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef SBT_RUN_HISTORY_HPP
#define SBT_RUN_HISTORY_HPP

/**
 * @file run_history.hpp
 * @brief Access to earlier runs and their recorded results.
 *
 * A run that reached the end of publishing leaves a run record behind:
 * its defect count, the threshold settings it was judged against, the
 * verdict, and where its bugSummary.json lives. The current run never
 * holds on to its predecessor; it asks an IRunHistory for "the run before
 * mine" and gets either a record or nothing.
 *
 * Storage layout used by DirectoryRunHistory:
 * @code
 *     <history-root>/
 *       1/
 *         scanBuildResult.json          run record
 *         clangScanBuildReports/        archived scan-build output
 *           bugSummary.json
 *           report-*.html
 *       2/
 *         ...
 * @endcode
 */

#include "sbt/types.hpp"
#include "sbt/result.hpp"
#include "sbt/error.hpp"
#include "sbt/diagnostics.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sbt::history {

    namespace fs = std::filesystem;

    inline constexpr std::string_view RUN_RECORD_FILE_NAME = "scanBuildResult.json";

    /**
     * Persisted outcome of one publish.
     */
    struct RunRecord {
        RunId run = 0;
        std::size_t defect_count = 0;
        std::size_t new_defect_count = 0;
        std::int64_t threshold = 0;
        bool threshold_enabled = false;
        bool threshold_exceeded = false;
        std::string scan_build_output_folder;
        fs::path summary_file;      // relative to run_directory
        fs::path run_directory;     // filled in when loaded, not persisted

        /**
         * Loads the full defect summary this record points to.
         */
        [[nodiscard]] Result<RunSummary, Error> load_summary() const;

        [[nodiscard]] fs::path summary_path() const { return run_directory / summary_file; }
    };

    [[nodiscard]] std::string serialize_run_record(const RunRecord& record);
    [[nodiscard]] Result<RunRecord, Error> deserialize_run_record(std::string_view text);

    /**
     * Previous-run accessor.
     */
    class IRunHistory {
    public:
        virtual ~IRunHistory() = default;

        /**
         * Returns the record of the run immediately before current.
         *
         * @return nullopt if there is no earlier run, or if the earlier run
         *         left no record (it never published, or failed first).
         */
        [[nodiscard]] virtual std::optional<RunRecord> previous_run(RunId current) const = 0;
    };

    /**
     * IRunHistory over numbered run directories below a root.
     */
    class DirectoryRunHistory final : public IRunHistory {
    public:
        explicit DirectoryRunHistory(fs::path root);

        [[nodiscard]] std::optional<RunRecord> previous_run(RunId current) const override;

        /**
         * Returns all run ids that have a directory, ascending.
         */
        [[nodiscard]] std::vector<RunId> list_runs() const;

        [[nodiscard]] std::optional<RunId> latest_run() const;

        /**
         * Newest run that left a run record. Runs that died before
         * publishing are skipped.
         */
        [[nodiscard]] std::optional<RunId> latest_recorded_run() const;

        [[nodiscard]] bool has_record(RunId run) const;

        /**
         * Next run number: latest + 1, or 1 for an empty history.
         */
        [[nodiscard]] RunId next_run_id() const;

        [[nodiscard]] fs::path run_directory(RunId run) const;

        /**
         * Loads the record of a run.
         *
         * @return NotFound if the run has no record, ParseError if it is
         *         corrupt.
         */
        [[nodiscard]] Result<RunRecord, Error> load_record(RunId run) const;

        /**
         * Writes record into the directory of record.run.
         */
        [[nodiscard]] Result<void, Error> write_record(const RunRecord& record) const;

        [[nodiscard]] const fs::path& root() const noexcept { return root_; }

    private:
        fs::path root_;
    };

    /**
     * Fetches the previous run's summary for the differencer.
     *
     * Every failure (no previous run, no record, missing or corrupt summary
     * file) yields nullopt; failures other than "no previous run" are
     * also reported as warnings.
     */
    [[nodiscard]] std::optional<RunSummary> load_previous_summary(const IRunHistory& history,
                                                                  RunId current,
                                                                  Diagnostics& diagnostics);

}  // namespace sbt::history

#endif //SBT_RUN_HISTORY_HPP
