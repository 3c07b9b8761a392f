//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef SBT_RUN_PUBLISHER_HPP
#define SBT_RUN_PUBLISHER_HPP

/**
 * @file run_publisher.hpp
 * @brief Publishes the scan-build results of one run.
 *
 * Pipeline, in order:
 * 1. archive the scanner's unique output subfolder into the run directory
 * 2. locate report-*.html files in the archived copy
 * 3. build one Defect per report
 * 4. mark defects new against the previous run's summary, if any
 * 5. write bugSummary.json
 * 6. evaluate the threshold
 *
 * Steps 1 to 4 only ever add diagnostics. Step 5 fails the publish with
 * IoError: a run whose results could not be saved must not look
 * successful. Persisting the run record (make_record()) is left to the
 * orchestrator, which owns the run history.
 */

#include "sbt/types.hpp"
#include "sbt/result.hpp"
#include "sbt/error.hpp"
#include "sbt/config.hpp"
#include "sbt/diagnostics.hpp"
#include "sbt/history/defect_matcher.hpp"
#include "sbt/history/run_history.hpp"

#include <filesystem>

namespace sbt::publisher {

    namespace fs = std::filesystem;

    /**
     * Where a run lives. Supplied by the orchestrator.
     */
    struct RunContext {
        RunId run = 0;
        fs::path workspace;       // checkout the scanner ran in
        fs::path run_directory;   // per-run archive directory
    };

    struct PublishOutcome {
        RunSummary summary;
        ThresholdVerdict verdict;
        fs::path summary_file;
        bool had_previous_summary = false;
        Diagnostics diagnostics;
    };

    class RunPublisher {
    public:
        /**
         * @param config Validated publisher configuration.
         * @param history Previous-run accessor.
         * @param matcher Equality policy for the differencer.
         *
         * history and matcher must outlive the publisher.
         */
        RunPublisher(PublisherConfig config,
                     const history::IRunHistory& history,
                     const history::IDefectMatcher& matcher);

        /**
         * Runs the full pipeline for one run. A relative workspace is
         * resolved against the current directory.
         *
         * @return The outcome, IoError if the summary could not be written,
         *         or InvalidArgument for a bad context or a run that already
         *         has a record or an archive folder.
         */
        [[nodiscard]] Result<PublishOutcome, Error> publish(const RunContext& context) const;

        /**
         * Builds the run record describing a finished publish.
         */
        [[nodiscard]] history::RunRecord make_record(const RunContext& context,
                                                     const PublishOutcome& outcome) const;

        [[nodiscard]] const PublisherConfig& config() const noexcept { return config_; }

    private:
        [[nodiscard]] fs::path workspace_output_folder(const RunContext& context) const;
        [[nodiscard]] fs::path archive_output_folder(const RunContext& context) const;

        void collect_defects(const RunContext& context, PublishOutcome& outcome) const;

        PublisherConfig config_;
        const history::IRunHistory& history_;
        const history::IDefectMatcher& matcher_;
    };

}  // namespace sbt::publisher

#endif //SBT_RUN_PUBLISHER_HPP
