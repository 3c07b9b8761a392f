//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/history/run_history.hpp"
#include "sbt/history/summary_store.hpp"
#include "sbt/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace sbt::history
{
    class RunHistoryTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
            temp_dir = fs::temp_directory_path() / (std::string("sbt_run_history_test_") + test->name());
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        /**
         * Writes a record and a matching summary holding defect_count bare
         * defects.
         */
        void publish_run(const DirectoryRunHistory& history, const RunId run, const std::size_t defect_count) const {
            RunSummary summary(run);
            for (std::size_t i = 0; i < defect_count; ++i) {
                Defect d;
                d.report_file = "report-" + std::to_string(i) + ".html";
                d.bug_type = "Dead store";
                summary.add(d);
            }
            ASSERT_TRUE(save_summary(history.run_directory(run) / "clangScanBuildReports", summary).is_ok());

            RunRecord record;
            record.run = run;
            record.defect_count = defect_count;
            record.scan_build_output_folder = "clangScanBuildReports";
            record.summary_file = fs::path("clangScanBuildReports") / SUMMARY_FILE_NAME;
            ASSERT_TRUE(history.write_record(record).is_ok());
        }

        fs::path temp_dir;
    };

    TEST_F(RunHistoryTest, EmptyHistory) {
        const DirectoryRunHistory history(temp_dir / "runs");

        EXPECT_TRUE(history.list_runs().empty());
        EXPECT_FALSE(history.latest_run().has_value());
        EXPECT_EQ(history.next_run_id(), 1);
        EXPECT_FALSE(history.previous_run(1).has_value());
    }

    TEST_F(RunHistoryTest, ListRunsNumericAndSorted) {
        fs::create_directories(temp_dir / "10");
        fs::create_directories(temp_dir / "2");
        fs::create_directories(temp_dir / "notes");
        fs::create_directories(temp_dir / "0");
        ASSERT_TRUE(file_utils::write_file(temp_dir / "7", "not a directory").is_ok());

        const DirectoryRunHistory history(temp_dir);

        EXPECT_EQ(history.list_runs(), (std::vector<RunId>{2, 10}));
        EXPECT_EQ(history.latest_run(), std::optional<RunId>(10));
        EXPECT_EQ(history.next_run_id(), 11);
    }

    TEST_F(RunHistoryTest, LatestRecordedRunSkipsUnfinishedRuns) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 1, 2);
        publish_run(history, 3, 1);
        fs::create_directories(history.run_directory(4));

        EXPECT_EQ(history.latest_run(), std::optional<RunId>(4));
        EXPECT_EQ(history.latest_recorded_run(), std::optional<RunId>(3));
        EXPECT_TRUE(history.has_record(1));
        EXPECT_FALSE(history.has_record(2));
        EXPECT_FALSE(history.has_record(4));
    }

    TEST_F(RunHistoryTest, LatestRecordedRunOfUnpublishedHistory) {
        fs::create_directories(temp_dir / "1");
        const DirectoryRunHistory history(temp_dir);

        EXPECT_FALSE(history.latest_recorded_run().has_value());
    }

    TEST_F(RunHistoryTest, RecordRoundTripThroughDirectory) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 4, 2);

        const auto loaded = history.load_record(4);

        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().run, 4);
        EXPECT_EQ(loaded.value().defect_count, 2u);
        EXPECT_EQ(loaded.value().run_directory, temp_dir / "4");
        EXPECT_EQ(loaded.value().summary_path(), temp_dir / "4" / "clangScanBuildReports" / "bugSummary.json");

        const auto summary = loaded.value().load_summary();
        ASSERT_TRUE(summary.is_ok());
        EXPECT_EQ(summary.value().defect_count(), 2u);
    }

    TEST_F(RunHistoryTest, PreviousRunIsNearestEarlierRecord) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 1, 1);
        publish_run(history, 3, 5);

        const auto previous = history.previous_run(4);
        ASSERT_TRUE(previous.has_value());
        EXPECT_EQ(previous->run, 3);

        const auto before_three = history.previous_run(3);
        ASSERT_TRUE(before_three.has_value());
        EXPECT_EQ(before_three->run, 1);

        EXPECT_FALSE(history.previous_run(1).has_value());
    }

    TEST_F(RunHistoryTest, PreviousRunWithoutRecordIsAbsent) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 1, 1);
        fs::create_directories(history.run_directory(2));

        EXPECT_FALSE(history.previous_run(3).has_value());
    }

    TEST_F(RunHistoryTest, CorruptRecord) {
        const DirectoryRunHistory history(temp_dir);
        ASSERT_TRUE(file_utils::write_file(history.run_directory(2) / RUN_RECORD_FILE_NAME, "garbage").is_ok());

        const auto loaded = history.load_record(2);
        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::ParseError);

        EXPECT_FALSE(history.previous_run(3).has_value());
    }

    TEST_F(RunHistoryTest, MissingRecordIsNotFound) {
        const DirectoryRunHistory history(temp_dir);

        const auto loaded = history.load_record(9);
        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
    }

    TEST_F(RunHistoryTest, LoadPreviousSummary) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 1, 3);

        Diagnostics diagnostics;
        const auto summary = load_previous_summary(history, 2, diagnostics);

        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary->run, 1);
        EXPECT_EQ(summary->defect_count(), 3u);
        EXPECT_EQ(diagnostics.count(Severity::Warning), 0u);
    }

    TEST_F(RunHistoryTest, LoadPreviousSummaryNoPreviousRun) {
        const DirectoryRunHistory history(temp_dir);

        Diagnostics diagnostics;
        EXPECT_FALSE(load_previous_summary(history, 1, diagnostics).has_value());
        EXPECT_EQ(diagnostics.count(Severity::Info), 1u);
    }

    TEST_F(RunHistoryTest, LoadPreviousSummaryCorruptSummaryIsIgnored) {
        const DirectoryRunHistory history(temp_dir);
        publish_run(history, 1, 1);
        ASSERT_TRUE(file_utils::write_file(history.run_directory(1) / "clangScanBuildReports" / SUMMARY_FILE_NAME,
                                           "<xml/>").is_ok());

        Diagnostics diagnostics;
        EXPECT_FALSE(load_previous_summary(history, 2, diagnostics).has_value());
        EXPECT_EQ(diagnostics.count(Severity::Warning), 1u);
        EXPECT_TRUE(diagnostics.contains("Ignoring summary of run 1"));
    }

}  // namespace sbt::history
