//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/archive/report_archiver.hpp"
#include "sbt/utils/file_utils.hpp"

#include <gtest/gtest.h>

namespace sbt::archive
{
    class ReportArchiverTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
            temp_dir = fs::temp_directory_path() / (std::string("sbt_report_archiver_test_") + test->name());
            fs::remove_all(temp_dir);
            workspace_output = temp_dir / "ws" / "clangScanBuildReports";
            archive_output = temp_dir / "runs" / "1" / "clangScanBuildReports";
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        void write(const fs::path& path, const std::string& content) const {
            ASSERT_TRUE(file_utils::write_file(path, content).is_ok());
        }

        fs::path temp_dir;
        fs::path workspace_output;
        fs::path archive_output;
    };

    TEST_F(ReportArchiverTest, CopiesUniqueSubfolderContents) {
        write(workspace_output / "2026-02-16-101500-1234-1" / "report-a.html", "a");
        write(workspace_output / "2026-02-16-101500-1234-1" / "index.html", "index");

        Diagnostics diagnostics;
        const auto result = archive_scan_build_output(workspace_output, archive_output, diagnostics);

        EXPECT_TRUE(result.copied);
        ASSERT_TRUE(result.source_folder.has_value());
        EXPECT_EQ(result.source_folder->filename(), "2026-02-16-101500-1234-1");
        EXPECT_TRUE(fs::exists(archive_output / "report-a.html"));
        EXPECT_TRUE(fs::exists(archive_output / "index.html"));
        EXPECT_TRUE(diagnostics.empty());
    }

    TEST_F(ReportArchiverTest, MissingOutputFolderIsCreatedAndWarned) {
        Diagnostics diagnostics;
        const auto result = archive_scan_build_output(workspace_output, archive_output, diagnostics);

        EXPECT_FALSE(result.copied);
        EXPECT_FALSE(result.source_folder.has_value());
        EXPECT_TRUE(fs::is_directory(workspace_output));
        EXPECT_EQ(diagnostics.count(Severity::Warning), 1u);
        EXPECT_TRUE(diagnostics.contains("Could not locate a unique scan-build output folder"));
    }

    TEST_F(ReportArchiverTest, SeveralSubfoldersUsesFirstByName) {
        write(workspace_output / "b-run" / "report-b.html", "b");
        write(workspace_output / "a-run" / "report-a.html", "a");

        Diagnostics diagnostics;
        const auto result = archive_scan_build_output(workspace_output, archive_output, diagnostics);

        EXPECT_TRUE(result.copied);
        EXPECT_EQ(result.source_folder->filename(), "a-run");
        EXPECT_TRUE(fs::exists(archive_output / "report-a.html"));
        EXPECT_FALSE(fs::exists(archive_output / "report-b.html"));
        EXPECT_EQ(diagnostics.count(Severity::Info), 1u);
    }

    TEST_F(ReportArchiverTest, LooseFilesAreNotSubfolders) {
        write(workspace_output / "report-loose.html", "x");

        Diagnostics diagnostics;
        const auto result = archive_scan_build_output(workspace_output, archive_output, diagnostics);

        EXPECT_FALSE(result.copied);
        EXPECT_EQ(diagnostics.count(Severity::Warning), 1u);
    }

    TEST_F(ReportArchiverTest, UnwritableArchiveIsError) {
        write(workspace_output / "scan" / "report-a.html", "a");
        write(temp_dir / "runs" / "1", "a file where the run directory should be");

        Diagnostics diagnostics;
        const auto result = archive_scan_build_output(workspace_output, archive_output, diagnostics);

        EXPECT_FALSE(result.copied);
        EXPECT_EQ(diagnostics.count(Severity::Error), 1u);
        EXPECT_TRUE(diagnostics.contains("Unable to copy scan-build output"));
    }

}  // namespace sbt::archive
