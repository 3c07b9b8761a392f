//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/reports/report_locator.hpp"

#include <gtest/gtest.h>
#include <fstream>

namespace sbt::reports
{
    class ReportLocatorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
            temp_dir = fs::temp_directory_path() / (std::string("sbt_report_locator_test_") + test->name());
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        void touch(const fs::path& relative) const {
            fs::create_directories((temp_dir / relative).parent_path());
            std::ofstream(temp_dir / relative) << "<html></html>";
        }

        fs::path temp_dir;
    };

    TEST(ReportFileNameTest, Matches) {
        EXPECT_TRUE(is_report_file_name("report-1a2b3c.html"));
        EXPECT_TRUE(is_report_file_name("report-.html"));
        EXPECT_FALSE(is_report_file_name("index.html"));
        EXPECT_FALSE(is_report_file_name("report-1.htm"));
        EXPECT_FALSE(is_report_file_name("Report-1.html"));
        EXPECT_FALSE(is_report_file_name("myreport-1.html"));
        EXPECT_FALSE(is_report_file_name("report-1.html.bak"));
    }

    TEST_F(ReportLocatorTest, FindsReportsRecursively) {
        touch("scan-1/report-b.html");
        touch("scan-1/report-a.html");
        touch("scan-1/nested/deeper/report-c.html");
        touch("scan-1/index.html");
        touch("scan-1/scanview.css");

        const auto reports = locate_reports(temp_dir);

        ASSERT_TRUE(reports.is_ok());
        ASSERT_EQ(reports.value().size(), 3u);
        for (const auto& report : reports.value()) {
            EXPECT_TRUE(is_report_file_name(report.filename().string()));
        }
    }

    TEST_F(ReportLocatorTest, ResultIsSorted) {
        touch("report-b.html");
        touch("report-a.html");
        touch("report-c.html");

        const auto reports = locate_reports(temp_dir);

        ASSERT_TRUE(reports.is_ok());
        ASSERT_EQ(reports.value().size(), 3u);
        EXPECT_EQ(reports.value()[0].filename(), "report-a.html");
        EXPECT_EQ(reports.value()[1].filename(), "report-b.html");
        EXPECT_EQ(reports.value()[2].filename(), "report-c.html");
    }

    TEST_F(ReportLocatorTest, DirectoryNamedLikeReportIsSkipped) {
        fs::create_directories(temp_dir / "report-dir.html");
        touch("report-dir.html/report-inner.html");

        const auto reports = locate_reports(temp_dir);

        ASSERT_TRUE(reports.is_ok());
        ASSERT_EQ(reports.value().size(), 1u);
        EXPECT_EQ(reports.value()[0].filename(), "report-inner.html");
    }

    TEST_F(ReportLocatorTest, EmptyFolder) {
        const auto reports = locate_reports(temp_dir);

        ASSERT_TRUE(reports.is_ok());
        EXPECT_TRUE(reports.value().empty());
    }

    TEST_F(ReportLocatorTest, MissingRoot) {
        const auto reports = locate_reports(temp_dir / "absent");

        ASSERT_TRUE(reports.is_err());
        EXPECT_EQ(reports.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ReportLocatorTest, RootIsFile) {
        touch("report-1.html");

        const auto reports = locate_reports(temp_dir / "report-1.html");

        ASSERT_TRUE(reports.is_err());
        EXPECT_EQ(reports.error().code(), ErrorCode::InvalidArgument);
    }

}  // namespace sbt::reports
