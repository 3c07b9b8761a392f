//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/history/summary_store.hpp"
#include "sbt/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace sbt::history
{
    class SummaryStoreTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* test = ::testing::UnitTest::GetInstance()->current_test_info();
            temp_dir = fs::temp_directory_path() / (std::string("sbt_summary_store_test_") + test->name());
            fs::remove_all(temp_dir);
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        static RunSummary sample_summary() {
            RunSummary summary(3);

            Defect full;
            full.report_file = "report-a.html";
            full.bug_type = "Dead store";
            full.bug_description = "Value stored to 'x' is never read";
            full.bug_category = "Dead store";
            full.source_file = "/src/foo.c";
            full.is_new = true;
            summary.add(full);

            Defect bare;
            bare.report_file = "report-b.html";
            summary.add(bare);

            return summary;
        }

        fs::path temp_dir;
    };

    TEST_F(SummaryStoreTest, SerializedShape) {
        const auto j = nlohmann::json::parse(serialize_summary(sample_summary()));

        EXPECT_EQ(j["format_version"], SUMMARY_FORMAT_VERSION);
        EXPECT_EQ(j["run"], 3);
        EXPECT_EQ(j["defect_count"], 2);
        ASSERT_EQ(j["defects"].size(), 2u);

        const auto& full = j["defects"][0];
        EXPECT_EQ(full["bug_type"], "Dead store");
        EXPECT_EQ(full["source_file"], "/src/foo.c");
        EXPECT_EQ(full["is_new"], true);

        const auto& bare = j["defects"][1];
        EXPECT_EQ(bare["report_file"], "report-b.html");
        EXPECT_FALSE(bare.contains("bug_type"));
        EXPECT_FALSE(bare.contains("is_new"));
    }

    TEST_F(SummaryStoreTest, SaveAndLoadPreserveAbsence) {
        const auto original = sample_summary();

        const auto saved = save_summary(temp_dir / "clangScanBuildReports", original);
        ASSERT_TRUE(saved.is_ok());
        EXPECT_EQ(saved.value(), temp_dir / "clangScanBuildReports" / "bugSummary.json");

        const auto loaded = load_summary(saved.value());
        ASSERT_TRUE(loaded.is_ok()) << loaded.error().to_string();
        EXPECT_EQ(loaded.value().run, 3);
        ASSERT_EQ(loaded.value().defects.size(), 2u);
        EXPECT_EQ(loaded.value().defects[0], original.defects[0]);
        EXPECT_EQ(loaded.value().defects[1], original.defects[1]);
        EXPECT_FALSE(loaded.value().defects[1].bug_type.has_value());
    }

    TEST_F(SummaryStoreTest, LoadMissingFile) {
        const auto loaded = load_summary(temp_dir / "bugSummary.json");

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
    }

    TEST_F(SummaryStoreTest, CorruptSummaryIsParseErrorWithPath) {
        const auto path = temp_dir / "bugSummary.json";
        ASSERT_TRUE(file_utils::write_file(path, "{ not json").is_ok());

        const auto loaded = load_summary(path);

        ASSERT_TRUE(loaded.is_err());
        EXPECT_EQ(loaded.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(loaded.error().context().value(), path.string());
    }

    TEST_F(SummaryStoreTest, RejectsWrongShapes) {
        EXPECT_TRUE(deserialize_summary("[]").is_err());
        EXPECT_TRUE(deserialize_summary(R"({"format_version": 99, "run": 1, "defects": []})").is_err());
        EXPECT_TRUE(deserialize_summary(R"({"format_version": 1, "run": 1, "defects": {}})").is_err());
        EXPECT_TRUE(deserialize_summary(R"({"format_version": 1, "defects": []})").is_err());
        EXPECT_TRUE(deserialize_summary(R"({"format_version": 1, "run": 1, "defects": [{}]})").is_err());
    }

    TEST_F(SummaryStoreTest, AcceptsNullOptionalFields) {
        const auto parsed = deserialize_summary(R"({
            "format_version": 1,
            "run": 5,
            "defects": [{"report_file": "report-1.html", "bug_type": null, "is_new": null}]
        })");

        ASSERT_TRUE(parsed.is_ok());
        EXPECT_FALSE(parsed.value().defects[0].bug_type.has_value());
        EXPECT_FALSE(parsed.value().defects[0].is_new.has_value());
    }

}  // namespace sbt::history
