//
// Created by gregorian-rayne on 2/16/26.
//

#include "sbt/history/defect_matcher.hpp"

#include <gtest/gtest.h>

namespace sbt::history
{
    namespace {

        Defect make_defect(const std::string& report, const std::string& type, const std::string& file) {
            Defect d;
            d.report_file = report;
            d.bug_type = type;
            d.bug_description = type + " in " + file;
            d.bug_category = "Logic error";
            d.source_file = file;
            return d;
        }

    }  // namespace

    class DefectMatcherTest : public ::testing::Test {
    protected:
        ExactFieldMatcher matcher_;
    };

    TEST_F(DefectMatcherTest, Name) {
        EXPECT_EQ(matcher_.name(), "exact-fields");
    }

    TEST_F(DefectMatcherTest, ReportFileIsIgnored) {
        const auto current = make_defect("report-111.html", "Dead store", "/src/a.c");
        const auto previous = make_defect("report-999.html", "Dead store", "/src/a.c");

        EXPECT_TRUE(matcher_.same_defect(current, previous));
    }

    TEST_F(DefectMatcherTest, AnyFieldDifferenceBreaksMatch) {
        const auto base = make_defect("report-1.html", "Dead store", "/src/a.c");

        auto other_file = base;
        other_file.source_file = "/src/b.c";
        EXPECT_FALSE(matcher_.same_defect(other_file, base));

        auto other_desc = base;
        other_desc.bug_description = "something else";
        EXPECT_FALSE(matcher_.same_defect(other_desc, base));

        auto other_category = base;
        other_category.bug_category = "Memory error";
        EXPECT_FALSE(matcher_.same_defect(other_category, base));
    }

    TEST_F(DefectMatcherTest, AbsentFieldsCompareEqualOnlyToAbsent) {
        Defect bare;
        bare.report_file = "report-1.html";
        Defect also_bare;
        also_bare.report_file = "report-2.html";

        EXPECT_TRUE(matcher_.same_defect(bare, also_bare));

        Defect empty_type = bare;
        empty_type.bug_type = "";
        EXPECT_FALSE(matcher_.same_defect(empty_type, bare));
    }

    TEST_F(DefectMatcherTest, NoPreviousSummaryLeavesNewnessUnset) {
        std::vector<Defect> current = {make_defect("report-1.html", "Dead store", "/src/a.c")};

        EXPECT_EQ(mark_new_defects(current, std::nullopt, matcher_), 0u);
        EXPECT_FALSE(current[0].is_new.has_value());
    }

    TEST_F(DefectMatcherTest, MarksOnlyUnseenDefects) {
        RunSummary previous(4);
        previous.add(make_defect("report-old1.html", "Dead store", "/src/a.c"));
        previous.add(make_defect("report-old2.html", "Null dereference", "/src/b.c"));

        std::vector<Defect> current = {
            make_defect("report-new1.html", "Dead store", "/src/a.c"),
            make_defect("report-new2.html", "Division by zero", "/src/c.c"),
        };

        EXPECT_EQ(mark_new_defects(current, previous, matcher_), 1u);
        EXPECT_EQ(current[0].is_new, std::optional<bool>(false));
        EXPECT_EQ(current[1].is_new, std::optional<bool>(true));
    }

    TEST_F(DefectMatcherTest, EmptyPreviousSummaryMarksEverythingNew) {
        std::vector<Defect> current = {
            make_defect("report-1.html", "Dead store", "/src/a.c"),
            make_defect("report-2.html", "Dead store", "/src/b.c"),
        };

        EXPECT_EQ(mark_new_defects(current, RunSummary(1), matcher_), 2u);
        EXPECT_TRUE(current[0].is_marked_new());
        EXPECT_TRUE(current[1].is_marked_new());
    }

    TEST_F(DefectMatcherTest, SummaryContains) {
        RunSummary summary(2);
        summary.add(make_defect("report-1.html", "Dead store", "/src/a.c"));

        EXPECT_TRUE(summary_contains(summary, make_defect("report-x.html", "Dead store", "/src/a.c"), matcher_));
        EXPECT_FALSE(summary_contains(summary, make_defect("report-x.html", "Dead store", "/src/z.c"), matcher_));
    }

}  // namespace sbt::history
