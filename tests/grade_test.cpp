/**
 * @file grade_test.cpp
 * @brief 得分钳制、覆盖与汇总
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "core/grade.h"

using namespace nbgrade;

namespace {

SectionGrade section(const std::string &id, double max_points, std::vector<CriterionGrade> criteria) {
    SectionGrade g;
    g.section_id = id;
    g.title = id;
    g.max_points = max_points;
    g.criteria = std::move(criteria);
    return g;
}

} // namespace

TEST(GradeTest, CriterionScoreIsClamped) {
    EXPECT_DOUBLE_EQ(CriterionGrade("a", "", 2.0, 5.0).score(), 2.0);
    EXPECT_DOUBLE_EQ(CriterionGrade("a", "", 2.0, -1.0).score(), 0.0);
    EXPECT_DOUBLE_EQ(CriterionGrade("a", "", 2.0, std::nan("")).score(), 0.0);
    EXPECT_DOUBLE_EQ(CriterionGrade("a", "", 2.0, std::numeric_limits<double>::infinity()).score(), 0.0);
    EXPECT_DOUBLE_EQ(CriterionGrade("a", "", 2.0, 1.25).score(), 1.25);
}

TEST(GradeTest, SectionEarnedIsCappedBySectionMax) {
    SectionGrade g = section("Q1", 5.0, {
        CriterionGrade("a", "", 4.0, 4.0),
        CriterionGrade("b", "", 3.0, 3.0)
    });
    EXPECT_DOUBLE_EQ(g.earned_points(), 5.0);

    Json::Value j = g.to_json();
    EXPECT_EQ(j["sectionId"].asString(), "Q1");
    EXPECT_DOUBLE_EQ(j["earnedPoints"].asDouble(), 5.0);
    EXPECT_EQ(j["criteria"].size(), 2u);
    EXPECT_EQ(j["criteria"][0]["criterionId"].asString(), "a");
}

TEST(GradeTest, OverrideTakesPrecedenceButRawGradeStays) {
    SectionGradeSheet sheet;
    sheet.sections.push_back(section("Q2", 10.0, {CriterionGrade("c", "", 10.0, 6.0)}));
    sheet.sections.push_back(section("Q3", 4.0, {CriterionGrade("d", "", 4.0, 4.0)}));

    OverrideTable overrides;
    ASSERT_TRUE(overrides.set("s1", "Q2", 8.0).ok());

    GradeTotals totals = aggregate("s1", sheet, overrides);
    EXPECT_DOUBLE_EQ(totals.effective["Q2"], 8.0);
    EXPECT_DOUBLE_EQ(totals.earned_with_overrides, 12.0);
    EXPECT_DOUBLE_EQ(totals.raw_earned, 10.0);
    EXPECT_DOUBLE_EQ(totals.max_points, 14.0);
    EXPECT_DOUBLE_EQ(sheet.find("Q2")->earned_points(), 6.0);

    // 其它评分对象不受影响
    GradeTotals other = aggregate("s2", sheet, overrides);
    EXPECT_DOUBLE_EQ(other.earned_with_overrides, 10.0);
}

TEST(GradeTest, OverrideClampedToSectionMax) {
    SectionGradeSheet sheet;
    sheet.sections.push_back(section("Q1", 5.0, {CriterionGrade("a", "", 5.0, 1.0)}));

    OverrideTable overrides;
    ASSERT_TRUE(overrides.set("s1", "Q1", 50.0).ok());
    EXPECT_DOUBLE_EQ(aggregate("s1", sheet, overrides).earned_with_overrides, 5.0);

    overrides.clear("s1", "Q1");
    EXPECT_DOUBLE_EQ(aggregate("s1", sheet, overrides).earned_with_overrides, 1.0);
}

TEST(GradeTest, OverrideRejectsInvalidValues) {
    OverrideTable overrides;
    EXPECT_TRUE(overrides.set("s1", "Q1", -1.0).is_error());
    EXPECT_TRUE(overrides.set("s1", "Q1", std::nan("")).is_error());
    EXPECT_EQ(overrides.size(), 0u);

    ASSERT_TRUE(overrides.set("s1", "Q1", 2.0).ok());
    ASSERT_TRUE(overrides.set("s1", "Q2", 3.0).ok());
    ASSERT_TRUE(overrides.set("s2", "Q1", 1.0).ok());
    EXPECT_EQ(overrides.for_subject("s1").size(), 2u);
}

TEST(GradeTest, FeedbackBulletsDescribeEachCriterion) {
    SectionGrade g = section("Q1", 6.0, {
        CriterionGrade("a", "Loads data", 2.0, 2.0, "ok"),
        CriterionGrade("b", "Cleans data", 2.0, 0.0, "no dropna", "drop missing rows"),
        CriterionGrade("c", "", 2.0, 1.0)
    });
    auto bullets = feedback_bullets(g);
    ASSERT_EQ(bullets.size(), 3u);
    EXPECT_EQ(bullets[0], "Met: Loads data - ok");
    EXPECT_EQ(bullets[1], "Not met: Cleans data - no dropna Tip: drop missing rows");
    EXPECT_EQ(bullets[2], "Partial credit (1/2): c");
}
