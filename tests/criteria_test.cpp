/**
 * @file criteria_test.cpp
 * @brief 确定性评分规则与探针推导
 */

#include <gtest/gtest.h>
#include <map>

#include "grading/criteria.h"

using namespace nbgrade;

namespace {

Json::Value args_of(const std::string &text) {
    Json::Value v;
    std::string errs;
    EXPECT_TRUE(parse_json(text, v, errs)) << errs;
    return v;
}

ProbeValue string_list(const std::vector<std::string> &names) {
    std::vector<ProbeValue> items;
    for (const auto &n : names) {
        items.push_back(ProbeValue::of_string(n));
    }
    return ProbeValue::of_list(items);
}

} // namespace

TEST(CriteriaTest, ColumnsPartialCreditNamesMissing) {
    ProbeValue observed = string_list({"a", "c"});
    RuleOutcome o = score(CriterionKind::COLUMNS, args_of(R"({"required": ["a", "b"]})"), 4.0, &observed);
    EXPECT_DOUBLE_EQ(o.score, 2.0);
    EXPECT_NE(o.rationale.find("b"), std::string::npos);
    EXPECT_NE(o.rationale.find("Missing columns"), std::string::npos);
}

TEST(CriteriaTest, ColumnsAllPresent) {
    ProbeValue observed = string_list({"b", "a", "z"});
    RuleOutcome o = score(CriterionKind::COLUMNS, args_of(R"({"required": ["a", "b"]})"), 3.0, &observed);
    EXPECT_DOUBLE_EQ(o.score, 3.0);
}

TEST(CriteriaTest, ColumnsRoundsToTwoDecimals) {
    ProbeValue observed = string_list({"a"});
    RuleOutcome o = score(CriterionKind::COLUMNS, args_of(R"({"required": ["a", "b", "c"]})"), 1.0, &observed);
    EXPECT_DOUBLE_EQ(o.score, 0.33);
}

TEST(CriteriaTest, RowCountBelowThresholdScoresZero) {
    ProbeValue n = ProbeValue::of_number(95);
    RuleOutcome o = score(CriterionKind::ROW_COUNT, args_of(R"({"op": ">=", "value": 100})"), 2.0, &n);
    EXPECT_DOUBLE_EQ(o.score, 0.0);

    ProbeValue enough = ProbeValue::of_number(100);
    EXPECT_DOUBLE_EQ(score(CriterionKind::ROW_COUNT, args_of(R"({"op": ">=", "value": 100})"), 2.0, &enough).score, 2.0);
}

TEST(CriteriaTest, RowCountRejectsUnknownOperator) {
    ProbeValue n = ProbeValue::of_number(5);
    RuleOutcome o = score(CriterionKind::ROW_COUNT, args_of(R"({"op": "~=", "value": 5})"), 2.0, &n);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
    EXPECT_NE(o.rationale.find("~="), std::string::npos);
}

TEST(CriteriaTest, RangeBoundsAreInclusiveAndOptional) {
    Json::Value both = args_of(R"({"min": 0.5, "max": 1.5})");
    ProbeValue lo = ProbeValue::of_number(0.5), hi = ProbeValue::of_number(1.5), out = ProbeValue::of_number(1.6);
    EXPECT_DOUBLE_EQ(score(CriterionKind::STAT_RANGE, both, 1.0, &lo).score, 1.0);
    EXPECT_DOUBLE_EQ(score(CriterionKind::STAT_RANGE, both, 1.0, &hi).score, 1.0);
    EXPECT_DOUBLE_EQ(score(CriterionKind::STAT_RANGE, both, 1.0, &out).score, 0.0);

    ProbeValue big = ProbeValue::of_number(1e9);
    EXPECT_DOUBLE_EQ(score(CriterionKind::UNIQUE_COUNT, args_of(R"({"min": 3})"), 2.0, &big).score, 2.0);

    ProbeValue rate = ProbeValue::of_number(0.2);
    RuleOutcome o = score(CriterionKind::NULL_RATE, args_of(R"({"max": 0.1})"), 1.0, &rate);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
    EXPECT_NE(o.rationale.find("null_rate"), std::string::npos);
}

TEST(CriteriaTest, ProbeErrorAndMissingScoreZero) {
    ProbeValue err = ProbeValue::of_error("NameError: name 'df' is not defined");
    RuleOutcome o = score(CriterionKind::STAT_RANGE, args_of(R"({"min": 0})"), 2.0, &err);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
    EXPECT_NE(o.rationale.find("NameError"), std::string::npos);

    RuleOutcome missing = score(CriterionKind::COLUMNS, args_of(R"({"required": ["a"]})"), 2.0, nullptr);
    EXPECT_DOUBLE_EQ(missing.score, 0.0);
    EXPECT_NE(missing.rationale.find("probe missing"), std::string::npos);

    ProbeValue wrong_type = ProbeValue::of_string("ten");
    EXPECT_DOUBLE_EQ(score(CriterionKind::ROW_COUNT, args_of(R"({"value": 1})"), 2.0, &wrong_type).score, 0.0);
}

TEST(CriteriaTest, TableShapeChecksGivenDimensions) {
    ProbeValue shape = ProbeValue::of_list({ProbeValue::of_number(100), ProbeValue::of_number(4)});
    EXPECT_DOUBLE_EQ(score(CriterionKind::TABLE_SHAPE, args_of(R"({"rows": 100, "cols": 4})"), 2.0, &shape).score, 2.0);
    EXPECT_DOUBLE_EQ(score(CriterionKind::TABLE_SHAPE, args_of(R"({"cols": 4})"), 2.0, &shape).score, 2.0);
    EXPECT_DOUBLE_EQ(score(CriterionKind::TABLE_SHAPE, args_of(R"({"rows": 99})"), 2.0, &shape).score, 0.0);
}

TEST(CriteriaTest, FigureExistsNeedsManualReview) {
    RuleOutcome o = score(CriterionKind::FIGURE_EXISTS, Json::Value(Json::objectValue), 2.0, nullptr);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
    EXPECT_FALSE(o.rationale.empty());
}

TEST(CriteriaTest, UnknownKindNameScoresZero) {
    ProbeValue v = ProbeValue::of_number(1);
    RuleOutcome o = score("regex_match", Json::Value(Json::objectValue), 2.0, &v);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
    EXPECT_EQ(o.rationale, "unknown criterion kind");

    EXPECT_DOUBLE_EQ(score("stat_range", args_of(R"({"min": 0})"), 2.0, &v).score, 2.0);
}

TEST(CriteriaTest, ScoreIsAlwaysClamped) {
    ProbeValue observed = string_list({"a"});
    RuleOutcome o = score(CriterionKind::COLUMNS, args_of(R"({"required": ["a"]})"), -1.0, &observed);
    EXPECT_DOUBLE_EQ(o.score, 0.0);
}

TEST(CriteriaTest, ScoreCriterionLooksUpQualifiedProbe) {
    auto c = Criterion::create("rows", "Enough rows", CriterionKind::ROW_COUNT,
                               args_of(R"({"op": ">", "value": 10})"), 3.0);
    ASSERT_TRUE(c.ok());
    ProbeResults results;
    results["Q1.rows"] = ProbeValue::of_number(11);

    CriterionGrade g = score_criterion("Q1", c.value(), results);
    EXPECT_EQ(g.criterion_id(), "rows");
    EXPECT_DOUBLE_EQ(g.score(), 3.0);
    EXPECT_DOUBLE_EQ(score_criterion("Q2", c.value(), results).score(), 0.0);
}

TEST(CriteriaTest, BuildProbesSkipsDelegatedAndFigures) {
    Json::Value root = args_of(R"JSON({"sections": [
        {"id": "Q1", "criteria": [
            {"id": "cols", "type": "columns", "args": {"df": "sales"}, "max": 1},
            {"id": "n", "type": "row_count", "max": 1},
            {"id": "fig", "type": "figure_exists", "max": 1},
            {"id": "why", "type": "llm_grade", "max": 1}
        ]},
        {"id": "Q2", "criteria": [
            {"id": "u", "type": "unique_count", "args": {"column": "city"}, "max": 1},
            {"id": "mean", "type": "stat_range", "args": {"expr": "df['x'].mean()"}, "max": 1},
            {"id": "bare", "type": "stat_range", "max": 1}
        ]}
    ]})JSON");
    auto rubric = rubric_from_json(root);
    ASSERT_TRUE(rubric.ok()) << rubric.error().to_string();

    ProbeSet probes = build_probes(rubric.value());
    std::map<std::string, std::string> by_id(probes.entries().begin(), probes.entries().end());
    ASSERT_EQ(by_id.size(), 4u);
    EXPECT_EQ(by_id["Q1.cols"], "list(sales.columns)");
    EXPECT_EQ(by_id["Q1.n"], "len(df)");
    EXPECT_EQ(by_id["Q2.u"], "df['city'].nunique()");
    EXPECT_EQ(by_id["Q2.mean"], "df['x'].mean()");
    EXPECT_EQ(by_id.count("Q1.fig"), 0u);
    EXPECT_EQ(by_id.count("Q1.why"), 0u);
}
