/**
 * @file orchestrator_test.cpp
 * @brief 评分编排：本地评分项、评判服务响应容错与证据截断
 */

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "grading/orchestrator.h"

using namespace nbgrade;

namespace {

/**
 * @brief 返回固定响应并记录请求
 */
class ScriptedJudgment : public JudgmentService {
public:
    Result<std::string> response;
    std::vector<JudgmentRequest> requests;

    explicit ScriptedJudgment(Result<std::string> r) : response(std::move(r)) {}

    Result<std::string> judge(const JudgmentRequest &request) override {
        requests.push_back(request);
        return response;
    }
};

/**
 * @brief 每次调用都抛异常的服务
 */
class ThrowingJudgment : public JudgmentService {
public:
    Result<std::string> judge(const JudgmentRequest &) override {
        throw std::runtime_error("socket closed");
    }
};

Rubric make_rubric() {
    Json::Value root;
    std::string errs;
    parse_json(R"JSON({"sections": [
        {"id": "Q1", "title": "Load", "criteria": [
            {"id": "rows", "type": "row_count", "args": {"op": ">=", "value": 100}, "max": 2},
            {"id": "explain", "label": "Explains the data", "type": "llm_grade", "max": 3},
            {"id": "style", "label": "Readable code", "type": "freeform", "max": 1}
        ]},
        {"id": "Q2", "title": "Plot", "criteria": [
            {"id": "mean", "type": "stat_range", "args": {"expr": "df.x.mean()", "min": 0}, "max": 2}
        ]}
    ]})JSON", root, errs);
    return rubric_from_json(root).value();
}

ExecutionResult make_execution() {
    ExecutionResult exec;
    exec.executed_document.blocks = {
        Block::narrative("## Q1 Load the data"),
        Block::code("df = load()\nlen(df)"),
        Block::narrative("## Q2 Plot")
    };
    exec.executed_document.blocks[1].outputs.push_back(Output::result("120"));
    exec.probe_results["Q1.rows"] = ProbeValue::of_number(120);
    exec.probe_results["Q2.mean"] = ProbeValue::of_number(3.5);
    return exec;
}

Segmentation make_segmentation(const ExecutionResult &exec, const Rubric &rubric) {
    return segment(exec.executed_document, &rubric);
}

} // namespace

TEST(OrchestratorTest, MixesLocalAndDelegatedCriteria) {
    Rubric rubric = make_rubric();
    auto service = std::make_shared<ScriptedJudgment>(Result<std::string>(std::string(R"({
        "sectionId": "Q1",
        "criteria": [
            {"criterionId": "explain", "score": "2.5", "rationale": "mostly clear", "improvementNote": "cite numbers"},
            {"criterion_id": "style", "score": 7, "rationale": "fine"},
            {"criterionId": "invented", "score": 10}
        ],
        "overall_comment": "Good start."
    })")));
    GradingOrchestrator orchestrator(rubric, service);

    ExecutionResult exec = make_execution();
    SectionGradeSheet sheet = orchestrator.grade(exec, make_segmentation(exec, rubric));
    ASSERT_EQ(sheet.sections.size(), 2u);

    const SectionGrade *q1 = sheet.find("Q1");
    ASSERT_NE(q1, nullptr);
    ASSERT_EQ(q1->criteria.size(), 3u);
    EXPECT_EQ(q1->criteria[0].criterion_id(), "rows");
    EXPECT_DOUBLE_EQ(q1->criteria[0].score(), 2.0);
    EXPECT_EQ(q1->criteria[1].criterion_id(), "explain");
    EXPECT_DOUBLE_EQ(q1->criteria[1].score(), 2.5);
    EXPECT_EQ(q1->criteria[1].improvement_note(), "cite numbers");
    EXPECT_DOUBLE_EQ(q1->criteria[2].score(), 1.0);   // 7 被钳制到 1
    EXPECT_DOUBLE_EQ(q1->earned_points(), 5.5);
    EXPECT_EQ(q1->overall_comment, "Good start.");

    // 只有 Q1 含交由服务评判的评分项
    ASSERT_EQ(service->requests.size(), 1u);
    const JudgmentRequest &req = service->requests[0];
    EXPECT_EQ(req.section_id, "Q1");
    ASSERT_EQ(req.criteria.size(), 2u);
    EXPECT_NE(req.evidence.find("len(df)"), std::string::npos);
    EXPECT_NE(req.evidence.find("120"), std::string::npos);
    EXPECT_EQ(req.to_json()["rubricSlice"]["criteria"].size(), 2u);

    EXPECT_DOUBLE_EQ(sheet.find("Q2")->earned_points(), 2.0);
}

TEST(OrchestratorTest, MalformedResponseZeroesDelegatedCriteria) {
    Rubric rubric = make_rubric();
    auto service = std::make_shared<ScriptedJudgment>(Result<std::string>(std::string("Sure! Here are the scores...")));
    GradingOrchestrator orchestrator(rubric, service);

    ExecutionResult exec = make_execution();
    SectionGradeSheet sheet = orchestrator.grade(exec, make_segmentation(exec, rubric));
    const SectionGrade *q1 = sheet.find("Q1");
    ASSERT_NE(q1, nullptr);

    EXPECT_DOUBLE_EQ(q1->criteria[1].score(), 0.0);
    EXPECT_DOUBLE_EQ(q1->criteria[2].score(), 0.0);
    EXPECT_NE(q1->overall_comment.find("parse"), std::string::npos);
    // 本地评分项不受影响
    EXPECT_DOUBLE_EQ(q1->criteria[0].score(), 2.0);
}

TEST(OrchestratorTest, AllDelegatedSectionWithMalformedResponseEarnsZero) {
    Json::Value root;
    std::string errs;
    ASSERT_TRUE(parse_json(R"({"sections": [{"id": "Q1", "criteria": [
        {"id": "a", "type": "llm", "max": 2}, {"id": "b", "type": "llm", "max": 2}]}]})", root, errs));
    Rubric rubric = rubric_from_json(root).value();
    auto service = std::make_shared<ScriptedJudgment>(Result<std::string>(std::string("[1, 2]")));
    GradingOrchestrator orchestrator(rubric, service);

    ExecutionResult exec;
    exec.executed_document.blocks = {Block::narrative("Q1"), Block::code("x = 1")};
    SectionGradeSheet sheet = orchestrator.grade(exec, segment(exec.executed_document, &rubric));
    ASSERT_EQ(sheet.sections.size(), 1u);
    EXPECT_DOUBLE_EQ(sheet.sections[0].earned_points(), 0.0);
    for (const auto &c : sheet.sections[0].criteria) {
        EXPECT_DOUBLE_EQ(c.score(), 0.0);
    }
    EXPECT_FALSE(sheet.sections[0].overall_comment.empty());
}

TEST(OrchestratorTest, TransportFailureIsRecordedNotThrown) {
    Rubric rubric = make_rubric();
    auto service = std::make_shared<ScriptedJudgment>(
        Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR, "connection refused"));
    GradingOrchestrator orchestrator(rubric, service);

    ExecutionResult exec = make_execution();
    SectionGradeSheet sheet = orchestrator.grade(exec, make_segmentation(exec, rubric));
    const SectionGrade *q1 = sheet.find("Q1");
    ASSERT_NE(q1, nullptr);
    EXPECT_DOUBLE_EQ(q1->earned_points(), 2.0);
    EXPECT_NE(q1->overall_comment.find("connection refused"), std::string::npos);
}

TEST(OrchestratorTest, OmittedCriteriaScoreZero) {
    std::vector<const Criterion*> criteria;
    auto a = Criterion::create("a", "A", CriterionKind::DELEGATED, Json::Value(), 2.0);
    auto b = Criterion::create("b", "B", CriterionKind::DELEGATED, Json::Value(), 2.0);
    ASSERT_TRUE(a.ok() && b.ok());
    criteria.push_back(&a.value());
    criteria.push_back(&b.value());

    std::string comment;
    auto parsed = parse_judgment(R"({"criteria": [{"criterionId": "a", "score": 1}], "overallComment": "ok"})",
                                 criteria, comment);
    ASSERT_TRUE(parsed.ok());
    ASSERT_EQ(parsed.value().size(), 2u);
    EXPECT_DOUBLE_EQ(parsed.value()[0].score(), 1.0);
    EXPECT_DOUBLE_EQ(parsed.value()[1].score(), 0.0);
    EXPECT_EQ(parsed.value()[1].rationale(), "not graded by judgment service");
    EXPECT_EQ(comment, "ok");
}

TEST(OrchestratorTest, SectionsMissingFromDocumentAreSkipped) {
    Rubric rubric = make_rubric();
    auto service = std::make_shared<ScriptedJudgment>(Result<std::string>(std::string("{}")));
    GradingOrchestrator orchestrator(rubric, service);

    ExecutionResult exec = make_execution();
    exec.executed_document.blocks.pop_back();   // 去掉 Q2 标题
    SectionGradeSheet sheet = orchestrator.grade(exec, make_segmentation(exec, rubric));
    ASSERT_EQ(sheet.sections.size(), 1u);
    EXPECT_EQ(sheet.find("Q2"), nullptr);
}

TEST(OrchestratorTest, EvidenceIsTruncated) {
    Document doc;
    doc.blocks = {Block::narrative(std::string(5000, 'n')), Block::code(std::string(10, 'c'))};
    doc.blocks[1].outputs.push_back(Output::stream("stdout", std::string(7000, 'o')));
    doc.blocks[1].outputs.push_back(Output::error("ValueError", "bad value"));

    SectionSpan span;
    span.section_id = "Q1";
    span.start_index = 0;
    span.end_index = 1;
    span.block_indices = {0, 1};

    EvidenceContext ctx = build_evidence(doc, span);
    EXPECT_EQ(ctx.narrative.size(), EVIDENCE_NARRATIVE_CHARS + std::string(" ...[truncated]").size());
    EXPECT_EQ(ctx.code, std::string(10, 'c'));
    EXPECT_EQ(ctx.outputs.size(), EVIDENCE_OUTPUT_CHARS + std::string(" ...[truncated]").size());
    EXPECT_NE(ctx.outputs.find("...[truncated]"), std::string::npos);
}

TEST(OrchestratorTest, ThrowingServiceZeroesDelegatedCriteria) {
    Rubric rubric = make_rubric();
    GradingOrchestrator orchestrator(rubric, std::make_shared<ThrowingJudgment>());

    ExecutionResult exec = make_execution();
    SectionGradeSheet sheet;
    EXPECT_NO_THROW(sheet = orchestrator.grade(exec, make_segmentation(exec, rubric)));
    const SectionGrade *q1 = sheet.find("Q1");
    ASSERT_NE(q1, nullptr);
    EXPECT_DOUBLE_EQ(q1->criteria[1].score(), 0.0);
    EXPECT_DOUBLE_EQ(q1->earned_points(), 2.0);
    EXPECT_NE(q1->overall_comment.find("socket closed"), std::string::npos);
}

TEST(JudgmentEnvelopeTest, ExtractsFirstChoiceContent) {
    auto content = extract_chat_content(R"({"choices": [
        {"message": {"role": "assistant", "content": "{\"criteria\": []}"}},
        {"message": {"content": "ignored"}}
    ]})");
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), R"({"criteria": []})");
}

TEST(JudgmentEnvelopeTest, MalformedEnvelopesAreRejectedNotThrown) {
    const std::vector<std::string> bad = {
        "not json",
        "[1, 2]",
        R"({"choices": "x"})",
        R"({"choices": []})",
        R"({"choices": ["x"]})",
        R"({"choices": [{"message": "hi"}]})",
        R"({"choices": [{"message": {"content": 42}}]})",
        R"({"choices": [{"text": "legacy completion"}]})"
    };
    for (const auto &body : bad) {
        Result<std::string> r(ErrorCode::UNKNOWN_ERROR);
        EXPECT_NO_THROW(r = extract_chat_content(body)) << body;
        ASSERT_TRUE(r.is_error()) << body;
        EXPECT_EQ(r.error().code(), ErrorCode::JUDGMENT_BAD_RESPONSE) << body;
    }
}
