/**
 * @file orchestrator.h
 * @brief 评分编排
 *
 * 对分段结果中的每个小节：
 * - 确定性评分项按探针值本地打分
 * - 其余评分项合并为一次评判服务请求，响应按评分项 id 与评分标准对齐
 *
 * 评判服务的任何失败都只让该小节交由服务的评分项记 0 分，并写入 overallComment。
 */

#ifndef NBGRADE_GRADING_ORCHESTRATOR_H
#define NBGRADE_GRADING_ORCHESTRATOR_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <cstdlib>
#include <exception>
#include <json/json.h>

#include "core/types.h"
#include "core/rubric.h"
#include "core/grade.h"
#include "core/utils.h"
#include "core/grader_logger.h"
#include "grading/segmenter.h"
#include "grading/criteria.h"
#include "grading/judgment.h"

namespace nbgrade {

//==============================================================================
// 证据上下文
//==============================================================================

constexpr size_t EVIDENCE_NARRATIVE_CHARS = 4000;
constexpr size_t EVIDENCE_CODE_CHARS = 4000;
constexpr size_t EVIDENCE_OUTPUT_CHARS = 6000;

struct EvidenceContext {
    std::string narrative;
    std::string code;
    std::string outputs;

    std::string render() const {
        return "## Narrative\n" + narrative
             + "\n\n## Code\n" + code
             + "\n\n## Outputs\n" + outputs;
    }
};

/**
 * @brief 单条输出的文本形式，图像等非文本输出为空
 */
inline std::string output_text(const Output &o) {
    switch (o.kind) {
        case OutputKind::STREAM_TEXT:
        case OutputKind::STRUCTURED_RESULT:
            return o.text;
        case OutputKind::ERROR:
            return o.error_name + ": " + o.text;
        default:
            return "";
    }
}

/**
 * @brief 收集区间内的说明、代码与文本输出，按上限截断
 */
inline EvidenceContext build_evidence(const Document &doc, const SectionSpan &span) {
    std::vector<std::string> narrative, code, outputs;
    for (size_t i : span.block_indices) {
        if (i >= doc.blocks.size()) continue;
        const Block &b = doc.blocks[i];
        if (b.is_narrative()) {
            if (!trim(b.source).empty()) narrative.push_back(b.source);
            continue;
        }
        if (!trim(b.source).empty()) code.push_back(b.source);
        for (const auto &o : b.outputs) {
            std::string t = output_text(o);
            if (!trim(t).empty()) outputs.push_back(t);
        }
    }
    EvidenceContext ctx;
    ctx.narrative = clip_text(join(narrative, "\n\n"), EVIDENCE_NARRATIVE_CHARS);
    ctx.code = clip_text(join(code, "\n\n"), EVIDENCE_CODE_CHARS);
    ctx.outputs = clip_text(join(outputs, "\n\n"), EVIDENCE_OUTPUT_CHARS);
    return ctx;
}

//==============================================================================
// 评判服务响应解析
//==============================================================================

namespace detail {

inline const Json::Value& member(const Json::Value &obj, const char *name, const char *alias) {
    if (obj.isMember(name)) return obj[name];
    return obj[alias];
}

inline std::string member_str(const Json::Value &obj, const char *name, const char *alias) {
    const Json::Value &v = member(obj, name, alias);
    return v.isString() ? v.asString() : "";
}

/**
 * @brief 分数可以是数字或数字字符串，无法解析时为 0
 */
inline double score_value(const Json::Value &v) {
    if (v.isNumeric()) return v.asDouble();
    if (v.isString()) {
        std::string s = trim(v.asString());
        if (s.empty()) return 0.0;
        char *end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end && *end == '\0') return d;
    }
    return 0.0;
}

/**
 * @brief 所有交由服务评判的评分项记 0 分
 */
inline std::vector<CriterionGrade> zero_delegated(const std::vector<const Criterion*> &criteria,
                                                  const std::string &rationale) {
    std::vector<CriterionGrade> out;
    for (const Criterion *c : criteria) {
        out.emplace_back(c->id(), c->label(), c->max_points(), 0.0, rationale);
    }
    return out;
}

} // namespace detail

/**
 * @brief 解析评判服务响应
 *
 * 返回的评分项按 criteria 的顺序排列；未知 id 被丢弃，缺失的评分项记 0 分。
 * 响应不是 JSON 对象时返回 JUDGMENT_BAD_RESPONSE。
 */
inline Result<std::vector<CriterionGrade>> parse_judgment(const std::string &response,
                                                          const std::vector<const Criterion*> &criteria,
                                                          std::string &overall_comment) {
    Json::Value root;
    std::string errs;
    if (!parse_json(trim(response), root, errs) || !root.isObject()) {
        return Err<std::vector<CriterionGrade>>(ErrorCode::JUDGMENT_BAD_RESPONSE,
            "Invalid JSON from judgment service" + (errs.empty() ? std::string() : ": " + trim(errs)));
    }

    std::map<std::string, const Json::Value*> returned;
    const Json::Value &list = root["criteria"];
    if (list.isArray()) {
        for (const auto &item : list) {
            if (!item.isObject()) continue;
            std::string cid = detail::member_str(item, "criterionId", "criterion_id");
            if (cid.empty()) cid = detail::member_str(item, "id", "id");
            if (cid.empty() || returned.count(cid)) continue;
            returned[cid] = &item;
        }
    }

    std::vector<CriterionGrade> out;
    for (const Criterion *c : criteria) {
        auto it = returned.find(c->id());
        if (it == returned.end()) {
            out.emplace_back(c->id(), c->label(), c->max_points(), 0.0, "not graded by judgment service");
            continue;
        }
        const Json::Value &item = *it->second;
        out.emplace_back(c->id(), c->label(), c->max_points(),
                         detail::score_value(item["score"]),
                         detail::member_str(item, "rationale", "rationale"),
                         detail::member_str(item, "improvementNote", "improvement_tip"));
    }
    for (const auto &kv : returned) {
        bool known = false;
        for (const Criterion *c : criteria) {
            if (c->id() == kv.first) { known = true; break; }
        }
        if (!known) {
            SLOG_DEBUG << "Dropping unknown criterion '" << kv.first << "' from judgment response";
        }
    }

    overall_comment = detail::member_str(root, "overallComment", "overall_comment");
    return out;
}

//==============================================================================
// 编排器
//==============================================================================

class GradingOrchestrator {
private:
    const Rubric &rubric_;
    std::shared_ptr<JudgmentService> service_;

    /**
     * @brief 调用评判服务，服务实现抛出的异常转为 JUDGMENT_TRANSPORT_ERROR
     */
    Result<std::string> call_service(const JudgmentRequest &req) const {
        try {
            return service_->judge(req);
        } catch (const std::exception &e) {
            return Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR,
                                    std::string("judgment service raised: ") + e.what());
        }
    }

    SectionGrade grade_section(const Section &section, const SectionSpan &span,
                               const ExecutionResult &exec) const {
        SectionGrade grade;
        grade.section_id = section.id();
        grade.title = section.title();
        grade.max_points = section.max_points();

        std::vector<const Criterion*> delegated;
        std::map<std::string, CriterionGrade> scored;
        for (const auto &c : section.criteria()) {
            if (c.is_delegated()) {
                delegated.push_back(&c);
            } else {
                scored[c.id()] = score_criterion(section.id(), c, exec.probe_results);
            }
        }

        if (!delegated.empty()) {
            std::vector<CriterionGrade> judged;
            if (!service_) {
                judged = detail::zero_delegated(delegated, "no judgment service configured");
                grade.overall_comment = "Judgment service unavailable; delegated criteria scored 0.";
            } else {
                JudgmentRequest req;
                req.section_id = section.id();
                req.title = section.title();
                req.total_points = section.max_points();
                req.criteria = delegated;
                req.evidence = build_evidence(exec.executed_document, span).render();

                auto response = call_service(req);
                if (response.is_error()) {
                    SLOG_WARN << "Judgment for section " << section.id() << " failed: "
                              << response.error().to_string();
                    judged = detail::zero_delegated(delegated, "judgment service failed");
                    grade.overall_comment = "Judgment service failed: " + response.error().message();
                } else {
                    auto parsed = parse_judgment(response.value(), delegated, grade.overall_comment);
                    if (parsed.is_error()) {
                        SLOG_WARN << "Section " << section.id() << ": " << parsed.error().message();
                        judged = detail::zero_delegated(delegated, "judgment response could not be parsed");
                        grade.overall_comment = "Could not parse judgment response: "
                                              + parsed.error().message();
                    } else {
                        judged = std::move(parsed.value());
                    }
                }
            }
            for (auto &g : judged) {
                scored[g.criterion_id()] = std::move(g);
            }
        }

        // 保持评分标准中的顺序
        for (const auto &c : section.criteria()) {
            grade.criteria.push_back(scored[c.id()]);
        }
        return grade;
    }

public:
    /**
     * @param rubric 须比编排器活得更久
     * @param service 可为空，此时交由服务的评分项记 0 分
     */
    GradingOrchestrator(const Rubric &rubric, std::shared_ptr<JudgmentService> service)
        : rubric_(rubric), service_(std::move(service)) {}

    SectionGradeSheet grade(const ExecutionResult &exec, const Segmentation &segmentation) const {
        SectionGradeSheet sheet;
        for (const auto &section : rubric_.sections()) {
            const SectionSpan *span = segmentation.find(section.id());
            if (!span) {
                SLOG_INFO << "Section " << section.id() << " not found in document, skipped";
                continue;
            }
            SectionGrade g = grade_section(section, *span, exec);
            SLOG_INFO << "Section " << g.section_id << ": " << format_number(g.earned_points())
                      << " / " << format_number(g.max_points);
            sheet.sections.push_back(std::move(g));
        }
        return sheet;
    }
};

} // namespace nbgrade

#endif // NBGRADE_GRADING_ORCHESTRATOR_H
