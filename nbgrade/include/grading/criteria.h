/**
 * @file criteria.h
 * @brief 确定性评分规则
 *
 * score(): 按评分项类型对探针值打分，结果钳制到 [0, maxPoints]
 * build_probes(): 从评分标准推导探针表达式，id 为 "<sectionId>.<criterionId>"
 */

#ifndef NBGRADE_GRADING_CRITERIA_H
#define NBGRADE_GRADING_CRITERIA_H

#include <string>
#include <vector>
#include <set>
#include <cmath>
#include <optional>
#include <json/json.h>

#include "core/types.h"
#include "core/rubric.h"
#include "core/grade.h"
#include "core/utils.h"
#include "core/grader_logger.h"

namespace nbgrade {

/**
 * @brief 单项打分结果
 */
struct RuleOutcome {
    double score = 0.0;
    std::string rationale;
};

namespace detail {

inline std::optional<double> arg_number(const Json::Value &args, const char *key) {
    const Json::Value &v = args[key];
    if (v.isNumeric()) return v.asDouble();
    return std::nullopt;
}

inline std::string bound_str(const std::optional<double> &v) {
    return v ? format_number(*v) : "None";
}

/**
 * @brief 探针值缺失、出错或类型不符时的理由
 */
inline std::string probe_problem(const ProbeValue *v, const char *expected) {
    if (!v) return "probe missing: no value recorded";
    if (v->is_error()) return "expr error: " + v->text;
    return std::string("probe failed: expected ") + expected + ", got " + v->repr();
}

inline RuleOutcome score_range(const char *name, const Json::Value &args, double max_points,
                               const ProbeValue *v) {
    if (!v || !v->is_number()) {
        return {0.0, probe_problem(v, "number")};
    }
    auto lo = arg_number(args, "min");
    auto hi = arg_number(args, "max");
    bool ok = (!lo || v->number >= *lo) && (!hi || v->number <= *hi);
    return {ok ? max_points : 0.0,
            std::string(name) + "=" + format_number(v->number)
            + ", expected in [" + bound_str(lo) + ", " + bound_str(hi) + "]"};
}

inline RuleOutcome score_columns(const Json::Value &args, double max_points, const ProbeValue *v) {
    if (!v || !v->is_list()) {
        return {0.0, probe_problem(v, "list of columns")};
    }
    std::set<std::string> observed;
    for (const auto &item : v->items) {
        observed.insert(item.is_string() ? item.text : item.repr());
    }

    std::vector<std::string> required;
    std::set<std::string> seen;
    for (const auto &r : args["required"]) {
        std::string name = r.isString() ? r.asString() : trim(to_json_line(r));
        if (seen.insert(name).second) required.push_back(name);
    }

    std::vector<std::string> missing;
    for (const auto &name : required) {
        if (!observed.count(name)) missing.push_back(name);
    }
    if (missing.empty()) {
        return {max_points, "All required columns present."};
    }
    double have = static_cast<double>(required.size() - missing.size());
    double score = std::round(max_points * have / required.size() * 100.0) / 100.0;
    return {score, "Missing columns: " + join(missing, ", ")};
}

inline RuleOutcome score_row_count(const Json::Value &args, double max_points, const ProbeValue *v) {
    if (!v || !v->is_number()) {
        return {0.0, probe_problem(v, "number")};
    }
    std::string op = args["op"].isString() ? trim(args["op"].asString()) : ">=";
    double value = arg_number(args, "value").value_or(0.0);
    double n = v->number;
    bool ok;
    if (op == ">=") ok = n >= value;
    else if (op == ">") ok = n > value;
    else if (op == "==") ok = n == value;
    else if (op == "<=") ok = n <= value;
    else if (op == "<") ok = n < value;
    else return {0.0, "unsupported comparison '" + op + "'"};
    return {ok ? max_points : 0.0,
            "Row count " + format_number(n) + " " + op + " " + format_number(value)};
}

inline RuleOutcome score_table_shape(const Json::Value &args, double max_points, const ProbeValue *v) {
    if (!v || !v->is_list() || v->items.size() != 2
        || !v->items[0].is_number() || !v->items[1].is_number()) {
        return {0.0, probe_problem(v, "(rows, cols)")};
    }
    auto want_rows = arg_number(args, "rows");
    auto want_cols = arg_number(args, "cols");
    bool ok = (!want_rows || v->items[0].number == *want_rows)
           && (!want_cols || v->items[1].number == *want_cols);
    return {ok ? max_points : 0.0,
            "shape=" + v->repr() + ", expected rows=" + bound_str(want_rows)
            + ", cols=" + bound_str(want_cols)};
}

} // namespace detail

/**
 * @brief 对一个确定性评分项打分
 * @param value 探针值，可为空
 */
inline RuleOutcome score(CriterionKind kind, const Json::Value &args, double max_points,
                         const ProbeValue *value) {
    RuleOutcome out;
    switch (kind) {
        case CriterionKind::COLUMNS:
            out = detail::score_columns(args, max_points, value);
            break;
        case CriterionKind::ROW_COUNT:
            out = detail::score_row_count(args, max_points, value);
            break;
        case CriterionKind::STAT_RANGE:
            out = detail::score_range("value", args, max_points, value);
            break;
        case CriterionKind::UNIQUE_COUNT:
            out = detail::score_range("unique_count", args, max_points, value);
            break;
        case CriterionKind::NULL_RATE:
            out = detail::score_range("null_rate", args, max_points, value);
            break;
        case CriterionKind::TABLE_SHAPE:
            out = detail::score_table_shape(args, max_points, value);
            break;
        case CriterionKind::FIGURE_EXISTS:
            out = {0.0, "figure_exists is not checked automatically; needs manual review"};
            break;
        default:
            out = {0.0, "unknown criterion kind"};
    }
    out.score = clamp_score(out.score, max_points);
    return out;
}

/**
 * @brief 按类型名打分，未知类型得 0 分
 */
inline RuleOutcome score(const std::string &kind_name, const Json::Value &args, double max_points,
                         const ProbeValue *value) {
    auto kind = parse_criterion_kind(kind_name);
    if (!kind || *kind == CriterionKind::DELEGATED) {
        return {0.0, "unknown criterion kind"};
    }
    return score(*kind, args, max_points, value);
}

/**
 * @brief 对评分项打分，探针值从 results 中按 "<sid>.<cid>" 查找
 */
inline CriterionGrade score_criterion(const std::string &section_id, const Criterion &c,
                                      const ProbeResults &results) {
    auto it = results.find(section_id + "." + c.id());
    const ProbeValue *v = (it == results.end()) ? nullptr : &it->second;
    RuleOutcome o = score(c.kind(), c.args(), c.max_points(), v);
    return CriterionGrade(c.id(), c.label(), c.max_points(), o.score, o.rationale);
}

/**
 * @brief 由评分标准生成探针集合
 *
 * figure_exists 和交给评判服务的评分项不生成探针。
 */
inline ProbeSet build_probes(const Rubric &rubric) {
    ProbeSet probes;
    for (const auto &s : rubric.sections()) {
        for (const auto &c : s.criteria()) {
            const Json::Value &args = c.args();
            std::string df = args["df"].isString() ? args["df"].asString() : "df";
            std::string expr = args["expr"].isString() ? trim(args["expr"].asString()) : "";
            std::string column = args["column"].isString() ? args["column"].asString() : "";

            std::string probe;
            switch (c.kind()) {
                case CriterionKind::COLUMNS:
                    probe = "list(" + df + ".columns)";
                    break;
                case CriterionKind::ROW_COUNT:
                    probe = "len(" + df + ")";
                    break;
                case CriterionKind::TABLE_SHAPE:
                    probe = "tuple(" + df + ".shape)";
                    break;
                case CriterionKind::STAT_RANGE:
                    probe = expr;
                    break;
                case CriterionKind::UNIQUE_COUNT:
                    probe = !expr.empty() ? expr
                          : (!column.empty() ? df + "['" + column + "'].nunique()" : "");
                    break;
                case CriterionKind::NULL_RATE:
                    probe = !expr.empty() ? expr
                          : (!column.empty() ? df + "['" + column + "'].isna().mean()" : "");
                    break;
                default:
                    break;
            }
            if (probe.empty()) continue;
            // 评分标准已保证 (section, criterion) 唯一，这里不会重复
            auto added = probes.add(s.id() + "." + c.id(), probe);
            if (added.is_error()) {
                SLOG_WARN << added.error().to_string();
            }
        }
    }
    return probes;
}

} // namespace nbgrade

#endif // NBGRADE_GRADING_CRITERIA_H
