/**
 * @file rubric.h
 * @brief 评分标准（Rubric）
 *
 * Rubric 是有序的 Section 列表，每个 Section 含若干 Criterion。
 * 所有不变量在构造时检查：
 * - id 非空
 * - maxPoints >= 0
 * - kind 为已知类型
 * - Section id 唯一，Section 内 Criterion id 唯一
 *
 * 加载失败时整份拒绝，不做部分加载。
 */

#ifndef NBGRADE_CORE_RUBRIC_H
#define NBGRADE_CORE_RUBRIC_H

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cmath>
#include <json/json.h>

#include "core/error.h"
#include "core/utils.h"

namespace nbgrade {

/**
 * @brief 评分项类型
 */
enum class CriterionKind {
    COLUMNS,
    ROW_COUNT,
    STAT_RANGE,
    UNIQUE_COUNT,
    NULL_RATE,
    TABLE_SHAPE,
    FIGURE_EXISTS,
    DELEGATED       ///< 交给外部评判服务
};

inline const char* kind_to_string(CriterionKind k) {
    switch (k) {
        case CriterionKind::COLUMNS: return "columns";
        case CriterionKind::ROW_COUNT: return "row_count";
        case CriterionKind::STAT_RANGE: return "stat_range";
        case CriterionKind::UNIQUE_COUNT: return "unique_count";
        case CriterionKind::NULL_RATE: return "null_rate";
        case CriterionKind::TABLE_SHAPE: return "table_shape";
        case CriterionKind::FIGURE_EXISTS: return "figure_exists";
        case CriterionKind::DELEGATED: return "delegated";
        default: return "unknown";
    }
}

/**
 * @brief 解析评分项类型名
 *
 * 大小写不敏感；llm_grade / llm / freeform / feedback 等别名以及空串都归为 DELEGATED。
 */
inline std::optional<CriterionKind> parse_criterion_kind(const std::string &raw) {
    std::string t = to_lower(trim(raw));
    if (t.empty()) return CriterionKind::DELEGATED;

    static const std::set<std::string> delegated_aliases = {
        "delegated", "llm_grade", "llm_grader", "llm", "llmgrade",
        "freeform", "feedback", "llm_feedback"
    };
    if (delegated_aliases.count(t)) return CriterionKind::DELEGATED;

    if (t == "columns") return CriterionKind::COLUMNS;
    if (t == "row_count") return CriterionKind::ROW_COUNT;
    if (t == "stat_range") return CriterionKind::STAT_RANGE;
    if (t == "unique_count") return CriterionKind::UNIQUE_COUNT;
    if (t == "null_rate") return CriterionKind::NULL_RATE;
    if (t == "table_shape") return CriterionKind::TABLE_SHAPE;
    if (t == "figure_exists") return CriterionKind::FIGURE_EXISTS;
    return std::nullopt;
}

/**
 * @brief 评分项
 */
class Criterion {
private:
    std::string id_;
    std::string label_;
    CriterionKind kind_ = CriterionKind::DELEGATED;
    Json::Value args_;
    double max_points_ = 0.0;

    Criterion() = default;

public:
    /**
     * @brief 构造评分项，检查 id 与分值
     */
    static Result<Criterion> create(const std::string &id, const std::string &label,
                                    CriterionKind kind, const Json::Value &args,
                                    double max_points) {
        if (trim(id).empty()) {
            return Err<Criterion>(ErrorCode::RUBRIC_INVALID, "Criterion id must be non-empty");
        }
        if (!std::isfinite(max_points) || max_points < 0) {
            return Err<Criterion>(ErrorCode::RUBRIC_INVALID,
                "Criterion '" + id + "' has invalid maxPoints " + format_number(max_points));
        }
        if (!args.isNull() && !args.isObject()) {
            return Err<Criterion>(ErrorCode::RUBRIC_INVALID, "Criterion '" + id + "' args must be an object");
        }
        Criterion c;
        c.id_ = id;
        c.label_ = label;
        c.kind_ = kind;
        c.args_ = args.isNull() ? Json::Value(Json::objectValue) : args;
        c.max_points_ = max_points;
        return c;
    }

    const std::string& id() const { return id_; }
    const std::string& label() const { return label_; }
    CriterionKind kind() const { return kind_; }
    const Json::Value& args() const { return args_; }
    double max_points() const { return max_points_; }
    bool is_delegated() const { return kind_ == CriterionKind::DELEGATED; }
};

/**
 * @brief 评分标准中的一节
 */
class Section {
private:
    std::string id_;
    std::string title_;
    std::optional<double> points_cap_;
    std::vector<Criterion> criteria_;

    Section() = default;

public:
    static Result<Section> create(const std::string &id, const std::string &title,
                                  std::optional<double> points_cap,
                                  std::vector<Criterion> criteria) {
        if (trim(id).empty()) {
            return Err<Section>(ErrorCode::RUBRIC_INVALID, "Section id must be non-empty");
        }
        if (points_cap && (!std::isfinite(*points_cap) || *points_cap < 0)) {
            return Err<Section>(ErrorCode::RUBRIC_INVALID, "Section '" + id + "' has invalid points cap");
        }
        std::set<std::string> seen;
        for (const auto &c : criteria) {
            if (!seen.insert(c.id()).second) {
                return Err<Section>(ErrorCode::RUBRIC_INVALID,
                    "Duplicate criterion id '" + c.id() + "' in section '" + id + "'");
            }
        }
        Section s;
        s.id_ = id;
        s.title_ = title.empty() ? id : title;
        s.points_cap_ = points_cap;
        s.criteria_ = std::move(criteria);
        return s;
    }

    const std::string& id() const { return id_; }
    const std::string& title() const { return title_; }
    const std::optional<double>& points_cap() const { return points_cap_; }
    const std::vector<Criterion>& criteria() const { return criteria_; }

    /**
     * @brief 本节满分：有上限时取上限，否则为各评分项满分之和
     */
    double max_points() const {
        if (points_cap_) return *points_cap_;
        double sum = 0.0;
        for (const auto &c : criteria_) {
            sum += c.max_points();
        }
        return sum;
    }

    const Criterion* find_criterion(const std::string &cid) const {
        for (const auto &c : criteria_) {
            if (c.id() == cid) return &c;
        }
        return nullptr;
    }

    bool has_delegated() const {
        for (const auto &c : criteria_) {
            if (c.is_delegated()) return true;
        }
        return false;
    }
};

/**
 * @brief 评分标准，批量评分期间只读
 */
class Rubric {
private:
    std::vector<Section> sections_;

public:
    Rubric() = default;

    static Result<Rubric> create(std::vector<Section> sections) {
        std::set<std::string> seen;
        for (const auto &s : sections) {
            if (!seen.insert(s.id()).second) {
                return Err<Rubric>(ErrorCode::RUBRIC_INVALID, "Duplicate section id '" + s.id() + "'");
            }
        }
        Rubric r;
        r.sections_ = std::move(sections);
        return r;
    }

    const std::vector<Section>& sections() const { return sections_; }
    bool empty() const { return sections_.empty(); }

    const Section* find_section(const std::string &sid) const {
        for (const auto &s : sections_) {
            if (s.id() == sid) return &s;
        }
        return nullptr;
    }

    double total_points() const {
        double sum = 0.0;
        for (const auto &s : sections_) {
            sum += s.max_points();
        }
        return sum;
    }
};

//==============================================================================
// JSON 加载
//==============================================================================

namespace detail {

/**
 * @brief 读取数值字段，接受数字或数字字符串；缺失时返回 def
 */
inline Result<double> json_number(const Json::Value &v, const std::string &what, double def) {
    if (v.isNull()) return def;
    if (v.isNumeric()) return v.asDouble();
    if (v.isString()) {
        std::string s = trim(v.asString());
        if (s.empty()) return def;
        char *end = nullptr;
        double d = strtod(s.c_str(), &end);
        if (end && *end == '\0') return d;
    }
    return Err<double>(ErrorCode::RUBRIC_INVALID, what + " is not a number");
}

inline std::string json_str(const Json::Value &v) {
    if (v.isString()) return v.asString();
    if (v.isNumeric() || v.isBool()) return trim(v.asString());
    return "";
}

} // namespace detail

/**
 * @brief 从 JSON 值构造 Rubric
 *
 * 接受 {"sections": [{"id", "title", "points", "criteria": [{"id", "criterion"|"label",
 * "type"|"kind", "args", "max"|"max_points"}]}]}
 */
inline Result<Rubric> rubric_from_json(const Json::Value &root) {
    if (!root.isObject() || !root["sections"].isArray()) {
        return Err<Rubric>(ErrorCode::RUBRIC_INVALID, "Rubric missing 'sections' array");
    }

    std::vector<Section> sections;
    for (const auto &js : root["sections"]) {
        if (!js.isObject() || !js.isMember("id") || !js["criteria"].isArray()) {
            return Err<Rubric>(ErrorCode::RUBRIC_INVALID, "Section must have 'id' and 'criteria'");
        }
        std::string sid = detail::json_str(js["id"]);

        std::vector<Criterion> criteria;
        for (const auto &jc : js["criteria"]) {
            if (!jc.isObject()) {
                return Err<Rubric>(ErrorCode::RUBRIC_INVALID, "Criterion in section '" + sid + "' is not an object");
            }
            std::string cid = detail::json_str(jc["id"]);
            std::string raw_kind = jc.isMember("type") ? detail::json_str(jc["type"]) : detail::json_str(jc["kind"]);
            auto kind = parse_criterion_kind(raw_kind);
            if (!kind) {
                return Err<Rubric>(ErrorCode::RUBRIC_INVALID,
                    "Criterion '" + sid + "." + cid + "' has unsupported type '" + raw_kind + "'");
            }
            const Json::Value &jmax = jc.isMember("max") ? jc["max"] : jc["max_points"];
            NBG_TRY_UNWRAP(max_points, detail::json_number(jmax, "Criterion '" + sid + "." + cid + "' max", 0.0));

            std::string label = jc.isMember("criterion") ? detail::json_str(jc["criterion"])
                                                         : detail::json_str(jc["label"]);
            NBG_TRY_UNWRAP(criterion, Criterion::create(cid, label, *kind, jc["args"], max_points));
            criteria.push_back(std::move(criterion));
        }

        NBG_TRY_UNWRAP(points, detail::json_number(js["points"], "Section '" + sid + "' points", 0.0));
        std::optional<double> cap;
        if (points > 0) {
            cap = points;
        }
        NBG_TRY_UNWRAP(section, Section::create(sid, detail::json_str(js["title"]), cap, std::move(criteria)));
        sections.push_back(std::move(section));
    }
    return Rubric::create(std::move(sections));
}

/**
 * @brief 从 JSON 文件加载 Rubric
 */
inline Result<Rubric> load_rubric_file(const std::string &path) {
    std::string text;
    if (!read_file(path, text)) {
        return Err<Rubric>(ErrorCode::FILE_NOT_FOUND, "Cannot read rubric file: " + path);
    }
    Json::Value root;
    std::string errs;
    if (!parse_json(text, root, errs)) {
        return Err<Rubric>(ErrorCode::RUBRIC_PARSE_ERROR, "Invalid rubric JSON: " + errs);
    }
    return rubric_from_json(root);
}

} // namespace nbgrade

#endif // NBGRADE_CORE_RUBRIC_H
