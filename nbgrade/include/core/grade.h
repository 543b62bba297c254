/**
 * @file grade.h
 * @brief 评分结果、人工覆盖与汇总
 *
 * - CriterionGrade: 单项得分，构造时钳制到 [0, maxPoints]
 * - SectionGrade: 一节的得分
 * - OverrideTable: (subject, section) -> 覆盖分值
 * - aggregate: 计算原始总分、覆盖后总分与满分
 */

#ifndef NBGRADE_CORE_GRADE_H
#define NBGRADE_CORE_GRADE_H

#include <string>
#include <vector>
#include <map>
#include <cmath>
#include <algorithm>
#include <mutex>
#include <optional>
#include <json/json.h>

#include "core/error.h"
#include "core/utils.h"

namespace nbgrade {

inline double clamp_score(double v, double max_points) {
    if (!std::isfinite(v)) return 0.0;
    return std::max(0.0, std::min(v, max_points));
}

/**
 * @brief 单个评分项的得分
 */
class CriterionGrade {
private:
    std::string criterion_id_;
    std::string label_;
    double max_points_ = 0.0;
    double score_ = 0.0;
    std::string rationale_;
    std::string improvement_note_;

public:
    CriterionGrade() = default;

    /**
     * @param score 超出 [0, max_points] 的值会被钳制，非有限值记为 0
     */
    CriterionGrade(const std::string &criterion_id, const std::string &label,
                   double max_points, double score,
                   const std::string &rationale = "", const std::string &improvement_note = "")
        : criterion_id_(criterion_id), label_(label),
          max_points_(std::isfinite(max_points) ? std::max(0.0, max_points) : 0.0),
          rationale_(rationale), improvement_note_(improvement_note) {
        score_ = clamp_score(score, max_points_);
    }

    const std::string& criterion_id() const { return criterion_id_; }
    const std::string& label() const { return label_; }
    double max_points() const { return max_points_; }
    double score() const { return score_; }
    const std::string& rationale() const { return rationale_; }
    const std::string& improvement_note() const { return improvement_note_; }

    bool full_credit() const { return score_ >= max_points_; }

    Json::Value to_json() const {
        Json::Value j(Json::objectValue);
        j["criterionId"] = criterion_id_;
        j["label"] = label_;
        j["maxPoints"] = max_points_;
        j["score"] = score_;
        j["rationale"] = rationale_;
        j["improvementNote"] = improvement_note_;
        return j;
    }
};

/**
 * @brief 一节的得分
 */
struct SectionGrade {
    std::string section_id;
    std::string title;
    double max_points = 0.0;
    std::vector<CriterionGrade> criteria;
    std::string overall_comment;

    /**
     * @brief 各项得分之和，不超过本节满分
     */
    double earned_points() const {
        double sum = 0.0;
        for (const auto &c : criteria) {
            sum += c.score();
        }
        return std::min(sum, max_points);
    }

    Json::Value to_json() const {
        Json::Value j(Json::objectValue);
        j["sectionId"] = section_id;
        j["title"] = title;
        j["maxPoints"] = max_points;
        j["earnedPoints"] = earned_points();
        Json::Value arr(Json::arrayValue);
        for (const auto &c : criteria) {
            arr.append(c.to_json());
        }
        j["criteria"] = arr;
        j["overallComment"] = overall_comment;
        return j;
    }
};

/**
 * @brief 一个评分对象的全部小节得分，按评分标准顺序
 */
struct SectionGradeSheet {
    std::vector<SectionGrade> sections;

    const SectionGrade* find(const std::string &section_id) const {
        for (const auto &s : sections) {
            if (s.section_id == section_id) return &s;
        }
        return nullptr;
    }
};

/**
 * @brief 人工覆盖表
 *
 * 覆盖值只替换汇总时的节得分，不修改 SectionGrade。
 */
class OverrideTable {
private:
    std::map<std::pair<std::string, std::string>, double> values_;
    mutable std::mutex mtx_;

public:
    OverrideTable() = default;

    OverrideTable(const OverrideTable &o) {
        std::lock_guard<std::mutex> lock(o.mtx_);
        values_ = o.values_;
    }

    /**
     * @brief 记录覆盖值；负数或非有限值被拒绝
     */
    Result<void> set(const std::string &subject_id, const std::string &section_id, double value) {
        if (!std::isfinite(value) || value < 0) {
            return Err(ErrorCode::CONFIG_INVALID_VALUE,
                "Override for " + subject_id + "/" + section_id + " must be a finite non-negative number");
        }
        std::lock_guard<std::mutex> lock(mtx_);
        values_[{subject_id, section_id}] = value;
        return Ok();
    }

    void clear(const std::string &subject_id, const std::string &section_id) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.erase({subject_id, section_id});
    }

    std::optional<double> get(const std::string &subject_id, const std::string &section_id) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find({subject_id, section_id});
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @brief 某个评分对象的全部覆盖值
     */
    std::map<std::string, double> for_subject(const std::string &subject_id) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::map<std::string, double> out;
        for (const auto &kv : values_) {
            if (kv.first.first == subject_id) {
                out[kv.first.second] = kv.second;
            }
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.size();
    }
};

/**
 * @brief 汇总结果
 */
struct GradeTotals {
    double raw_earned = 0.0;                   ///< 不含覆盖
    double earned_with_overrides = 0.0;
    double max_points = 0.0;
    std::map<std::string, double> effective;   ///< section id -> 生效得分

    Json::Value to_json() const {
        Json::Value j(Json::objectValue);
        j["rawEarned"] = raw_earned;
        j["earnedWithOverrides"] = earned_with_overrides;
        j["maxPoints"] = max_points;
        Json::Value eff(Json::objectValue);
        for (const auto &kv : effective) {
            eff[kv.first] = kv.second;
        }
        j["effective"] = eff;
        return j;
    }
};

/**
 * @brief 汇总一个评分对象的得分，覆盖值在此处钳制到 [0, 节满分]
 */
inline GradeTotals aggregate(const std::string &subject_id, const SectionGradeSheet &sheet,
                             const OverrideTable &overrides) {
    GradeTotals t;
    for (const auto &s : sheet.sections) {
        double raw = s.earned_points();
        double eff = raw;
        auto ov = overrides.get(subject_id, s.section_id);
        if (ov) {
            eff = clamp_score(*ov, s.max_points);
        }
        t.raw_earned += raw;
        t.earned_with_overrides += eff;
        t.max_points += s.max_points;
        t.effective[s.section_id] = eff;
    }
    return t;
}

/**
 * @brief 每个评分项一行反馈
 */
inline std::vector<std::string> feedback_bullets(const SectionGrade &grade) {
    std::vector<std::string> out;
    for (const auto &c : grade.criteria) {
        std::string name = c.label().empty() ? c.criterion_id() : c.label();
        std::string line;
        if (c.max_points() > 0 && c.full_credit()) {
            line = "Met: " + name;
        } else if (c.score() <= 0) {
            line = "Not met: " + name;
        } else {
            line = "Partial credit (" + format_number(c.score()) + "/" + format_number(c.max_points()) + "): " + name;
        }
        if (!c.rationale().empty()) {
            line += " - " + c.rationale();
        }
        if (!c.improvement_note().empty() && !c.full_credit()) {
            line += " Tip: " + c.improvement_note();
        }
        out.push_back(line);
    }
    return out;
}

} // namespace nbgrade

#endif // NBGRADE_CORE_GRADE_H
