/**
 * @file judgment.h
 * @brief 外部评判服务
 *
 * JudgmentService 接口接收一个小节的证据与交由服务评判的评分项，返回原始响应文本
 * （期望为 JSON 对象）。响应的解析与容错在 orchestrator.h 中完成。
 * HTTP 实现见 http_judgment.h。
 */

#ifndef NBGRADE_GRADING_JUDGMENT_H
#define NBGRADE_GRADING_JUDGMENT_H

#include <string>
#include <vector>
#include <json/json.h>

#include "core/error.h"
#include "core/rubric.h"
#include "core/utils.h"

namespace nbgrade {

/// 评判服务收到的统一说明
constexpr const char* JUDGMENT_INSTRUCTIONS =
    "Score each criterion 0..maxPoints. If evidence is weak, award partial credit with rationale. "
    "If the output is not present, score 0 and explain.";

/**
 * @brief 一个小节的评判请求
 */
struct JudgmentRequest {
    std::string section_id;
    std::string title;
    double total_points = 0.0;
    std::vector<const Criterion*> criteria;     ///< 只含交由服务评判的评分项
    std::string evidence;
    std::string instructions = JUDGMENT_INSTRUCTIONS;

    Json::Value to_json() const {
        Json::Value slice(Json::objectValue);
        slice["title"] = title;
        slice["totalPoints"] = total_points;
        Json::Value list(Json::arrayValue);
        for (const Criterion *c : criteria) {
            Json::Value item(Json::objectValue);
            item["id"] = c->id();
            item["label"] = c->label();
            item["maxPoints"] = c->max_points();
            item["args"] = c->args();
            list.append(item);
        }
        slice["criteria"] = list;

        Json::Value j(Json::objectValue);
        j["sectionId"] = section_id;
        j["rubricSlice"] = slice;
        j["evidenceContext"] = evidence;
        j["instructions"] = instructions;
        return j;
    }
};

/**
 * @brief 评判服务接口，实现必须可在多个线程间共享
 */
class JudgmentService {
public:
    virtual ~JudgmentService() = default;

    /**
     * @brief 提交请求，返回服务给出的原始响应文本
     */
    virtual Result<std::string> judge(const JudgmentRequest &request) = 0;
};

/**
 * @brief 从 chat-completions 响应中取出第一个选项的消息内容
 *
 * 逐层检查类型，任何一层不符都返回 JUDGMENT_BAD_RESPONSE。
 */
inline Result<std::string> extract_chat_content(const std::string &response) {
    Json::Value root;
    std::string errs;
    if (!parse_json(response, root, errs) || !root.isObject()) {
        return Err<std::string>(ErrorCode::JUDGMENT_BAD_RESPONSE, "Response is not a JSON object: " + errs);
    }
    const Json::Value &choices = root["choices"];
    if (!choices.isArray() || choices.empty() || !choices[0].isObject()) {
        return Err<std::string>(ErrorCode::JUDGMENT_BAD_RESPONSE, "Response has no choices");
    }
    const Json::Value &message = choices[0]["message"];
    if (!message.isObject() || !message["content"].isString()) {
        return Err<std::string>(ErrorCode::JUDGMENT_BAD_RESPONSE, "Response has no message content");
    }
    return message["content"].asString();
}

} // namespace nbgrade

#endif // NBGRADE_GRADING_JUDGMENT_H
