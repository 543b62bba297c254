/**
 * @file http_judgment.h
 * @brief 基于 libcurl 的评判服务
 *
 * 向兼容 OpenAI chat-completions 的接口发送请求（response_format 为 JSON 对象），
 * 返回第一个选项的消息内容。API key 从配置指定的环境变量读取。
 */

#ifndef NBGRADE_GRADING_HTTP_JUDGMENT_H
#define NBGRADE_GRADING_HTTP_JUDGMENT_H

#include <string>
#include <cstdlib>
#include <json/json.h>
#include <curl/curl.h>

#include "core/error.h"
#include "core/utils.h"
#include "core/grader_logger.h"
#include "grading/judgment.h"

namespace nbgrade {

/**
 * @brief HTTP 评判服务配置
 */
struct HttpJudgmentConfig {
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4o-mini";
    std::string api_key_env = "OPENAI_API_KEY";
    long timeout_seconds = 120;
    double temperature = 0.0;
};

namespace detail {

inline size_t curl_collect(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * @brief 进程级 curl 初始化，只做一次
 */
inline void curl_global_once() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        SLOG_ERROR << "curl_global_init failed: " << curl_easy_strerror(rc);
    }
}

} // namespace detail

class HttpJudgmentService : public JudgmentService {
private:
    HttpJudgmentConfig config_;

    Json::Value build_body(const JudgmentRequest &request) const {
        Json::Value system(Json::objectValue);
        system["role"] = "system";
        system["content"] =
            "You are a strict TA grading one section of a student's data-analysis notebook. "
            "Use only the evidence provided. Return ONLY valid JSON of the form "
            "{\"sectionId\": str, \"criteria\": [{\"criterionId\": str, \"label\": str, "
            "\"score\": number, \"rationale\": str, \"improvementNote\": str}], "
            "\"overallComment\": str}.";

        Json::Value user(Json::objectValue);
        user["role"] = "user";
        user["content"] = to_json_line(request.to_json());

        Json::Value messages(Json::arrayValue);
        messages.append(system);
        messages.append(user);

        Json::Value body(Json::objectValue);
        body["model"] = config_.model;
        body["temperature"] = config_.temperature;
        body["messages"] = messages;
        body["response_format"]["type"] = "json_object";
        return body;
    }

public:
    explicit HttpJudgmentService(const HttpJudgmentConfig &config = HttpJudgmentConfig())
        : config_(config) {
        detail::curl_global_once();
    }

    Result<std::string> judge(const JudgmentRequest &request) override {
        const char *key = std::getenv(config_.api_key_env.c_str());
        if (!key || !*key) {
            return Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR,
                "API key variable " + config_.api_key_env + " is not set");
        }

        CURL *curl = curl_easy_init();
        if (!curl) {
            return Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR, "curl_easy_init failed");
        }

        std::string payload = to_json_line(build_body(request));
        std::string response;
        std::string auth = std::string("Authorization: Bearer ") + key;

        struct curl_slist *headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, auth.c_str());

        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, config_.timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, detail::curl_collect);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        SLOG_DEBUG << "POST " << config_.endpoint << " section " << request.section_id
                   << " (" << request.criteria.size() << " criteria)";
        CURLcode rc = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            return Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR,
                std::string("HTTP request failed: ") + curl_easy_strerror(rc));
        }
        if (status < 200 || status >= 300) {
            return Err<std::string>(ErrorCode::JUDGMENT_TRANSPORT_ERROR,
                "HTTP status " + std::to_string(status) + ": " + clip_text(trim(response), 300, "..."));
        }

        return extract_chat_content(response);
    }
};

} // namespace nbgrade

#endif // NBGRADE_GRADING_HTTP_JUDGMENT_H
