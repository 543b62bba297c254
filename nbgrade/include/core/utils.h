/**
 * @file utils.h
 * @brief 工具函数
 *
 * 包含各种辅助函数：
 * - 文件操作
 * - 字符串处理
 * - JSON 辅助（jsoncpp）
 */

#ifndef NBGRADE_CORE_UTILS_H
#define NBGRADE_CORE_UTILS_H

#include <string>
#include <vector>
#include <sstream>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <memory>
#include <json/json.h>

namespace nbgrade {

//==============================================================================
// 文件操作
//==============================================================================

/**
 * @brief 读取整个文件
 * @return 是否成功
 */
inline bool read_file(const std::string &path, std::string &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

inline bool write_file(const std::string &path, const std::string &content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        return false;
    }
    f << content;
    return static_cast<bool>(f);
}

inline bool file_exists(const std::string &path) {
    std::ifstream f(path);
    return static_cast<bool>(f);
}

//==============================================================================
// 字符串处理
//==============================================================================

inline std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

inline std::vector<std::string> split(const std::string &s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, sep)) {
        out.push_back(cur);
    }
    return out;
}

inline std::vector<std::string> split_lines(const std::string &s) {
    return split(s, '\n');
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

inline bool starts_with(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @brief 截断过长文本，超出部分以可见标记替代
 */
inline std::string clip_text(const std::string &s, size_t max_chars,
                             const std::string &marker = " ...[truncated]") {
    if (s.size() <= max_chars) {
        return s;
    }
    return s.substr(0, max_chars) + marker;
}

/**
 * @brief 转义正则元字符，用于把评分标准中的 id 嵌入模式
 */
inline std::string regex_escape(const std::string &s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

/**
 * @brief 数值格式化，去掉多余的尾零（2 -> "2", 2.5 -> "2.5"）
 */
inline std::string format_number(double v) {
    std::ostringstream oss;
    oss.precision(10);
    oss << v;
    return oss.str();
}

//==============================================================================
// JSON 辅助
//==============================================================================

/**
 * @brief 解析 JSON 文本
 * @param errs 失败时的错误描述
 */
inline bool parse_json(const std::string &text, Json::Value &out, std::string &errs) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(text.data(), text.data() + text.size(), &out, &errs);
}

/**
 * @brief 紧凑单行输出
 */
inline std::string to_json_line(const Json::Value &v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}

inline std::string to_json_pretty(const Json::Value &v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, v);
}

/**
 * @brief 读取 nbformat 风格的多行文本：字符串或字符串数组
 */
inline std::string json_multiline(const Json::Value &v) {
    if (v.isString()) {
        return v.asString();
    }
    std::string out;
    if (v.isArray()) {
        for (const auto &part : v) {
            if (part.isString()) {
                out += part.asString();
            }
        }
    }
    return out;
}

} // namespace nbgrade

#endif // NBGRADE_CORE_UTILS_H
