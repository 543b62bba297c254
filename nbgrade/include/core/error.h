/**
 * @file error.h
 * @brief 统一错误处理机制
 *
 * 提供：
 * - Result<T> 类型：类似 Rust 的结果类型
 * - Error 类
 * - 错误码定义
 * - 错误传播宏
 *
 * 注意：文档执行中的错误（超时、缺少依赖、运行时错误）属于数据，
 * 记录在 ExecutionResult 中，不使用此处的 Error 传播。
 */

#ifndef NBGRADE_CORE_ERROR_H
#define NBGRADE_CORE_ERROR_H

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <ostream>

namespace nbgrade {

//==============================================================================
// 错误码定义
//==============================================================================

enum class ErrorCode {
    OK = 0,

    // 文件操作错误 (1xx)
    FILE_NOT_FOUND = 100,
    FILE_READ_ERROR = 101,
    FILE_WRITE_ERROR = 102,
    DIRECTORY_ERROR = 103,

    // 配置错误 (2xx)
    CONFIG_PARSE_ERROR = 200,
    CONFIG_MISSING_KEY = 201,
    CONFIG_INVALID_VALUE = 202,

    // 文档与评分标准 (3xx)
    DOCUMENT_PARSE_ERROR = 300,
    RUBRIC_PARSE_ERROR = 301,
    RUBRIC_INVALID = 302,
    PROBE_INVALID = 303,

    // 沙箱与依赖 (4xx)
    SANDBOX_ERROR = 400,
    SANDBOX_TIMEOUT = 401,
    SANDBOX_PROTOCOL_ERROR = 402,
    INTERPRETER_NOT_FOUND = 403,
    DEPENDENCY_INSTALL_FAILED = 404,

    // 评分服务 (5xx)
    JUDGMENT_TRANSPORT_ERROR = 500,
    JUDGMENT_BAD_RESPONSE = 501,

    // 系统错误 (9xx)
    SYSTEM_ERROR = 900,
    FORK_FAILED = 901,
    EXEC_FAILED = 902,
    PIPE_FAILED = 903,
    UNKNOWN_ERROR = 999
};

/**
 * @brief 错误码转字符串
 */
inline const char* error_code_str(ErrorCode code);

/**
 * @brief 错误码输出流运算符
 */
inline std::ostream& operator<<(std::ostream &os, ErrorCode code) {
    return os << error_code_str(code);
}

inline const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::DIRECTORY_ERROR: return "DIRECTORY_ERROR";
        case ErrorCode::CONFIG_PARSE_ERROR: return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_MISSING_KEY: return "CONFIG_MISSING_KEY";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::DOCUMENT_PARSE_ERROR: return "DOCUMENT_PARSE_ERROR";
        case ErrorCode::RUBRIC_PARSE_ERROR: return "RUBRIC_PARSE_ERROR";
        case ErrorCode::RUBRIC_INVALID: return "RUBRIC_INVALID";
        case ErrorCode::PROBE_INVALID: return "PROBE_INVALID";
        case ErrorCode::SANDBOX_ERROR: return "SANDBOX_ERROR";
        case ErrorCode::SANDBOX_TIMEOUT: return "SANDBOX_TIMEOUT";
        case ErrorCode::SANDBOX_PROTOCOL_ERROR: return "SANDBOX_PROTOCOL_ERROR";
        case ErrorCode::INTERPRETER_NOT_FOUND: return "INTERPRETER_NOT_FOUND";
        case ErrorCode::DEPENDENCY_INSTALL_FAILED: return "DEPENDENCY_INSTALL_FAILED";
        case ErrorCode::JUDGMENT_TRANSPORT_ERROR: return "JUDGMENT_TRANSPORT_ERROR";
        case ErrorCode::JUDGMENT_BAD_RESPONSE: return "JUDGMENT_BAD_RESPONSE";
        case ErrorCode::SYSTEM_ERROR: return "SYSTEM_ERROR";
        case ErrorCode::FORK_FAILED: return "FORK_FAILED";
        case ErrorCode::EXEC_FAILED: return "EXEC_FAILED";
        case ErrorCode::PIPE_FAILED: return "PIPE_FAILED";
        default: return "UNKNOWN_ERROR";
    }
}

//==============================================================================
// Error 类
//==============================================================================

/**
 * @brief 错误信息类
 */
class Error {
private:
    ErrorCode code_;
    std::string message_;
    std::string file_;
    int line_;
    std::string context_;

public:
    Error() : code_(ErrorCode::OK), line_(0) {}

    Error(ErrorCode code, const std::string &message = "")
        : code_(code), message_(message), line_(0) {}

    Error(ErrorCode code, const std::string &message,
          const char *file, int line)
        : code_(code), message_(message), file_(file ? file : ""), line_(line) {}

    // 链式设置
    Error& with_context(const std::string &ctx) {
        context_ = ctx;
        return *this;
    }

    // 访问器
    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& file() const { return file_; }
    int line() const { return line_; }
    const std::string& context() const { return context_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }  // true 表示有错误

    /**
     * @brief 格式化错误信息
     */
    std::string to_string() const {
        std::ostringstream oss;
        oss << "[" << error_code_str(code_) << "]";
        if (!message_.empty()) {
            oss << " " << message_;
        }
        if (!context_.empty()) {
            oss << " (context: " << context_ << ")";
        }
        return oss.str();
    }
};

//==============================================================================
// Result<T> 类型
//==============================================================================

/**
 * @brief 结果类型，类似 Rust 的 Result<T, E>
 *
 * 用法：
 *   Result<Rubric> load_rubric(const std::string &path);
 *
 *   auto result = load_rubric("rubric.json");
 *   if (result.ok()) {
 *       Rubric rubric = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template<typename T>
class Result {
private:
    std::variant<T, Error> data_;

public:
    // 成功构造
    Result(const T &value) : data_(value) {}
    Result(T &&value) : data_(std::move(value)) {}

    // 错误构造
    Result(const Error &err) : data_(err) {}
    Result(Error &&err) : data_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : data_(Error(code, msg)) {}

    // 状态检查
    bool ok() const { return std::holds_alternative<T>(data_); }
    bool is_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return ok(); }

    // 值访问
    T& value() & { return std::get<T>(data_); }
    const T& value() const & { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    // 带默认值的值访问
    T value_or(const T &default_val) const {
        return ok() ? std::get<T>(data_) : default_val;
    }

    // 错误访问
    Error& error() & { return std::get<Error>(data_); }
    const Error& error() const & { return std::get<Error>(data_); }

    // 解包（如果错误则抛异常）
    T& unwrap() & {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }

    const T& unwrap() const & {
        if (is_error()) {
            throw std::runtime_error(error().to_string());
        }
        return value();
    }
};

/**
 * @brief 无值的结果类型（仅表示成功/失败）
 */
template<>
class Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() : error_(std::nullopt) {}  // 成功
    Result(const Error &err) : error_(err) {}
    Result(Error &&err) : error_(std::move(err)) {}
    Result(ErrorCode code, const std::string &msg = "")
        : error_(Error(code, msg)) {}

    bool ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }
    explicit operator bool() const { return ok(); }

    Error& error() { return *error_; }
    const Error& error() const { return *error_; }
};

//==============================================================================
// 便捷函数
//==============================================================================

/**
 * @brief 创建成功结果
 */
template<typename T>
Result<std::decay_t<T>> Ok(T &&value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

/**
 * @brief 创建错误结果
 */
template<typename T = void>
Result<T> Err(ErrorCode code, const std::string &message = "") {
    return Result<T>(Error(code, message));
}

template<typename T = void>
Result<T> Err(const Error &err) {
    return Result<T>(err);
}

//==============================================================================
// 错误处理宏
//==============================================================================

/**
 * @brief 创建带位置信息的错误
 */
#define NBG_ERROR(code, msg) \
    nbgrade::Error(code, msg, __FILE__, __LINE__)

/**
 * @brief 如果结果是错误，则返回错误（类似 Rust 的 ? 操作符）
 */
#define NBG_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) { \
            return _result.error(); \
        } \
    } while (0)

/**
 * @brief 如果结果是错误，则返回错误；否则解包值
 */
#define NBG_TRY_UNWRAP(var, expr) \
    auto _tmp_##var = (expr); \
    if (_tmp_##var.is_error()) { \
        return _tmp_##var.error(); \
    } \
    auto var = std::move(_tmp_##var.value())

/**
 * @brief 断言条件，失败时返回错误
 */
#define NBG_ENSURE(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return NBG_ERROR(code, msg); \
        } \
    } while (0)

} // namespace nbgrade

#endif // NBGRADE_CORE_ERROR_H
