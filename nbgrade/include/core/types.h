/**
 * @file types.h
 * @brief 核心数据结构定义
 *
 * 包含执行阶段使用的所有基础数据结构：
 * - Output / Block / Document: 计算文档
 * - ExecError: 执行错误（作为数据记录，不抛出）
 * - ProbeValue / ProbeSet / ProbeResults: 探针
 * - ExecutionResult: 一次执行请求的结果
 */

#ifndef NBGRADE_CORE_TYPES_H
#define NBGRADE_CORE_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <set>
#include <utility>
#include <sstream>
#include "core/error.h"

namespace nbgrade {

//==============================================================================
// 文档
//==============================================================================

enum class BlockKind {
    NARRATIVE,   ///< 说明文字（markdown / raw）
    EXECUTABLE   ///< 可执行代码
};

enum class OutputKind {
    STREAM_TEXT,        ///< stdout / stderr 文本
    STRUCTURED_RESULT,  ///< 表达式结果或显示数据（MIME bundle）
    ERROR               ///< 执行出错
};

/**
 * @brief 单条输出记录
 */
struct Output {
    OutputKind kind = OutputKind::STREAM_TEXT;
    std::string stream_name;                   ///< STREAM_TEXT: "stdout" / "stderr"
    std::string text;                          ///< 文本内容，结构化结果为 text/plain
    std::map<std::string, std::string> mime;   ///< STRUCTURED_RESULT 的其它表示
    bool is_display = false;                   ///< display_data 而非 execute_result
    std::string error_name;                    ///< ERROR: 异常类型名
    std::vector<std::string> trace;            ///< ERROR: 回溯

    static Output stream(const std::string &name, const std::string &text) {
        Output o;
        o.kind = OutputKind::STREAM_TEXT;
        o.stream_name = name;
        o.text = text;
        return o;
    }

    static Output result(const std::string &plain) {
        Output o;
        o.kind = OutputKind::STRUCTURED_RESULT;
        o.text = plain;
        return o;
    }

    static Output error(const std::string &name, const std::string &value,
                        const std::vector<std::string> &trace = {}) {
        Output o;
        o.kind = OutputKind::ERROR;
        o.error_name = name;
        o.text = value;
        o.trace = trace;
        return o;
    }
};

/**
 * @brief 文档中的一个单元
 */
struct Block {
    BlockKind kind = BlockKind::EXECUTABLE;
    std::string source;
    std::vector<Output> outputs;
    std::set<std::string> tags;
    int execution_count = 0;    ///< 0 表示未执行

    bool is_narrative() const { return kind == BlockKind::NARRATIVE; }
    bool is_executable() const { return kind == BlockKind::EXECUTABLE; }

    static Block narrative(const std::string &src) {
        Block b;
        b.kind = BlockKind::NARRATIVE;
        b.source = src;
        return b;
    }

    static Block code(const std::string &src) {
        Block b;
        b.kind = BlockKind::EXECUTABLE;
        b.source = src;
        return b;
    }
};

/**
 * @brief 计算文档：有序的 Block 序列
 *
 * 加载后不再修改；执行控制器每次运行都产生新的 Document。
 */
struct Document {
    std::vector<Block> blocks;
    std::string language = "python";   ///< 内核语言（来自 metadata.kernelspec）

    size_t size() const { return blocks.size(); }
    bool empty() const { return blocks.empty(); }
};

//==============================================================================
// 执行错误
//==============================================================================

enum class ErrorCategory {
    TIMEOUT,              ///< 单元执行超过时间预算
    MISSING_DEPENDENCY,   ///< 模块 / 包缺失
    RUNTIME,              ///< 其它运行时错误
    RETRY_NOTICE          ///< 超时重试的提示记录（信息性）
};

inline const char* category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::TIMEOUT: return "Timeout";
        case ErrorCategory::MISSING_DEPENDENCY: return "MissingDependency";
        case ErrorCategory::RUNTIME: return "Runtime";
        case ErrorCategory::RETRY_NOTICE: return "RetryNotice";
        default: return "Unknown";
    }
}

/**
 * @brief 执行错误记录
 */
struct ExecError {
    ErrorCategory category = ErrorCategory::RUNTIME;
    std::string name;                  ///< 解释器侧的异常名，例如 ModuleNotFoundError
    std::string message;
    std::vector<std::string> trace;
    int block_index = -1;              ///< 出错单元在执行文档中的下标，-1 表示无

    ExecError() = default;
    ExecError(ErrorCategory cat, const std::string &n, const std::string &msg, int block = -1)
        : category(cat), name(n), message(msg), block_index(block) {}
};

/**
 * @brief 根据异常名和消息归类
 */
inline ErrorCategory classify_error(const std::string &name, const std::string &message) {
    if (name == "ModuleNotFoundError") {
        return ErrorCategory::MISSING_DEPENDENCY;
    }
    if (name == "ImportError" && message.find("No module named") != std::string::npos) {
        return ErrorCategory::MISSING_DEPENDENCY;
    }
    return ErrorCategory::RUNTIME;
}

//==============================================================================
// 探针
//==============================================================================

/**
 * @brief 探针值：统一的规范化形式
 *
 * 元组 / 数组一律变为 LIST；表达式失败为 ERROR 标记。
 */
struct ProbeValue {
    enum class Kind { NONE, NUMBER, STRING, LIST, ERROR };

    Kind kind = Kind::NONE;
    double number = 0.0;
    std::string text;                 ///< STRING 的值或 ERROR 的消息
    std::vector<ProbeValue> items;

    static ProbeValue none() { return ProbeValue(); }

    static ProbeValue of_number(double v) {
        ProbeValue p;
        p.kind = Kind::NUMBER;
        p.number = v;
        return p;
    }

    static ProbeValue of_string(const std::string &s) {
        ProbeValue p;
        p.kind = Kind::STRING;
        p.text = s;
        return p;
    }

    static ProbeValue of_list(std::vector<ProbeValue> items) {
        ProbeValue p;
        p.kind = Kind::LIST;
        p.items = std::move(items);
        return p;
    }

    static ProbeValue of_error(const std::string &msg) {
        ProbeValue p;
        p.kind = Kind::ERROR;
        p.text = msg;
        return p;
    }

    bool is_none() const { return kind == Kind::NONE; }
    bool is_number() const { return kind == Kind::NUMBER; }
    bool is_string() const { return kind == Kind::STRING; }
    bool is_list() const { return kind == Kind::LIST; }
    bool is_error() const { return kind == Kind::ERROR; }

    /**
     * @brief 用于评分理由的简短表示
     */
    std::string repr() const;

    bool operator==(const ProbeValue &o) const {
        return kind == o.kind && number == o.number && text == o.text && items == o.items;
    }
    bool operator!=(const ProbeValue &o) const { return !(*this == o); }
};

inline std::string ProbeValue::repr() const {
    switch (kind) {
        case Kind::NONE: return "None";
        case Kind::NUMBER: {
            std::ostringstream oss;
            oss.precision(10);
            oss << number;
            return oss.str();
        }
        case Kind::STRING: return "'" + text + "'";
        case Kind::ERROR: return "{error: " + text + "}";
        case Kind::LIST: {
            std::string out = "[";
            for (size_t i = 0; i < items.size(); i++) {
                if (i) out += ", ";
                out += items[i].repr();
            }
            return out + "]";
        }
    }
    return "?";
}

/**
 * @brief 探针集合：保持插入顺序的 id -> 表达式映射
 */
class ProbeSet {
private:
    std::vector<std::pair<std::string, std::string>> entries_;

public:
    /**
     * @brief 添加探针，id 为空或重复时拒绝
     */
    Result<void> add(const std::string &id, const std::string &expr) {
        if (id.empty() || expr.empty()) {
            return Err(ErrorCode::PROBE_INVALID, "Probe id and expression must be non-empty");
        }
        for (const auto &e : entries_) {
            if (e.first == id) {
                return Err(ErrorCode::PROBE_INVALID, "Duplicate probe id: " + id);
            }
        }
        entries_.emplace_back(id, expr);
        return Ok();
    }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
};

using ProbeResults = std::map<std::string, ProbeValue>;

//==============================================================================
// 执行结果
//==============================================================================

/**
 * @brief 执行控制器状态
 */
enum class ExecState {
    INIT,
    PREPARED,
    RUNNING,
    SUCCEEDED,
    TIMED_OUT,
    DEPENDENCY_MISSING,
    RETRYING,
    TERMINAL
};

inline const char* state_to_string(ExecState s) {
    switch (s) {
        case ExecState::INIT: return "Init";
        case ExecState::PREPARED: return "Prepared";
        case ExecState::RUNNING: return "Running";
        case ExecState::SUCCEEDED: return "Succeeded";
        case ExecState::TIMED_OUT: return "TimedOut";
        case ExecState::DEPENDENCY_MISSING: return "DependencyMissing";
        case ExecState::RETRYING: return "Retrying";
        case ExecState::TERMINAL: return "Terminal";
        default: return "Unknown";
    }
}

/**
 * @brief 一次执行请求的结果，返回后由调用方独占
 */
struct ExecutionResult {
    Document executed_document;
    std::string rendered_preview;
    double duration_seconds = 0.0;
    std::vector<ExecError> errors;       ///< 反映最后一次运行（外加重试提示）
    ProbeResults probe_results;
    ExecState final_state = ExecState::SUCCEEDED;
    int attempts = 0;                    ///< 实际运行沙箱的次数

    bool has_error(ErrorCategory cat) const {
        for (const auto &e : errors) {
            if (e.category == cat) return true;
        }
        return false;
    }

    size_t count_errors(ErrorCategory cat) const {
        size_t n = 0;
        for (const auto &e : errors) {
            if (e.category == cat) n++;
        }
        return n;
    }
};

} // namespace nbgrade

#endif // NBGRADE_CORE_TYPES_H
