/**
 * @file logger.h
 * @brief 轻量级日志系统
 *
 * 特性：
 * - 多日志级别 (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
 * - 控制台彩色输出 / 文件输出 / 内存输出（测试用）
 * - 时间戳、级别、位置前缀
 * - 线程安全（批量评测时多个 worker 共享同一日志器）
 */

#ifndef NBGRADE_CORE_LOGGER_H
#define NBGRADE_CORE_LOGGER_H

#include <string>
#include <fstream>
#include <iostream>
#include <sstream>
#include <ctime>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <algorithm>

namespace nbgrade {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    TRACE = 0,  ///< 最详细的跟踪信息
    DEBUG = 1,  ///< 调试信息（状态机迁移等）
    INFO  = 2,  ///< 一般信息
    WARN  = 3,  ///< 警告（可恢复的失败）
    ERROR = 4,  ///< 错误
    FATAL = 5,  ///< 致命错误
    OFF   = 6   ///< 关闭日志
};

inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

/**
 * @brief 从配置字符串解析日志级别（大小写不敏感），无法识别时返回 fallback
 */
inline LogLevel parse_log_level(std::string name, LogLevel fallback = LogLevel::INFO) {
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    if (name == "trace") return LogLevel::TRACE;
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    if (name == "off")   return LogLevel::OFF;
    return fallback;
}

inline const char* level_to_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        default: return "";
    }
}

/**
 * @brief 日志输出接口
 */
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, const std::string &message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 控制台输出，WARN 及以上写 stderr
 */
class ConsoleSink : public LogSink {
private:
    bool use_color_;
    std::mutex mutex_;

public:
    explicit ConsoleSink(bool use_color = true) : use_color_(use_color) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream &out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        if (use_color_) {
            out << level_to_color(level) << message << "\033[0m" << std::endl;
        } else {
            out << message << std::endl;
        }
    }

    void flush() override {
        std::cout.flush();
        std::cerr.flush();
    }
};

/**
 * @brief 文件输出
 */
class FileSink : public LogSink {
private:
    std::ofstream file_;
    std::mutex mutex_;
    bool auto_flush_;

public:
    explicit FileSink(const std::string &filename, bool append = true, bool auto_flush = false)
        : auto_flush_(auto_flush) {
        file_.open(filename, append ? std::ios::app : std::ios::trunc);
    }

    bool is_open() const { return file_.is_open(); }

    void write(LogLevel, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!file_.is_open()) return;
        file_ << message << '\n';
        if (auto_flush_) {
            file_.flush();
        }
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }
};

/**
 * @brief 内存输出，保留最近的若干条日志
 *
 * 测试中用来断言某条警告确实被记录（例如依赖修复失败只记日志不报错）。
 */
class MemorySink : public LogSink {
private:
    std::vector<std::pair<LogLevel, std::string>> lines_;
    size_t capacity_;
    mutable std::mutex mutex_;

public:
    explicit MemorySink(size_t capacity = 1024) : capacity_(capacity) {}

    void write(LogLevel level, const std::string &message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.size() >= capacity_) {
            lines_.erase(lines_.begin());
        }
        lines_.emplace_back(level, message);
    }

    void flush() override {}

    bool contains(const std::string &needle, LogLevel min_level = LogLevel::TRACE) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &line : lines_) {
            if (line.first >= min_level && line.second.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
};

/**
 * @brief 日志记录器
 */
class Logger {
private:
    std::string name_;
    LogLevel level_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::mutex mutex_;
    bool show_timestamp_;
    bool show_name_;
    bool show_location_;

    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);
        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static std::string basename(const std::string &path) {
        size_t pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }

public:
    explicit Logger(const std::string &name = "nbgrade")
        : name_(name), level_(LogLevel::INFO),
          show_timestamp_(true), show_name_(false), show_location_(false) {}

    // 配置方法
    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& show_timestamp(bool show) { show_timestamp_ = show; return *this; }
    Logger& show_name(bool show) { show_name_ = show; return *this; }
    Logger& show_location(bool show) { show_location_ = show; return *this; }

    LogLevel level() const { return level_; }
    const std::string& name() const { return name_; }

    Logger& add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
        return *this;
    }

    Logger& add_console(bool use_color = true) {
        return add_sink(std::make_shared<ConsoleSink>(use_color));
    }

    /**
     * @brief 添加文件输出，文件无法打开时静默忽略
     */
    Logger& add_file(const std::string &filename, bool append = true) {
        auto sink = std::make_shared<FileSink>(filename, append);
        if (sink->is_open()) {
            add_sink(sink);
        }
        return *this;
    }

    void clear_sinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->flush();
        }
    }

    /**
     * @brief 核心日志方法
     */
    void log(LogLevel level, const char *file, int line, const std::string &message) {
        if (level < level_) return;

        std::ostringstream oss;
        if (show_timestamp_) {
            oss << "[" << get_timestamp() << "] ";
        }
        oss << "[" << level_to_string(level) << "] ";
        if (show_name_) {
            oss << "[" << name_ << "] ";
        }
        if (show_location_ && file) {
            oss << "[" << basename(file) << ":" << line << "] ";
        }
        oss << message;

        std::string formatted = oss.str();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &sink : sinks_) {
            sink->write(level, formatted);
        }
    }

    /**
     * @brief printf 风格日志
     */
    void logf(LogLevel level, const char *file, int line, const char *fmt, ...) {
        if (level < level_) return;

        char buffer[4096];
        va_list args;
        va_start(args, fmt);
        vsnprintf(buffer, sizeof(buffer), fmt, args);
        va_end(args);

        log(level, file, line, buffer);
    }
};

/**
 * @brief 全局默认日志器
 */
inline Logger& default_logger() {
    static Logger logger("nbgrade");
    static std::once_flag initialized;
    std::call_once(initialized, [] { logger.add_console(true); });
    return logger;
}

/**
 * @brief 流式日志构建器，析构时提交
 */
class LogStream {
private:
    Logger &logger_;
    LogLevel level_;
    const char *file_;
    int line_;
    std::ostringstream stream_;

public:
    LogStream(Logger &logger, LogLevel level, const char *file, int line)
        : logger_(logger), level_(level), file_(file), line_(line) {}

    ~LogStream() {
        logger_.log(level_, file_, line_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T &value) {
        stream_ << value;
        return *this;
    }
};

} // namespace nbgrade

//==============================================================================
// 日志宏
//==============================================================================

#define LOG_SET_LEVEL(level) nbgrade::default_logger().set_level(level)

#define LOG_TRACE nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::TRACE, __FILE__, __LINE__)
#define LOG_DEBUG nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOG_INFO  nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::INFO,  __FILE__, __LINE__)
#define LOG_WARN  nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::WARN,  __FILE__, __LINE__)
#define LOG_ERROR nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::ERROR, __FILE__, __LINE__)
#define LOG_FATAL nbgrade::LogStream(nbgrade::default_logger(), nbgrade::LogLevel::FATAL, __FILE__, __LINE__)

#define LOG_INFOF(fmt, ...)  nbgrade::default_logger().logf(nbgrade::LogLevel::INFO,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARNF(fmt, ...)  nbgrade::default_logger().logf(nbgrade::LogLevel::WARN,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERRORF(fmt, ...) nbgrade::default_logger().logf(nbgrade::LogLevel::ERROR, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

/**
 * @brief 自定义日志器的日志宏
 */
#define LOGGER_TRACE(logger) nbgrade::LogStream(logger, nbgrade::LogLevel::TRACE, __FILE__, __LINE__)
#define LOGGER_DEBUG(logger) nbgrade::LogStream(logger, nbgrade::LogLevel::DEBUG, __FILE__, __LINE__)
#define LOGGER_INFO(logger)  nbgrade::LogStream(logger, nbgrade::LogLevel::INFO,  __FILE__, __LINE__)
#define LOGGER_WARN(logger)  nbgrade::LogStream(logger, nbgrade::LogLevel::WARN,  __FILE__, __LINE__)
#define LOGGER_ERROR(logger) nbgrade::LogStream(logger, nbgrade::LogLevel::ERROR, __FILE__, __LINE__)
#define LOGGER_FATAL(logger) nbgrade::LogStream(logger, nbgrade::LogLevel::FATAL, __FILE__, __LINE__)

#endif // NBGRADE_CORE_LOGGER_H
