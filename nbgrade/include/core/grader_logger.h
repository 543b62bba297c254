/**
 * @file grader_logger.h
 * @brief 评分系统专用日志配置
 *
 * 三个日志器：
 * - main：批量流程、配置、汇总（控制台 + 文件）
 * - exec：沙箱执行、重试、依赖修复
 * - grade：分段与评分
 */

#ifndef NBGRADE_CORE_GRADER_LOGGER_H
#define NBGRADE_CORE_GRADER_LOGGER_H

#include "core/logger.h"
#include <string>
#include <sys/stat.h>

namespace nbgrade {

/**
 * @brief 评分系统日志管理器
 */
class GraderLogger {
private:
    Logger main_logger_;
    Logger exec_logger_;
    Logger grade_logger_;
    std::string log_dir_;
    bool initialized_ = false;

public:
    explicit GraderLogger(const std::string &log_dir = "/tmp/nbgrade/log")
        : main_logger_("main"),
          exec_logger_("exec"),
          grade_logger_("grade"),
          log_dir_(log_dir) {}

    /**
     * @brief 初始化日志系统
     * @param level 三个日志器共用的级别
     * @param console exec/grade 的 WARN 以上是否也输出到控制台
     */
    void init(LogLevel level = LogLevel::INFO, bool console = true) {
        if (initialized_) return;
        mkdir(log_dir_.c_str(), 0755);

        main_logger_.set_level(level).show_location(level <= LogLevel::DEBUG);
        if (console) {
            main_logger_.add_console(true);
        }
        main_logger_.add_file(log_dir_ + "/main.log");

        exec_logger_.set_level(level).show_name(true).add_file(log_dir_ + "/exec.log");
        grade_logger_.set_level(level).show_name(true).add_file(log_dir_ + "/grade.log");
        if (console) {
            exec_logger_.add_console(true);
            grade_logger_.add_console(true);
        }
        initialized_ = true;
    }

    /**
     * @brief 设置日志目录（需要在 init 之前调用）
     */
    void set_log_dir(const std::string &dir) { log_dir_ = dir; }

    Logger& main()  { return main_logger_; }
    Logger& exec()  { return exec_logger_; }
    Logger& grade() { return grade_logger_; }

    void flush_all() {
        main_logger_.flush();
        exec_logger_.flush();
        grade_logger_.flush();
    }

    void set_all_levels(LogLevel level) {
        main_logger_.set_level(level);
        exec_logger_.set_level(level);
        grade_logger_.set_level(level);
    }
};

/**
 * @brief 获取全局评分日志器
 */
inline GraderLogger& grader_log() {
    static GraderLogger instance;
    return instance;
}

} // namespace nbgrade

//==============================================================================
// 专用日志宏
//==============================================================================

// 主日志
#define GLOG_DEBUG LOGGER_DEBUG(nbgrade::grader_log().main())
#define GLOG_INFO  LOGGER_INFO(nbgrade::grader_log().main())
#define GLOG_WARN  LOGGER_WARN(nbgrade::grader_log().main())
#define GLOG_ERROR LOGGER_ERROR(nbgrade::grader_log().main())

// 执行日志
#define ELOG_TRACE LOGGER_TRACE(nbgrade::grader_log().exec())
#define ELOG_DEBUG LOGGER_DEBUG(nbgrade::grader_log().exec())
#define ELOG_INFO  LOGGER_INFO(nbgrade::grader_log().exec())
#define ELOG_WARN  LOGGER_WARN(nbgrade::grader_log().exec())
#define ELOG_ERROR LOGGER_ERROR(nbgrade::grader_log().exec())

// 分段 / 评分日志
#define SLOG_DEBUG LOGGER_DEBUG(nbgrade::grader_log().grade())
#define SLOG_INFO  LOGGER_INFO(nbgrade::grader_log().grade())
#define SLOG_WARN  LOGGER_WARN(nbgrade::grader_log().grade())
#define SLOG_ERROR LOGGER_ERROR(nbgrade::grader_log().grade())

// printf 风格
#define GLOG_INFOF(fmt, ...) nbgrade::grader_log().main().logf(nbgrade::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define ELOG_INFOF(fmt, ...) nbgrade::grader_log().exec().logf(nbgrade::LogLevel::INFO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif // NBGRADE_CORE_GRADER_LOGGER_H
