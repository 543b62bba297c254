/**
 * @file session.h
 * @brief 沙箱会话
 *
 * 在工作目录中按顺序执行文档的所有可执行单元，收集输出与错误。
 * 单元出错后继续执行后续单元；超时或解释器崩溃则停止执行。
 * 错误一律作为数据返回。
 */

#ifndef NBGRADE_SANDBOX_SESSION_H
#define NBGRADE_SANDBOX_SESSION_H

#include <string>
#include <vector>
#include <chrono>
#include <memory>

#include "core/types.h"
#include "core/utils.h"
#include "core/grader_logger.h"
#include "sandbox/worker.h"

namespace nbgrade {
namespace sandbox {

/**
 * @brief 单次运行参数
 */
struct SessionOptions {
    std::string work_dir;
    std::string site_dir;
    double per_block_timeout = 120.0;   // 秒
};

/**
 * @brief 单次运行的产物
 */
struct SessionRun {
    Document executed_document;
    double duration_seconds = 0.0;
    std::vector<ExecError> errors;
};

/**
 * @brief 沙箱会话接口
 *
 * 实现必须保证每次 run 使用全新的解释器状态，返回前释放所有子进程。
 */
class SandboxSession {
public:
    virtual ~SandboxSession() = default;

    virtual SessionRun run(const Document &doc, const SessionOptions &options) = 0;
};

/**
 * @brief 基于 InterpreterWorker 的 Python 会话
 */
class PythonSandboxSession : public SandboxSession {
private:
    std::string interpreter_;
    int memory_limit_kb_;

public:
    explicit PythonSandboxSession(const std::string &interpreter = "/usr/bin/python3",
                                  int memory_limit_kb = 0)
        : interpreter_(interpreter), memory_limit_kb_(memory_limit_kb) {}

    SessionRun run(const Document &doc, const SessionOptions &options) override {
        SessionRun out;
        out.executed_document = doc;
        auto start = std::chrono::steady_clock::now();

        WorkerConfig wc;
        wc.interpreter = interpreter_;
        wc.work_dir = options.work_dir;
        wc.site_dir = options.site_dir;
        wc.memory_limit_kb = memory_limit_kb_;

        InterpreterWorker worker(wc);
        auto init = worker.init();
        if (init.is_error()) {
            ELOG_ERROR << "Cannot start interpreter: " << init.error().to_string();
            out.errors.emplace_back(ErrorCategory::RUNTIME, "InterpreterStartError", init.error().message());
            return out;
        }

        int timeout_ms = static_cast<int>(options.per_block_timeout * 1000);
        if (timeout_ms <= 0) timeout_ms = 1;

        auto &blocks = out.executed_document.blocks;
        for (size_t i = 0; i < blocks.size(); i++) {
            Block &b = blocks[i];
            if (!b.is_executable()) continue;
            b.outputs.clear();
            b.execution_count = 0;
            if (trim(b.source).empty()) continue;

            auto reply = worker.execute(b.source, timeout_ms);
            if (reply.is_error()) {
                const Error &err = reply.error();
                if (err.code() == ErrorCode::SANDBOX_TIMEOUT) {
                    ELOG_WARN << "Block " << i << " timed out after " << options.per_block_timeout << " s";
                    ExecError e(ErrorCategory::TIMEOUT, "CellTimeoutError",
                        "Cell execution timed out after " + format_number(options.per_block_timeout) + " s",
                        static_cast<int>(i));
                    b.outputs.push_back(Output::error(e.name, e.message));
                    out.errors.push_back(e);
                } else {
                    ELOG_WARN << "Block " << i << ": " << err.to_string();
                    ExecError e(ErrorCategory::RUNTIME, "InterpreterError", err.message(), static_cast<int>(i));
                    b.outputs.push_back(Output::error(e.name, e.message));
                    out.errors.push_back(e);
                }
                break;
            }

            WorkerReply &r = reply.value();
            b.execution_count = r.execution_count;
            b.outputs = std::move(r.outputs);
            if (r.has_error) {
                ExecError e(classify_error(r.error_name, r.error_value), r.error_name, r.error_value,
                            static_cast<int>(i));
                e.trace = r.trace;
                ELOG_DEBUG << "Block " << i << " raised " << r.error_name << ": " << r.error_value;
                out.errors.push_back(std::move(e));
            }
        }
        worker.shutdown();

        out.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return out;
    }
};

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_SESSION_H
