/**
 * @file sandbox.h
 * @brief 进程沙箱
 *
 * fork/exec 单个程序：工作目录、输出重定向与墙钟截止时间。
 * 用于依赖安装与导入检查等一次性子进程；解释器会话见 worker.h。
 *
 * 不限制输出文件大小：安装大型 wheel 时 pip 会写出数百 MB 的文件。
 */

#ifndef NBGRADE_SANDBOX_SANDBOX_H
#define NBGRADE_SANDBOX_SANDBOX_H

#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstring>
#include <ostream>
#include <cstdint>

#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <signal.h>
#include <fcntl.h>
#include <errno.h>

#include "core/error.h"
#include "core/logger.h"

namespace nbgrade {
namespace sandbox {

//==============================================================================
// 沙箱执行结果
//==============================================================================

enum class RunStatus {
    OK,
    TIME_LIMIT,
    RUNTIME_ERROR,
    KILLED_BY_SIGNAL,
    INTERNAL_ERROR
};

inline const char* status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::OK: return "OK";
        case RunStatus::TIME_LIMIT: return "TIME_LIMIT";
        case RunStatus::RUNTIME_ERROR: return "RUNTIME_ERROR";
        case RunStatus::KILLED_BY_SIGNAL: return "KILLED_BY_SIGNAL";
        case RunStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

inline std::ostream& operator<<(std::ostream &os, RunStatus status) {
    return os << status_to_string(status);
}

struct SandboxResult {
    RunStatus status;
    int exit_code;
    int signal;
    uint64_t real_time_ms;
    std::string message;

    SandboxResult()
        : status(RunStatus::INTERNAL_ERROR), exit_code(-1), signal(0), real_time_ms(0) {}

    bool ok() const { return status == RunStatus::OK && exit_code == 0; }
};

//==============================================================================
// 沙箱配置
//==============================================================================

struct SandboxConfig {
    int time_limit_ms = 300000;      // 墙钟截止时间
    std::string output_file;         // stdout 与 stderr 合并写入；为空时丢弃
    std::string work_dir;

    std::string program;
    std::vector<std::string> args;
    std::vector<std::string> env;    // 覆盖父进程环境中的同名变量
};

//==============================================================================
// 沙箱执行器
//==============================================================================

class Sandbox {
private:
    SandboxConfig config_;

    /**
     * @brief 父进程环境加上 config.env，config.env 中的键覆盖同名变量
     */
    static std::vector<std::string> build_environment(const std::vector<std::string> &extra) {
        std::vector<std::string> out;
        for (char **e = environ; e && *e; e++) {
            const char *eq = strchr(*e, '=');
            size_t key_len = eq ? static_cast<size_t>(eq - *e) + 1 : strlen(*e);
            bool overridden = false;
            for (const auto &kv : extra) {
                if (kv.compare(0, key_len, *e, key_len) == 0) {
                    overridden = true;
                    break;
                }
            }
            if (!overridden) {
                out.push_back(*e);
            }
        }
        out.insert(out.end(), extra.begin(), extra.end());
        return out;
    }

    /**
     * @brief 子进程：只调用 async-signal-safe 的函数，参数全部在 fork 之前准备好
     */
    static void child_exec(const char *program, const char *work_dir, const char *output,
                           char *const *argv, char *const *envp) {
        // 独立进程组，超时时整组终止
        setpgid(0, 0);

        if (work_dir && chdir(work_dir) < 0) {
            _exit(127);
        }

        int in = open("/dev/null", O_RDONLY);
        if (in >= 0) {
            dup2(in, STDIN_FILENO);
            close(in);
        }
        int out = open(output, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (out < 0) {
            _exit(127);
        }
        dup2(out, STDOUT_FILENO);
        dup2(out, STDERR_FILENO);
        close(out);

        struct rlimit rl;
        rl.rlim_cur = rl.rlim_max = 0;
        setrlimit(RLIMIT_CORE, &rl);

        execve(program, argv, envp);
        _exit(127);
    }

public:
    explicit Sandbox(const SandboxConfig &config)
        : config_(config) {}

    /**
     * @brief 执行程序并等待结束或超时
     */
    Result<SandboxResult> run() {
        SandboxResult result;
        if (config_.program.empty()) {
            return Err<SandboxResult>(ErrorCode::SANDBOX_ERROR, "No program configured");
        }
        if (access(config_.program.c_str(), X_OK) != 0) {
            return Err<SandboxResult>(ErrorCode::SANDBOX_ERROR,
                "Program not executable: " + config_.program);
        }

        // fork 之前准备好 argv / envp
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(config_.program.c_str()));
        for (const auto &arg : config_.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<std::string> env_store = build_environment(config_.env);
        std::vector<char*> envp;
        for (const auto &e : env_store) {
            envp.push_back(const_cast<char*>(e.c_str()));
        }
        envp.push_back(nullptr);

        const char *work_dir = config_.work_dir.empty() ? nullptr : config_.work_dir.c_str();
        const char *output = config_.output_file.empty() ? "/dev/null" : config_.output_file.c_str();

        auto start_time = std::chrono::steady_clock::now();

        pid_t pid = fork();
        if (pid < 0) {
            return Err<SandboxResult>(ErrorCode::FORK_FAILED,
                std::string("Fork failed: ") + strerror(errno));
        }

        if (pid == 0) {
            child_exec(config_.program.c_str(), work_dir, output, argv.data(), envp.data());
            _exit(127);
        }

        int status = 0;
        bool timed_out = false;
        auto deadline = start_time + std::chrono::milliseconds(config_.time_limit_ms);

        while (true) {
            pid_t ret = waitpid(pid, &status, WNOHANG);

            if (ret > 0) break;

            if (ret < 0) {
                if (errno == EINTR) continue;
                if (errno == ECHILD) break;
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                return Err<SandboxResult>(ErrorCode::SANDBOX_ERROR, "waitpid failed");
            }

            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                waitpid(pid, &status, 0);
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        auto end_time = std::chrono::steady_clock::now();
        result.real_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count();

        if (timed_out) {
            result.status = RunStatus::TIME_LIMIT;
            result.message = "Real time limit exceeded";
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            if (result.exit_code == 0) {
                result.status = RunStatus::OK;
            } else {
                result.status = RunStatus::RUNTIME_ERROR;
                result.message = "Exit code: " + std::to_string(result.exit_code);
            }
        } else if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
            result.status = RunStatus::KILLED_BY_SIGNAL;
            result.message = "Signal: " + std::to_string(result.signal);
        }

        LOG_DEBUG << config_.program << " finished: " << result.status
                  << " (" << result.real_time_ms << " ms)";
        return Ok(std::move(result));
    }
};

//==============================================================================
// 便捷函数
//==============================================================================

/**
 * @brief 运行程序，stdout 与 stderr 合并写入 log_file；log_file 为空时丢弃输出
 */
inline Result<SandboxResult> run_program(
    const std::string &program,
    const std::vector<std::string> &args,
    int time_limit_ms,
    const std::string &work_dir = "",
    const std::string &log_file = "",
    const std::vector<std::string> &env = {}
) {
    SandboxConfig config;
    config.program = program;
    config.args = args;
    config.time_limit_ms = time_limit_ms;
    config.work_dir = work_dir;
    config.output_file = log_file;
    config.env = env;

    Sandbox sandbox(config);
    return sandbox.run();
}

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_SANDBOX_H
