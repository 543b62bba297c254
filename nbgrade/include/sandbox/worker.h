/**
 * @file worker.h
 * @brief 持久化解释器工作进程
 *
 * 一次执行只启动一个解释器进程，所有单元在同一个命名空间中依次执行，
 * 通过管道通信（协议见 kernel_driver.h）。每个请求有独立的截止时间，
 * 超时后整个进程组被 SIGKILL。
 */

#ifndef NBGRADE_SANDBOX_WORKER_H
#define NBGRADE_SANDBOX_WORKER_H

#include <string>
#include <vector>
#include <chrono>
#include <cstring>
#include <cstdint>
#include <algorithm>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <errno.h>
#include <json/json.h>

#include "core/error.h"
#include "core/logger.h"
#include "core/types.h"
#include "core/notebook.h"
#include "sandbox/kernel_driver.h"

namespace nbgrade {
namespace sandbox {

/**
 * @brief 工作进程配置
 */
struct WorkerConfig {
    std::string interpreter = "/usr/bin/python3";
    std::string work_dir;
    std::string site_dir;          // 追加到 PYTHONPATH 最前
    std::string log_file;          // 解释器的 fd 1/2，空则为 /dev/null
    int memory_limit_kb = 0;       // 0 = 不限
};

/**
 * @brief 单个单元的执行应答
 */
struct WorkerReply {
    int execution_count = 0;
    std::vector<Output> outputs;
    bool has_error = false;
    std::string error_name;
    std::string error_value;
    std::vector<std::string> trace;
};

/**
 * @brief 持久化解释器进程
 */
class InterpreterWorker {
private:
    WorkerConfig config_;
    pid_t worker_pid_ = -1;
    int cmd_fd_ = -1;       // 父 -> 子（子进程的 fd 0）
    int result_fd_ = -1;    // 子 -> 父（子进程的 fd 3）
    int next_id_ = 0;
    bool initialized_ = false;

public:
    explicit InterpreterWorker(const WorkerConfig &config)
        : config_(config) {}

    ~InterpreterWorker() {
        shutdown();
    }

    InterpreterWorker(const InterpreterWorker&) = delete;
    InterpreterWorker& operator=(const InterpreterWorker&) = delete;

    bool alive() const { return initialized_; }
    pid_t pid() const { return worker_pid_; }

    /**
     * @brief 启动解释器进程
     */
    Result<void> init() {
        if (initialized_) return Ok();

        if (access(config_.interpreter.c_str(), X_OK) != 0) {
            return Err(ErrorCode::INTERPRETER_NOT_FOUND, "Interpreter not executable: " + config_.interpreter);
        }

        // 写端关闭后的 write 返回 EPIPE 而不是终止评分进程
        signal(SIGPIPE, SIG_IGN);

        int cmd_pipe[2], result_pipe[2];
        if (pipe(cmd_pipe) < 0) {
            return Err(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }
        if (pipe(result_pipe) < 0) {
            close(cmd_pipe[0]);
            close(cmd_pipe[1]);
            return Err(ErrorCode::PIPE_FAILED, std::string("pipe: ") + strerror(errno));
        }

        // fork 之前准备好 argv / envp
        std::vector<std::string> env_store;
        std::string pythonpath = config_.site_dir;
        const char *old_pp = getenv("PYTHONPATH");
        if (old_pp && *old_pp) {
            pythonpath = pythonpath.empty() ? old_pp : pythonpath + ":" + old_pp;
        }
        for (char **e = environ; e && *e; e++) {
            if (strncmp(*e, "PYTHONPATH=", 11) == 0 || strncmp(*e, "MPLBACKEND=", 11) == 0) continue;
            env_store.push_back(*e);
        }
        if (!pythonpath.empty()) {
            env_store.push_back("PYTHONPATH=" + pythonpath);
        }
        env_store.push_back("MPLBACKEND=Agg");
        env_store.push_back("PYTHONUNBUFFERED=1");
        env_store.push_back("PYTHONDONTWRITEBYTECODE=1");

        std::vector<const char*> envp;
        for (const auto &e : env_store) envp.push_back(e.c_str());
        envp.push_back(nullptr);

        const char *driver = kernel_driver_source();
        std::vector<const char*> argv = {config_.interpreter.c_str(), "-u", "-c", driver, nullptr};

        worker_pid_ = fork();
        if (worker_pid_ < 0) {
            close(cmd_pipe[0]); close(cmd_pipe[1]);
            close(result_pipe[0]); close(result_pipe[1]);
            worker_pid_ = -1;
            return Err(ErrorCode::FORK_FAILED, std::string("fork: ") + strerror(errno));
        }

        if (worker_pid_ == 0) {
            setpgid(0, 0);
            close(cmd_pipe[1]);
            close(result_pipe[0]);

            if (!config_.work_dir.empty() && chdir(config_.work_dir.c_str()) < 0) {
                _exit(127);
            }

            // result_pipe[1] 可能恰好是 0，先挪到高位
            int rfd = fcntl(result_pipe[1], F_DUPFD, 10);
            int cfd = fcntl(cmd_pipe[0], F_DUPFD, 10);
            if (rfd < 0 || cfd < 0) _exit(127);
            dup2(cfd, STDIN_FILENO);
            dup2(rfd, 3);

            int out_fd = config_.log_file.empty()
                ? open("/dev/null", O_WRONLY)
                : open(config_.log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (out_fd >= 0) {
                dup2(out_fd, STDOUT_FILENO);
                dup2(out_fd, STDERR_FILENO);
            }

            long max_fd = sysconf(_SC_OPEN_MAX);
            if (max_fd < 0 || max_fd > 4096) max_fd = 4096;
            for (int fd = 4; fd < max_fd; fd++) {
                close(fd);
            }

            struct rlimit rl;
            rl.rlim_cur = rl.rlim_max = 0;
            setrlimit(RLIMIT_CORE, &rl);
            if (config_.memory_limit_kb > 0) {
                rl.rlim_cur = rl.rlim_max = config_.memory_limit_kb * 1024ULL;
                setrlimit(RLIMIT_AS, &rl);
            }

            execve(config_.interpreter.c_str(),
                   const_cast<char* const*>(argv.data()),
                   const_cast<char* const*>(envp.data()));
            _exit(127);
        }

        close(cmd_pipe[0]);
        close(result_pipe[1]);
        cmd_fd_ = cmd_pipe[1];
        result_fd_ = result_pipe[0];
        fcntl(cmd_fd_, F_SETFD, FD_CLOEXEC);
        fcntl(result_fd_, F_SETFD, FD_CLOEXEC);

        initialized_ = true;
        LOG_DEBUG << "Interpreter worker started, pid " << worker_pid_;
        return Ok();
    }

    /**
     * @brief 执行一段代码
     * @param timeout_ms 本请求的墙钟时间预算
     *
     * 超时返回 SANDBOX_TIMEOUT，进程已终止；进程意外退出返回 SANDBOX_ERROR。
     */
    Result<WorkerReply> execute(const std::string &code, int timeout_ms) {
        if (!initialized_) {
            return Err<WorkerReply>(ErrorCode::SANDBOX_ERROR, "Worker not initialized");
        }

        Json::Value req(Json::objectValue);
        req["id"] = ++next_id_;
        req["code"] = code;
        std::string payload = to_json_line(req);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

        uint32_t len = payload.size();
        std::string frame(reinterpret_cast<const char*>(&len), sizeof(len));
        frame += payload;
        if (!write_all(frame)) {
            std::string why = reap_exit_reason();
            return Err<WorkerReply>(ErrorCode::SANDBOX_ERROR, "interpreter exited unexpectedly (" + why + ")");
        }

        std::string header;
        ReadStatus st = read_exact(header, sizeof(uint32_t), deadline);
        if (st == ReadStatus::OK) {
            uint32_t reply_len;
            memcpy(&reply_len, header.data(), sizeof(reply_len));
            std::string body;
            st = read_exact(body, reply_len, deadline);
            if (st == ReadStatus::OK) {
                return parse_reply(body);
            }
        }

        if (st == ReadStatus::TIMEOUT) {
            LOG_DEBUG << "Interpreter request timed out after " << timeout_ms << " ms, killing pid " << worker_pid_;
            kill_worker();
            return Err<WorkerReply>(ErrorCode::SANDBOX_TIMEOUT,
                "Execution exceeded " + format_number(timeout_ms / 1000.0) + " s");
        }
        std::string why = reap_exit_reason();
        return Err<WorkerReply>(ErrorCode::SANDBOX_ERROR, "interpreter exited unexpectedly (" + why + ")");
    }

    /**
     * @brief 关闭工作进程，可重复调用
     */
    void shutdown() {
        if (cmd_fd_ >= 0) {
            close(cmd_fd_);   // 驱动读到 EOF 后自行退出
            cmd_fd_ = -1;
        }
        if (worker_pid_ > 0) {
            int status;
            auto grace = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
            while (waitpid(worker_pid_, &status, WNOHANG) == 0) {
                if (std::chrono::steady_clock::now() >= grace) {
                    kill(-worker_pid_, SIGKILL);
                    kill(worker_pid_, SIGKILL);
                    waitpid(worker_pid_, &status, 0);
                    break;
                }
                usleep(5000);
            }
            // 清理残留的子进程
            kill(-worker_pid_, SIGKILL);
            worker_pid_ = -1;
        }
        if (result_fd_ >= 0) {
            close(result_fd_);
            result_fd_ = -1;
        }
        initialized_ = false;
    }

private:
    enum class ReadStatus { OK, TIMEOUT, CLOSED };

    bool write_all(const std::string &data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = write(cmd_fd_, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            off += n;
        }
        return true;
    }

    ReadStatus read_exact(std::string &out, size_t n,
                          std::chrono::steady_clock::time_point deadline) {
        out.clear();
        char buf[65536];
        while (out.size() < n) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return ReadStatus::TIMEOUT;
            int wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

            struct pollfd pfd;
            pfd.fd = result_fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int pr = poll(&pfd, 1, wait_ms > 0 ? wait_ms : 1);
            if (pr < 0) {
                if (errno == EINTR) continue;
                return ReadStatus::CLOSED;
            }
            if (pr == 0) continue;

            size_t want = std::min(sizeof(buf), n - out.size());
            ssize_t got = read(result_fd_, buf, want);
            if (got < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                return ReadStatus::CLOSED;
            }
            if (got == 0) return ReadStatus::CLOSED;
            out.append(buf, got);
        }
        return ReadStatus::OK;
    }

    void kill_worker() {
        if (worker_pid_ > 0) {
            kill(-worker_pid_, SIGKILL);
            kill(worker_pid_, SIGKILL);
            int status;
            waitpid(worker_pid_, &status, 0);
            worker_pid_ = -1;
        }
        shutdown();
    }

    std::string reap_exit_reason() {
        std::string why = "no status";
        if (worker_pid_ > 0) {
            int status = 0;
            pid_t r = waitpid(worker_pid_, &status, 0);
            if (r == worker_pid_) {
                if (WIFEXITED(status)) {
                    why = "exit code " + std::to_string(WEXITSTATUS(status));
                } else if (WIFSIGNALED(status)) {
                    why = "signal " + std::to_string(WTERMSIG(status));
                }
            }
            worker_pid_ = -1;
        }
        shutdown();
        return why;
    }

    static Result<WorkerReply> parse_reply(const std::string &body) {
        Json::Value root;
        std::string errs;
        if (!parse_json(body, root, errs) || !root.isObject()) {
            return Err<WorkerReply>(ErrorCode::SANDBOX_PROTOCOL_ERROR, "Malformed interpreter reply: " + errs);
        }
        WorkerReply reply;
        if (root["execution_count"].isInt()) {
            reply.execution_count = root["execution_count"].asInt();
        }
        const Json::Value &outputs = root["outputs"];
        if (outputs.isArray()) {
            for (const auto &out : outputs) {
                NBG_TRY_UNWRAP(output, detail::output_from_json(out));
                reply.outputs.push_back(std::move(output));
            }
        }
        const Json::Value &err = root["error"];
        if (err.isObject()) {
            reply.has_error = true;
            reply.error_name = detail::string_member(err, "ename");
            reply.error_value = detail::string_member(err, "evalue");
            const Json::Value &tb = err["traceback"];
            if (tb.isArray()) {
                for (const auto &line : tb) {
                    if (line.isString()) {
                        reply.trace.push_back(line.asString());
                    }
                }
            }
        }
        return Ok(std::move(reply));
    }
};

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_WORKER_H
