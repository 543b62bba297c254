/**
 * @file controller.h
 * @brief 执行控制器
 *
 * 状态机：Init -> Prepared -> Running -> (Succeeded | TimedOut | DependencyMissing)
 *         -> [Retrying] -> Terminal
 *
 * - 超时最多重试一次，时间预算加倍，并追加一条 RetryNotice
 * - 缺失模块最多修复一次，修复成功后从原始文档重建并以原预算重跑
 * - 工作目录在所有退出路径上删除
 * - 不向调用方抛出任何异常，错误都记录在 ExecutionResult::errors 中
 */

#ifndef NBGRADE_CORE_CONTROLLER_H
#define NBGRADE_CORE_CONTROLLER_H

#include <string>
#include <set>
#include <memory>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>

#include "core/types.h"
#include "core/notebook.h"
#include "core/grader_logger.h"
#include "sandbox/work_dir.h"
#include "sandbox/session.h"
#include "sandbox/dependency.h"
#include "sandbox/probe.h"

namespace nbgrade {

/**
 * @brief 执行选项
 */
struct ExecuteOptions {
    double per_block_timeout = 120.0;                 ///< 秒
    std::string shared_resource_bundle;               ///< 目录，内容复制到工作目录
    std::string extra_dependency_spec;                ///< requirements 文件内容
    ProbeSet probe_set;
    std::set<std::string> block_tags_to_skip = {"skip_autograde", "long"};
    bool retry_on_timeout = true;
    std::string work_root;                            ///< 工作目录的父目录，空则为 $TMPDIR 或 /tmp
};

/// 沙箱私有包目录在工作目录中的名字
constexpr const char* SITE_DIR_NAME = ".nbgrade_site";

class ExecutionController {
private:
    std::shared_ptr<sandbox::SandboxSession> session_;
    std::shared_ptr<sandbox::DependencyResolver> resolver_;
    std::shared_ptr<sandbox::ProbeEvaluator> probes_;

    static void transition(ExecState &state, ExecState next) {
        ELOG_DEBUG << "state " << state_to_string(state) << " -> " << state_to_string(next);
        state = next;
    }

    static ExecState classify(const std::vector<ExecError> &errors) {
        for (const auto &e : errors) {
            if (e.category == ErrorCategory::TIMEOUT) return ExecState::TIMED_OUT;
        }
        for (const auto &e : errors) {
            if (e.category == ErrorCategory::MISSING_DEPENDENCY) return ExecState::DEPENDENCY_MISSING;
        }
        return ExecState::SUCCEEDED;
    }

    static int first_timeout_block(const std::vector<ExecError> &errors) {
        for (const auto &e : errors) {
            if (e.category == ErrorCategory::TIMEOUT) return e.block_index;
        }
        return -1;
    }

    /**
     * @brief 每次运行都从原始文档重新构建：清空输出、过滤标签、追加探针单元
     */
    Document prepare(const Document &original, const ExecuteOptions &options) const {
        Document doc = strip_outputs(filter_blocks_by_tags(original, options.block_tags_to_skip));
        if (!options.probe_set.empty() && probes_) {
            doc.blocks.push_back(probes_->build_block(options.probe_set));
        }
        return doc;
    }

    void prepare_environment(const sandbox::WorkDir &wd, const std::string &site_dir,
                             const ExecuteOptions &options) const {
        auto mat = wd.materialize(options.shared_resource_bundle);
        if (mat.is_error()) {
            ELOG_WARN << "Resource bundle not materialized: " << mat.error().to_string();
        }

        if (!resolver_) return;

        if (!trim(options.extra_dependency_spec).empty()) {
            std::string req_file = wd.file(".nbgrade_requirements.txt");
            if (!write_file(req_file, options.extra_dependency_spec)) {
                ELOG_WARN << "Cannot write requirements file " << req_file;
            } else {
                auto r = resolver_->install_requirements(req_file, site_dir);
                if (r.is_error()) {
                    ELOG_WARN << "Extra dependencies not installed: " << r.error().to_string();
                }
            }
        }

        resolver_->ensure_baseline(site_dir);
    }

public:
    ExecutionController(std::shared_ptr<sandbox::SandboxSession> session,
                        std::shared_ptr<sandbox::DependencyResolver> resolver,
                        std::shared_ptr<sandbox::ProbeEvaluator> probes)
        : session_(std::move(session)), resolver_(std::move(resolver)), probes_(std::move(probes)) {}

    /**
     * @brief 执行原始文档字节（nbformat 4 JSON）
     *
     * 无法解析时返回一条 Runtime 错误，不运行沙箱。
     */
    ExecutionResult execute(const std::string &document_bytes, const ExecuteOptions &options) const {
        auto doc = parse_notebook(document_bytes);
        if (doc.is_error()) {
            ELOG_WARN << "Document rejected: " << doc.error().to_string();
            ExecutionResult result;
            result.errors.emplace_back(ErrorCategory::RUNTIME, "DocumentParseError", doc.error().message());
            result.final_state = ExecState::SUCCEEDED;
            return result;
        }
        return execute(doc.value(), options);
    }

    /**
     * @brief 执行已解析的文档，输入文档不被修改
     */
    ExecutionResult execute(const Document &original, const ExecuteOptions &options) const {
        ExecutionResult result;
        ExecState state = ExecState::INIT;
        auto started = std::chrono::steady_clock::now();

        auto wd_result = sandbox::WorkDir::create(options.work_root);
        if (wd_result.is_error()) {
            ELOG_ERROR << wd_result.error().to_string();
            result.errors.emplace_back(ErrorCategory::RUNTIME, "WorkDirError", wd_result.error().message());
            transition(state, ExecState::TERMINAL);
            return result;
        }
        sandbox::WorkDir wd = std::move(wd_result.value());
        std::string site_dir = wd.file(SITE_DIR_NAME);
        if (mkdir(site_dir.c_str(), 0755) != 0 && errno != EEXIST) {
            ELOG_WARN << "Cannot create package directory " << site_dir << ": " << strerror(errno);
        }

        prepare_environment(wd, site_dir, options);
        transition(state, ExecState::PREPARED);

        sandbox::SessionOptions so;
        so.work_dir = wd.path();
        so.site_dir = site_dir;
        so.per_block_timeout = options.per_block_timeout;

        transition(state, ExecState::RUNNING);
        sandbox::SessionRun run = session_->run(prepare(original, options), so);
        result.attempts++;
        transition(state, classify(run.errors));

        bool retried_timeout = false;
        int timed_out_block = -1;
        if (state == ExecState::TIMED_OUT && options.retry_on_timeout) {
            timed_out_block = first_timeout_block(run.errors);
            transition(state, ExecState::RETRYING);
            ELOG_INFO << "Retrying with timeout " << format_number(options.per_block_timeout * 2) << " s";
            sandbox::SessionOptions retry_opts = so;
            retry_opts.per_block_timeout = options.per_block_timeout * 2;
            run = session_->run(prepare(original, options), retry_opts);
            result.attempts++;
            retried_timeout = true;
            transition(state, classify(run.errors));
        }

        auto missing = sandbox::detect_missing_module(run.errors);
        if (missing && resolver_) {
            transition(state, ExecState::RETRYING);
            auto installed = resolver_->install(*missing, site_dir);
            if (installed.ok()) {
                ELOG_INFO << "Re-running after installing module " << *missing;
                run = session_->run(prepare(original, options), so);
                result.attempts++;
            } else {
                ELOG_WARN << "Remediation for module " << *missing << " failed: " << installed.error().to_string();
            }
            transition(state, classify(run.errors));
        }

        result.errors = run.errors;
        if (retried_timeout) {
            result.errors.emplace_back(ErrorCategory::RETRY_NOTICE, "RetryNotice",
                "Cell timed out after " + format_number(options.per_block_timeout)
                + " s; retried once with timeout " + format_number(options.per_block_timeout * 2) + " s",
                timed_out_block);
        }
        result.final_state = state;
        result.duration_seconds = run.duration_seconds;
        result.executed_document = std::move(run.executed_document);
        result.rendered_preview = render_preview(result.executed_document);
        if (!options.probe_set.empty() && probes_) {
            result.probe_results = probes_->extract(result.executed_document);
        }

        wd.remove();
        transition(state, ExecState::TERMINAL);

        ELOG_INFO << "Execution finished: " << state_to_string(result.final_state)
                  << ", attempts " << result.attempts
                  << ", errors " << result.errors.size()
                  << ", wall " << format_number(std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - started).count()) << " s";
        return result;
    }
};

} // namespace nbgrade

#endif // NBGRADE_CORE_CONTROLLER_H
