/**
 * @file nbgrade.h
 * @brief nbgrade 主头文件
 *
 * 使用方式：
 *   #include "nbgrade.h"
 *   using namespace nbgrade;
 */

#ifndef NBGRADE_H
#define NBGRADE_H

#include <memory>
#include <string>
#include <vector>
#include <exception>
#include <map>
#include <set>
#include <cstdlib>

// 核心模块
#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/config.h"
#include "core/logger.h"
#include "core/grader_logger.h"
#include "core/notebook.h"
#include "core/rubric.h"
#include "core/grade.h"
#include "core/controller.h"

// 沙箱
#include "sandbox/sandbox.h"
#include "sandbox/session.h"
#include "sandbox/dependency.h"
#include "sandbox/probe.h"

// 评分
#include "grading/segmenter.h"
#include "grading/criteria.h"
#include "grading/judgment.h"
#include "grading/http_judgment.h"
#include "grading/orchestrator.h"

namespace nbgrade {

/**
 * @brief 一个评分对象的完整结果
 */
struct SubjectReport {
    std::string subject_id;
    ExecutionResult execution;
    SectionGradeSheet sheet;
    GradeTotals totals;
    std::map<std::string, double> overrides;

    Json::Value to_json() const {
        Json::Value j(Json::objectValue);
        Json::Value sections(Json::arrayValue);
        for (const auto &s : sheet.sections) {
            sections.append(s.to_json());
        }
        j["sections"] = sections;

        Json::Value ov(Json::objectValue);
        for (const auto &kv : overrides) {
            ov[kv.first] = kv.second;
        }
        j["overrides"] = ov;
        j["totals"] = totals.to_json();

        Json::Value errors(Json::arrayValue);
        for (const auto &e : execution.errors) {
            Json::Value item(Json::objectValue);
            item["category"] = category_to_string(e.category);
            item["name"] = e.name;
            item["message"] = e.message;
            item["blockIndex"] = e.block_index;
            errors.append(item);
        }
        j["errors"] = errors;
        j["finalState"] = state_to_string(execution.final_state);
        j["attempts"] = execution.attempts;
        j["durationSeconds"] = execution.duration_seconds;
        return j;
    }
};

/**
 * @brief 评分上下文
 *
 * 封装一次批量评分所需的全部组件，各组件可在工作线程间共享。
 */
class GradingContext {
public:
    Config config;
    Rubric rubric;
    ExecuteOptions exec_options;
    OverrideTable overrides;

    std::shared_ptr<ExecutionController> controller;
    std::shared_ptr<GradingOrchestrator> orchestrator;

public:
    GradingContext() = default;
    GradingContext(const GradingContext&) = delete;
    GradingContext& operator=(const GradingContext&) = delete;

    /**
     * @brief 读取配置、加载评分标准并装配组件
     *
     * 配置不可读、评分标准缺失或无效时返回错误，此时不应开始评分。
     */
    Result<void> init(const std::string &config_file) {
        NBG_TRY(config.load(config_file));

        grader_log().set_log_dir(config.get_str("log_dir", "/tmp/nbgrade/log"));
        grader_log().init(parse_log_level(config.get_str("log_level", "info")));

        NBG_TRY_UNWRAP(rubric_path, config.require_str("rubric"));
        NBG_TRY_UNWRAP(loaded, load_rubric_file(rubric_path));
        rubric = std::move(loaded);
        GLOG_INFO << "Rubric " << rubric_path << ": " << rubric.sections().size()
                  << " section(s), " << format_number(rubric.total_points()) << " points";

        exec_options.per_block_timeout = config.get_double("timeout_per_block", 120.0);
        NBG_ENSURE(exec_options.per_block_timeout > 0, ErrorCode::CONFIG_INVALID_VALUE,
                   "timeout_per_block must be positive");
        exec_options.retry_on_timeout = config.get_bool("retry_on_timeout", true);
        auto tags = config.get_list("skip_tags", {"skip_autograde", "long"});
        exec_options.block_tags_to_skip = std::set<std::string>(tags.begin(), tags.end());
        exec_options.shared_resource_bundle = config.get_str("bundle_dir");
        exec_options.work_root = config.get_str("work_root");
        exec_options.probe_set = build_probes(rubric);

        if (config.has("requirements")) {
            std::string req_path = config.get_str("requirements");
            NBG_ENSURE(read_file(req_path, exec_options.extra_dependency_spec),
                       ErrorCode::FILE_NOT_FOUND, "Requirements file not readable: " + req_path);
        }

        NBG_TRY(load_overrides());

        std::string python = config.get_str("python", "/usr/bin/python3");
        auto session = std::make_shared<sandbox::PythonSandboxSession>(
            python, config.get_int("memory_limit_kb", 0));
        auto resolver = std::make_shared<sandbox::PipDependencyResolver>(
            python,
            config.get_list("baseline_packages", sandbox::default_baseline_packages()),
            config.get_int("install_timeout", 300) * 1000);
        auto probes = std::make_shared<sandbox::PythonProbeEvaluator>();
        controller = std::make_shared<ExecutionController>(session, resolver, probes);

        std::shared_ptr<JudgmentService> service;
        if (rubric_has_delegated()) {
            HttpJudgmentConfig jc;
            jc.endpoint = config.get_str("judge_endpoint", jc.endpoint);
            jc.model = config.get_str("judge_model", jc.model);
            jc.api_key_env = config.get_str("judge_api_key_env", jc.api_key_env);
            jc.timeout_seconds = config.get_int("judge_timeout", static_cast<int>(jc.timeout_seconds));
            jc.temperature = config.get_double("judge_temperature", jc.temperature);
            service = std::make_shared<HttpJudgmentService>(jc);
        }
        orchestrator = std::make_shared<GradingOrchestrator>(rubric, service);
        return Ok();
    }

    /**
     * @brief 评一个对象：执行、分段、打分、汇总
     */
    SubjectReport grade_subject(const std::string &subject_id, const std::string &document_path) const {
        SubjectReport report;
        report.subject_id = subject_id;

        std::string bytes;
        if (!read_file(document_path, bytes)) {
            GLOG_ERROR << "Subject " << subject_id << ": cannot read " << document_path;
            report.execution.errors.emplace_back(ErrorCategory::RUNTIME, "DocumentReadError",
                                                 "Cannot read " + document_path);
            report.totals = aggregate(subject_id, report.sheet, overrides);
            return report;
        }

        GLOG_INFO << "Grading subject " << subject_id << " (" << document_path << ")";
        try {
            report.execution = controller->execute(bytes, exec_options);
            Segmentation seg = segment(report.execution.executed_document, &rubric);
            report.sheet = orchestrator->grade(report.execution, seg);
        } catch (const std::exception &e) {
            GLOG_ERROR << "Subject " << subject_id << ": grading aborted: " << e.what();
            report.execution.errors.emplace_back(ErrorCategory::RUNTIME, "InternalError",
                                                 std::string("Grading aborted: ") + e.what());
        }
        report.overrides = overrides.for_subject(subject_id);
        report.totals = aggregate(subject_id, report.sheet, overrides);
        GLOG_INFO << "Subject " << subject_id << ": " << format_number(report.totals.earned_with_overrides)
                  << " / " << format_number(report.totals.max_points);
        return report;
    }

private:
    bool rubric_has_delegated() const {
        for (const auto &s : rubric.sections()) {
            if (s.has_delegated()) return true;
        }
        return false;
    }

    /**
     * @brief override_<i> = subject:section:value，共 n_overrides 条
     */
    Result<void> load_overrides() {
        int n = config.get_int("n_overrides", 0);
        for (int i = 1; i <= n; i++) {
            std::string key = "override_" + std::to_string(i);
            std::string spec = config.get_str(key);
            auto parts = split(spec, ':');
            NBG_ENSURE(parts.size() == 3, ErrorCode::CONFIG_INVALID_VALUE,
                       key + " must be subject:section:value, got '" + spec + "'");
            char *end = nullptr;
            double value = std::strtod(parts[2].c_str(), &end);
            NBG_ENSURE(end && *end == '\0' && !parts[2].empty(), ErrorCode::CONFIG_INVALID_VALUE,
                       key + " has a non-numeric value '" + parts[2] + "'");
            NBG_TRY(overrides.set(trim(parts[0]), trim(parts[1]), value));
        }
        return Ok();
    }
};

} // namespace nbgrade

#endif // NBGRADE_H
