/**
 * @file main_grader.cpp
 * @brief 批量评分入口
 *
 * 用法：nbgrade_grader [grader.conf]
 *
 * grader.conf 列出评分标准与 n_subjects 个评分对象（subject_<i> / document_<i>），
 * 按 n_workers 并发评分，结果写入 result_file。
 * 配置或评分标准无法加载时在评分开始前退出，返回 1。
 */

#include <atomic>
#include <thread>
#include <iostream>

#include "nbgrade.h"

using namespace nbgrade;

namespace {

struct SubjectEntry {
    std::string id;
    std::string document;
};

Result<std::vector<SubjectEntry>> load_subjects(const Config &config) {
    std::vector<SubjectEntry> subjects;
    int n = config.get_int("n_subjects", 0);
    for (int i = 1; i <= n; i++) {
        SubjectEntry e;
        e.id = config.get_str("subject", i);
        e.document = config.get_str("document", i);
        NBG_ENSURE(!e.document.empty(), ErrorCode::CONFIG_MISSING_KEY,
                   "Missing config key: document_" + std::to_string(i));
        if (e.id.empty()) {
            e.id = "subject_" + std::to_string(i);
        }
        subjects.push_back(e);
    }
    return subjects;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_file = argc > 1 ? argv[1] : "grader.conf";

    GradingContext ctx;
    auto init = ctx.init(config_file);
    if (init.is_error()) {
        std::cerr << "nbgrade: " << init.error().to_string() << std::endl;
        return 1;
    }

    auto subjects = load_subjects(ctx.config);
    if (subjects.is_error()) {
        GLOG_ERROR << subjects.error().to_string();
        return 1;
    }
    const std::vector<SubjectEntry> &list = subjects.value();

    int n_workers = std::max(1, ctx.config.get_int("n_workers", 1));
    n_workers = std::min<int>(n_workers, std::max<size_t>(1, list.size()));
    GLOG_INFOF("Grading %zu subject(s) with %d worker(s)", list.size(), n_workers);

    std::vector<SubjectReport> reports(list.size());
    std::atomic<size_t> next(0);
    auto work = [&]() {
        for (size_t i = next++; i < list.size(); i = next++) {
            reports[i] = ctx.grade_subject(list[i].id, list[i].document);
        }
    };

    std::vector<std::thread> pool;
    for (int w = 1; w < n_workers; w++) {
        pool.emplace_back(work);
    }
    work();
    for (auto &t : pool) {
        t.join();
    }

    Json::Value root(Json::objectValue);
    root["subjects"] = Json::Value(Json::objectValue);
    for (const auto &r : reports) {
        root["subjects"][r.subject_id] = r.to_json();
    }

    std::string result_file = ctx.config.get_str("result_file", "results.json");
    if (!write_file(result_file, to_json_pretty(root) + "\n")) {
        GLOG_ERROR << "Cannot write results to " << result_file;
        grader_log().flush_all();
        return 2;
    }
    GLOG_INFO << "Results written to " << result_file;
    grader_log().flush_all();
    return 0;
}
