/**
 * @file dependency.h
 * @brief 依赖检测与修复
 *
 * - detect_missing_module: 从执行错误中提取缺失的模块名
 * - package_for_module: 模块名 -> 安装包名
 * - PipDependencyResolver: 通过 pip 把包安装到沙箱私有的 site 目录
 *
 * 所有安装都是尽力而为，失败只记录日志。
 */

#ifndef NBGRADE_SANDBOX_DEPENDENCY_H
#define NBGRADE_SANDBOX_DEPENDENCY_H

#include <string>
#include <vector>
#include <set>
#include <map>
#include <mutex>
#include <regex>
#include <optional>
#include <algorithm>

#include "core/error.h"
#include "core/types.h"
#include "core/utils.h"
#include "core/grader_logger.h"
#include "sandbox/sandbox.h"

namespace nbgrade {
namespace sandbox {

/**
 * @brief 默认基础包
 */
inline std::vector<std::string> default_baseline_packages() {
    return {
        "numpy>=1.26",
        "pandas>=2.2",
        "matplotlib>=3.8",
        "seaborn>=0.13",
        "statsmodels>=0.14",
        "openpyxl>=3.1"
    };
}

/**
 * @brief 在执行错误中查找第一个缺失模块，返回顶层模块名
 */
inline std::optional<std::string> detect_missing_module(const std::vector<ExecError> &errors) {
    static const std::regex missing_re("No module named '([^']+)'");
    static const std::regex ident_re("[A-Za-z_][A-Za-z0-9_]*");
    for (const auto &e : errors) {
        if (e.category != ErrorCategory::MISSING_DEPENDENCY) continue;
        std::smatch m;
        if (std::regex_search(e.message, m, missing_re)) {
            std::string mod = m[1].str();
            size_t dot = mod.find('.');
            if (dot != std::string::npos) {
                mod = mod.substr(0, dot);
            }
            if (std::regex_match(mod, ident_re)) return mod;
        }
    }
    return std::nullopt;
}

/**
 * @brief 导入名与安装包名不一致的常见模块
 */
inline const std::map<std::string, std::string>& module_package_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"sklearn", "scikit-learn"},
        {"cv2", "opencv-python"},
        {"PIL", "Pillow"},
        {"yaml", "PyYAML"},
        {"bs4", "beautifulsoup4"}
    };
    return aliases;
}

inline std::string package_for_module(const std::string &module) {
    const auto &aliases = module_package_aliases();
    auto it = aliases.find(module);
    return it != aliases.end() ? it->second : module;
}

/**
 * @brief 安装规格 -> 导入名，"numpy>=1.26" -> "numpy"
 */
inline std::string module_for_spec(const std::string &spec) {
    size_t cut = spec.find_first_of("<>=!~[; ");
    std::string pkg = trim(cut == std::string::npos ? spec : spec.substr(0, cut));
    for (const auto &kv : module_package_aliases()) {
        if (to_lower(kv.second) == to_lower(pkg)) return kv.first;
    }
    std::replace(pkg.begin(), pkg.end(), '-', '_');
    return pkg;
}

/**
 * @brief 依赖修复接口
 *
 * site_dir 是本次执行私有的包目录，解释器启动时位于 PYTHONPATH 最前。
 */
class DependencyResolver {
public:
    virtual ~DependencyResolver() = default;

    /**
     * @brief 确保基础包可导入，逐个独立处理
     */
    virtual void ensure_baseline(const std::string &site_dir) = 0;

    /**
     * @brief 按 requirements 文件安装
     */
    virtual Result<void> install_requirements(const std::string &requirements_file,
                                              const std::string &site_dir) = 0;

    /**
     * @brief 安装提供 module 的包
     */
    virtual Result<void> install(const std::string &module, const std::string &site_dir) = 0;
};

/**
 * @brief pip 实现
 */
class PipDependencyResolver : public DependencyResolver {
private:
    std::string python_;
    std::vector<std::string> baseline_;
    int install_timeout_ms_;
    std::mutex install_mtx_;
    std::mutex cache_mtx_;
    std::set<std::string> system_modules_;   // 不借助 site 目录即可导入的模块

    bool importable(const std::string &module, const std::string &site_dir) {
        std::vector<std::string> env;
        if (!site_dir.empty()) {
            env.push_back("PYTHONPATH=" + site_dir);
        }
        auto r = run_program(python_, {"-c", "import " + module}, 60000, "", "", env);
        if (r.is_error()) {
            ELOG_WARN << "Import check for " << module << " failed to run: " << r.error().to_string();
            return false;
        }
        return r.value().ok();
    }

    bool known_system_module(const std::string &module) {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        return system_modules_.count(module) != 0;
    }

    void remember_system_module(const std::string &module) {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        system_modules_.insert(module);
    }

    Result<void> pip_install(const std::vector<std::string> &install_args, const std::string &site_dir) {
        std::vector<std::string> args = {
            "-m", "pip", "install",
            "--disable-pip-version-check", "--no-input", "--quiet",
            "--target", site_dir
        };
        args.insert(args.end(), install_args.begin(), install_args.end());
        std::string log_file = site_dir + ".pip.log";

        std::lock_guard<std::mutex> lock(install_mtx_);
        ELOG_INFO << "pip install " << join(install_args, " ") << " -> " << site_dir;
        auto r = run_program(python_, args, install_timeout_ms_, "", log_file);
        if (r.is_error()) {
            return Err(ErrorCode::DEPENDENCY_INSTALL_FAILED, r.error().message());
        }
        if (!r.value().ok()) {
            std::string log;
            if (!read_file(log_file, log)) {
                log = "(no installer output)";
            }
            if (log.size() > 800) {
                log = "..." + log.substr(log.size() - 800);
            }
            return Err(ErrorCode::DEPENDENCY_INSTALL_FAILED,
                "pip " + std::string(status_to_string(r.value().status)) + ": " + trim(log));
        }
        return Ok();
    }

public:
    PipDependencyResolver(const std::string &python = "/usr/bin/python3",
                          const std::vector<std::string> &baseline = default_baseline_packages(),
                          int install_timeout_ms = 300000)
        : python_(python), baseline_(baseline), install_timeout_ms_(install_timeout_ms) {}

    void ensure_baseline(const std::string &site_dir) override {
        for (const auto &spec : baseline_) {
            std::string mod = module_for_spec(spec);
            if (mod.empty() || known_system_module(mod)) continue;
            if (importable(mod, "")) {
                remember_system_module(mod);
                continue;
            }
            auto r = pip_install({spec}, site_dir);
            if (r.is_error()) {
                ELOG_WARN << "Baseline package " << spec << " unavailable: " << r.error().message();
            }
        }
    }

    Result<void> install_requirements(const std::string &requirements_file,
                                      const std::string &site_dir) override {
        NBG_ENSURE(file_exists(requirements_file), ErrorCode::FILE_NOT_FOUND,
                   "Requirements file not found: " + requirements_file);
        return pip_install({"-r", requirements_file}, site_dir);
    }

    Result<void> install(const std::string &module, const std::string &site_dir) override {
        std::string pkg = package_for_module(module);
        NBG_TRY(pip_install({pkg}, site_dir));
        if (!importable(module, site_dir)) {
            return Err(ErrorCode::DEPENDENCY_INSTALL_FAILED,
                "Installed " + pkg + " but module " + module + " is still not importable");
        }
        ELOG_INFO << "Installed " << pkg << " for missing module " << module;
        return Ok();
    }
};

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_DEPENDENCY_H
