/**
 * @file work_dir.h
 * @brief 隔离的临时工作目录
 *
 * 每次执行请求独占一个目录，析构时递归删除。
 * 共享资源包（目录）在执行前整体复制进来。
 */

#ifndef NBGRADE_SANDBOX_WORK_DIR_H
#define NBGRADE_SANDBOX_WORK_DIR_H

#include <string>
#include <vector>
#include <filesystem>
#include <system_error>
#include <climits>
#include <cstdlib>
#include <unistd.h>

#include "core/error.h"
#include "core/logger.h"

namespace nbgrade {
namespace sandbox {

namespace fs = std::filesystem;

class WorkDir {
private:
    std::string path_;

public:
    WorkDir() = default;

    ~WorkDir() {
        remove();
    }

    WorkDir(const WorkDir&) = delete;
    WorkDir& operator=(const WorkDir&) = delete;

    WorkDir(WorkDir &&o) noexcept : path_(std::move(o.path_)) {
        o.path_.clear();
    }

    /**
     * @brief 在 base 下创建 nbgrade_XXXXXX 目录
     */
    static Result<WorkDir> create(const std::string &base = "") {
        std::string root = base;
        if (root.empty()) {
            const char *tmp = getenv("TMPDIR");
            root = (tmp && *tmp) ? tmp : "/tmp";
        }
        std::error_code ec;
        fs::create_directories(root, ec);

        std::string tmpl = root + "/nbgrade_XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            return Err<WorkDir>(ErrorCode::DIRECTORY_ERROR, "Cannot create working directory under " + root);
        }
        WorkDir dir;
        dir.path_ = buf.data();
        LOG_DEBUG << "Created working directory " << dir.path_;
        return Ok(std::move(dir));
    }

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    std::string file(const std::string &name) const {
        return path_ + "/" + name;
    }

    /**
     * @brief 将 bundle 目录的内容递归复制到工作目录
     */
    Result<void> materialize(const std::string &bundle_dir) const {
        if (bundle_dir.empty()) {
            return Ok();
        }
        std::error_code ec;
        if (!fs::is_directory(bundle_dir, ec)) {
            return Err(ErrorCode::DIRECTORY_ERROR, "Resource bundle is not a directory: " + bundle_dir);
        }
        fs::copy(bundle_dir, path_,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) {
            return Err(ErrorCode::FILE_WRITE_ERROR, "Cannot copy resource bundle: " + ec.message());
        }
        return Ok();
    }

    /**
     * @brief 递归删除目录，可重复调用
     */
    void remove() {
        if (path_.empty()) return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            LOG_WARN << "Failed to remove working directory " << path_ << ": " << ec.message();
        } else {
            LOG_DEBUG << "Removed working directory " << path_;
        }
        path_.clear();
    }
};

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_WORK_DIR_H
