/**
 * @file config.h
 * @brief 配置系统
 *
 * 管理批量评分配置（grader.conf）的读取与访问。
 * 文件格式为空白分隔的 key value 对，以 # 开头的行为注释：
 *
 *   rubric              /data/hw3/rubric.json
 *   n_subjects          2
 *   subject_1           alice
 *   document_1          /data/hw3/alice.ipynb
 *   timeout_per_block   120
 *   skip_tags           skip_autograde,long
 */

#ifndef NBGRADE_CORE_CONFIG_H
#define NBGRADE_CORE_CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include "core/error.h"
#include "core/utils.h"

namespace nbgrade {

/**
 * @brief 配置管理类
 */
class Config {
private:
    std::map<std::string, std::string> data_;

public:
    Config() = default;

    /**
     * @brief 从文件加载配置，已有的键会被覆盖
     */
    Result<void> load(const std::string &filename) {
        std::ifstream fin(filename.c_str());
        if (!fin) {
            return Err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filename);
        }
        std::string line;
        int line_no = 0;
        while (std::getline(fin, line)) {
            line_no++;
            std::string t = trim(line);
            if (t.empty() || t[0] == '#') {
                continue;
            }
            std::istringstream iss(t);
            std::string key, val;
            iss >> key;
            std::getline(iss, val);
            val = trim(val);
            if (val.empty()) {
                return Err(ErrorCode::CONFIG_PARSE_ERROR,
                    filename + ":" + std::to_string(line_no) + ": missing value for '" + key + "'");
            }
            data_[key] = val;
        }
        return Ok();
    }

    void set(const std::string &key, const std::string &val) {
        data_[key] = val;
    }

    /**
     * @brief 添加配置项（如果不存在）
     */
    void add(const std::string &key, const std::string &val) {
        if (data_.count(key) == 0) {
            data_[key] = val;
        }
    }

    bool has(const std::string &key) const {
        return data_.count(key) != 0;
    }

    /**
     * @brief 检查配置项是否等于指定值
     */
    bool is(const std::string &key, const std::string &val) const {
        auto it = data_.find(key);
        return it != data_.end() && it->second == val;
    }

    std::string get_str(const std::string &key, const std::string &default_val = "") const {
        auto it = data_.find(key);
        return (it != data_.end()) ? it->second : default_val;
    }

    /**
     * @brief 获取带编号的字符串配置，查找 key_num
     */
    std::string get_str(const std::string &key, int num, const std::string &default_val = "") const {
        return get_str(key + "_" + std::to_string(num), default_val);
    }

    int get_int(const std::string &key, int default_val = 0) const {
        auto it = data_.find(key);
        return (it != data_.end()) ? atoi(it->second.c_str()) : default_val;
    }

    double get_double(const std::string &key, double default_val = 0.0) const {
        auto it = data_.find(key);
        return (it != data_.end()) ? atof(it->second.c_str()) : default_val;
    }

    /**
     * @brief on/off 开关，也接受 true/false、yes/no、1/0
     */
    bool get_bool(const std::string &key, bool default_val = false) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        std::string v = to_lower(it->second);
        if (v == "on" || v == "true" || v == "yes" || v == "1") return true;
        if (v == "off" || v == "false" || v == "no" || v == "0") return false;
        return default_val;
    }

    /**
     * @brief 逗号分隔的列表配置，空元素被丢弃
     */
    std::vector<std::string> get_list(const std::string &key,
                                      const std::vector<std::string> &default_val = {}) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return default_val;
        }
        std::vector<std::string> out;
        for (const auto &item : split(it->second, ',')) {
            std::string t = trim(item);
            if (!t.empty()) {
                out.push_back(t);
            }
        }
        return out;
    }

    /**
     * @brief 必需的字符串配置
     */
    Result<std::string> require_str(const std::string &key) const {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return Err<std::string>(ErrorCode::CONFIG_MISSING_KEY, "Missing config key: " + key);
        }
        return it->second;
    }

    const std::map<std::string, std::string>& data() const { return data_; }
};

} // namespace nbgrade

#endif // NBGRADE_CORE_CONFIG_H
