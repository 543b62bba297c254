/**
 * @file probe.h
 * @brief 探针注入与提取
 *
 * 在文档末尾追加一个合成的可执行单元，于解释器的全局命名空间中逐个求值探针表达式，
 * 把结果规范化后以一行带固定前缀的 JSON 打印出来；执行后再从该单元的输出中解析。
 * 单个表达式失败只记录该 id 的错误标记。
 */

#ifndef NBGRADE_SANDBOX_PROBE_H
#define NBGRADE_SANDBOX_PROBE_H

#include <string>
#include <vector>
#include <cstring>
#include <json/json.h>

#include "core/types.h"
#include "core/utils.h"
#include "core/grader_logger.h"

namespace nbgrade {
namespace sandbox {

/// 探针结果行的前缀
constexpr const char* PROBE_SENTINEL = "__NBGRADE_PROBES__::";

/// 合成单元的标签
constexpr const char* PROBE_BLOCK_TAG = "nbgrade_probe";

/**
 * @brief 探针求值接口
 */
class ProbeEvaluator {
public:
    virtual ~ProbeEvaluator() = default;

    /**
     * @brief 生成合成单元
     */
    virtual Block build_block(const ProbeSet &probes) const = 0;

    /**
     * @brief 从执行后的文档中解析探针结果，找不到标记时返回空表
     */
    virtual ProbeResults extract(const Document &executed) const = 0;
};

/**
 * @brief JSON 值 -> ProbeValue
 */
inline ProbeValue probe_value_from_json(const Json::Value &v) {
    if (v.isNull()) return ProbeValue::none();
    if (v.isBool()) return ProbeValue::of_number(v.asBool() ? 1.0 : 0.0);
    if (v.isNumeric()) return ProbeValue::of_number(v.asDouble());
    if (v.isString()) return ProbeValue::of_string(v.asString());
    if (v.isArray()) {
        std::vector<ProbeValue> items;
        for (const auto &item : v) {
            items.push_back(probe_value_from_json(item));
        }
        return ProbeValue::of_list(std::move(items));
    }
    if (v.isObject() && v.isMember("__error__")) {
        const Json::Value &msg = v["__error__"];
        return ProbeValue::of_error(msg.isString() ? msg.asString() : to_json_line(msg));
    }
    return ProbeValue::of_string(to_json_line(v));
}

class PythonProbeEvaluator : public ProbeEvaluator {
public:
    Block build_block(const ProbeSet &probes) const override {
        Json::Value pairs(Json::arrayValue);
        for (const auto &e : probes.entries()) {
            Json::Value pair(Json::arrayValue);
            pair.append(e.first);
            pair.append(e.second);
            pairs.append(pair);
        }

        // 只含字符串的 JSON 数组同时是合法的 Python 字面量
        std::string code;
        code += "def _nbgrade_probe_run(_probes):\n";
        code += "    import json as _json, math as _math\n";
        code += "    def _norm(v):\n";
        code += "        try:\n";
        code += "            import numpy as _np\n";
        code += "            if isinstance(v, _np.generic):\n";
        code += "                v = v.item()\n";
        code += "            elif isinstance(v, _np.ndarray):\n";
        code += "                v = v.tolist()\n";
        code += "        except ImportError:\n";
        code += "            pass\n";
        code += "        if type(v).__name__ in ('Index', 'RangeIndex', 'MultiIndex', 'Series') and hasattr(v, 'tolist'):\n";
        code += "            v = v.tolist()\n";
        code += "        if isinstance(v, (tuple, list)):\n";
        code += "            return [_norm(x) for x in v]\n";
        code += "        if isinstance(v, float) and not _math.isfinite(v):\n";
        code += "            return repr(v)\n";
        code += "        if v is None or isinstance(v, (bool, int, float, str)):\n";
        code += "            return v\n";
        code += "        return repr(v)\n";
        code += "    _out = {}\n";
        code += "    for _pid, _expr in _probes:\n";
        code += "        try:\n";
        code += "            _out[_pid] = _norm(eval(_expr, globals()))\n";
        code += "        except BaseException as _e:\n";
        code += "            _out[_pid] = {'__error__': '%s: %s' % (type(_e).__name__, _e)}\n";
        code += "    print('" + std::string(PROBE_SENTINEL) + "' + _json.dumps(_out, default=repr))\n";
        code += "_nbgrade_probe_run(" + to_json_line(pairs) + ")\n";
        code += "del _nbgrade_probe_run\n";

        Block b = Block::code(code);
        b.tags.insert(PROBE_BLOCK_TAG);
        return b;
    }

    ProbeResults extract(const Document &executed) const override {
        ProbeResults results;
        const Block *last = nullptr;
        for (const auto &b : executed.blocks) {
            if (b.is_executable()) last = &b;
        }
        if (!last) return results;

        std::string payload;
        bool found = false;
        for (const auto &o : last->outputs) {
            if (o.kind != OutputKind::STREAM_TEXT) continue;
            for (const auto &line : split_lines(o.text)) {
                if (starts_with(line, PROBE_SENTINEL)) {
                    payload = line.substr(strlen(PROBE_SENTINEL));
                    found = true;
                }
            }
        }
        if (!found) {
            ELOG_DEBUG << "No probe marker in the last executable block";
            return results;
        }

        Json::Value root;
        std::string errs;
        if (!parse_json(trim(payload), root, errs) || !root.isObject()) {
            ELOG_WARN << "Malformed probe payload: " << errs;
            return results;
        }
        for (const auto &id : root.getMemberNames()) {
            results[id] = probe_value_from_json(root[id]);
        }
        return results;
    }
};

} // namespace sandbox
} // namespace nbgrade

#endif // NBGRADE_SANDBOX_PROBE_H
