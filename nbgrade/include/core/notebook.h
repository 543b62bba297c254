/**
 * @file notebook.h
 * @brief nbformat 4 文档的读写
 *
 * - parse_notebook: JSON 文本 -> Document
 * - to_notebook_json: Document -> nbformat 4 JSON（执行后的文档导出）
 * - filter_blocks_by_tags: 去掉带指定标签的单元
 * - render_preview: 纯文本预览
 */

#ifndef NBGRADE_CORE_NOTEBOOK_H
#define NBGRADE_CORE_NOTEBOOK_H

#include <string>
#include <vector>
#include <set>
#include <sstream>
#include <json/json.h>

#include "core/types.h"
#include "core/error.h"
#include "core/utils.h"

namespace nbgrade {

namespace detail {

/**
 * @brief 取对象成员的字符串值，成员缺失或类型不符时返回默认值
 */
inline std::string string_member(const Json::Value &obj, const char *key, const std::string &default_val = "") {
    if (!obj.isObject()) {
        return default_val;
    }
    const Json::Value &v = obj[key];
    return v.isString() ? v.asString() : default_val;
}

/**
 * @brief 取对象成员，非对象或缺失时返回 null
 */
inline const Json::Value& object_member(const Json::Value &obj, const char *key) {
    static const Json::Value null_value;
    return obj.isObject() ? obj[key] : null_value;
}

inline Result<Output> output_from_json(const Json::Value &out) {
    if (!out.isObject()) {
        return Err<Output>(ErrorCode::DOCUMENT_PARSE_ERROR, "Cell output is not an object");
    }
    std::string type = string_member(out, "output_type");
    if (type == "stream") {
        return Output::stream(string_member(out, "name", "stdout"), json_multiline(out["text"]));
    }
    if (type == "error") {
        std::vector<std::string> trace;
        const Json::Value &tb = out["traceback"];
        if (tb.isArray()) {
            for (const auto &line : tb) {
                if (line.isString()) {
                    trace.push_back(line.asString());
                }
            }
        }
        return Output::error(string_member(out, "ename"), string_member(out, "evalue"), trace);
    }

    // execute_result / display_data
    Output o = Output::result("");
    o.is_display = (type == "display_data");
    const Json::Value &data = out["data"];
    if (data.isObject()) {
        for (const auto &mime : data.getMemberNames()) {
            std::string body = json_multiline(data[mime]);
            if (mime == "text/plain") {
                o.text = body;
            } else {
                o.mime[mime] = body;
            }
        }
    }
    return o;
}

inline Json::Value output_to_json(const Output &o) {
    Json::Value out(Json::objectValue);
    switch (o.kind) {
        case OutputKind::STREAM_TEXT:
            out["output_type"] = "stream";
            out["name"] = o.stream_name.empty() ? "stdout" : o.stream_name;
            out["text"] = o.text;
            break;
        case OutputKind::ERROR: {
            out["output_type"] = "error";
            out["ename"] = o.error_name;
            out["evalue"] = o.text;
            Json::Value tb(Json::arrayValue);
            for (const auto &line : o.trace) {
                tb.append(line);
            }
            out["traceback"] = tb;
            break;
        }
        case OutputKind::STRUCTURED_RESULT: {
            out["output_type"] = o.is_display ? "display_data" : "execute_result";
            Json::Value data(Json::objectValue);
            data["text/plain"] = o.text;
            for (const auto &kv : o.mime) {
                data[kv.first] = kv.second;
            }
            out["data"] = data;
            out["metadata"] = Json::Value(Json::objectValue);
            break;
        }
    }
    return out;
}

} // namespace detail

/**
 * @brief 解析 nbformat 4 文档
 *
 * markdown / raw 单元视为说明文字，code 单元视为可执行单元。
 */
inline Result<Document> parse_notebook(const std::string &text) {
    Json::Value root;
    std::string errs;
    if (!parse_json(text, root, errs)) {
        return Err<Document>(ErrorCode::DOCUMENT_PARSE_ERROR, "Invalid notebook JSON: " + errs);
    }
    if (!root.isObject() || !root["cells"].isArray()) {
        return Err<Document>(ErrorCode::DOCUMENT_PARSE_ERROR, "Notebook has no 'cells' array");
    }

    Document doc;
    const Json::Value &kernelspec = detail::object_member(root["metadata"], "kernelspec");
    doc.language = detail::string_member(kernelspec, "language", doc.language);

    for (const auto &cell : root["cells"]) {
        if (!cell.isObject()) {
            return Err<Document>(ErrorCode::DOCUMENT_PARSE_ERROR, "Notebook cell is not an object");
        }
        std::string type = detail::string_member(cell, "cell_type");
        Block b;
        if (type == "code") {
            b.kind = BlockKind::EXECUTABLE;
        } else if (type == "markdown" || type == "raw") {
            b.kind = BlockKind::NARRATIVE;
        } else {
            return Err<Document>(ErrorCode::DOCUMENT_PARSE_ERROR, "Unknown cell_type: '" + type + "'");
        }
        b.source = json_multiline(cell["source"]);

        const Json::Value &tags = detail::object_member(cell["metadata"], "tags");
        if (tags.isArray()) {
            for (const auto &t : tags) {
                if (t.isString()) {
                    b.tags.insert(t.asString());
                }
            }
        }
        if (b.is_executable()) {
            if (cell["execution_count"].isInt()) {
                b.execution_count = cell["execution_count"].asInt();
            }
            const Json::Value &outputs = cell["outputs"];
            if (!outputs.isNull() && !outputs.isArray()) {
                return Err<Document>(ErrorCode::DOCUMENT_PARSE_ERROR, "Cell 'outputs' is not an array");
            }
            for (const auto &out : outputs) {
                NBG_TRY_UNWRAP(output, detail::output_from_json(out));
                b.outputs.push_back(std::move(output));
            }
        }
        doc.blocks.push_back(std::move(b));
    }
    return doc;
}

/**
 * @brief 导出为 nbformat 4 JSON
 */
inline Json::Value to_notebook_json(const Document &doc) {
    Json::Value root(Json::objectValue);
    root["nbformat"] = 4;
    root["nbformat_minor"] = 5;
    root["metadata"]["kernelspec"]["language"] = doc.language;
    root["metadata"]["kernelspec"]["name"] = doc.language == "python" ? "python3" : doc.language;

    Json::Value cells(Json::arrayValue);
    for (const auto &b : doc.blocks) {
        Json::Value cell(Json::objectValue);
        cell["cell_type"] = b.is_narrative() ? "markdown" : "code";
        cell["source"] = b.source;
        Json::Value meta(Json::objectValue);
        if (!b.tags.empty()) {
            Json::Value tags(Json::arrayValue);
            for (const auto &t : b.tags) {
                tags.append(t);
            }
            meta["tags"] = tags;
        }
        cell["metadata"] = meta;
        if (b.is_executable()) {
            cell["execution_count"] = b.execution_count > 0 ? Json::Value(b.execution_count) : Json::Value();
            Json::Value outs(Json::arrayValue);
            for (const auto &o : b.outputs) {
                outs.append(detail::output_to_json(o));
            }
            cell["outputs"] = outs;
        }
        cells.append(cell);
    }
    root["cells"] = cells;
    return root;
}

/**
 * @brief 去掉标签与 skip_tags 有交集的单元，返回新文档
 */
inline Document filter_blocks_by_tags(const Document &doc, const std::set<std::string> &skip_tags) {
    Document out;
    out.language = doc.language;
    for (const auto &b : doc.blocks) {
        bool skip = false;
        for (const auto &t : b.tags) {
            if (skip_tags.count(t)) {
                skip = true;
                break;
            }
        }
        if (!skip) {
            out.blocks.push_back(b);
        }
    }
    return out;
}

/**
 * @brief 清空所有执行输出，得到可重新执行的文档
 */
inline Document strip_outputs(const Document &doc) {
    Document out = doc;
    for (auto &b : out.blocks) {
        b.outputs.clear();
        b.execution_count = 0;
    }
    return out;
}

/**
 * @brief 渲染执行后文档的纯文本预览
 */
inline std::string render_preview(const Document &doc) {
    std::ostringstream oss;
    for (size_t i = 0; i < doc.blocks.size(); i++) {
        const Block &b = doc.blocks[i];
        if (b.is_narrative()) {
            oss << "---- [" << i << "] narrative ----\n" << b.source << "\n";
            continue;
        }
        oss << "---- [" << i << "] In [" << (b.execution_count > 0 ? std::to_string(b.execution_count) : " ")
            << "] ----\n" << b.source << "\n";
        for (const auto &o : b.outputs) {
            switch (o.kind) {
                case OutputKind::STREAM_TEXT:
                    oss << o.text;
                    if (!o.text.empty() && o.text.back() != '\n') oss << "\n";
                    break;
                case OutputKind::STRUCTURED_RESULT:
                    oss << "Out: " << o.text << "\n";
                    for (const auto &kv : o.mime) {
                        oss << "<" << kv.first << ", " << kv.second.size() << " bytes>\n";
                    }
                    break;
                case OutputKind::ERROR:
                    oss << o.error_name << ": " << o.text << "\n";
                    break;
            }
        }
    }
    return oss.str();
}

} // namespace nbgrade

#endif // NBGRADE_CORE_NOTEBOOK_H
