/**
 * @file segmenter.h
 * @brief 分段引擎
 *
 * 把执行后的文档切分为与评分标准小节对应的连续区间（SectionSpan）。
 *
 * - 有评分标准时：说明单元中尚未打开、以整词形式最早出现（不区分大小写）的小节 id 开启该小节，
 *   已打开 id 的再次提及不占用该单元
 * - 没有评分标准或上述方式一无所获时：识别 "Q1" / "## Question 2." 形式的标题，
 *   或代码单元首行的 "# Q3" / "# AUTOGRADE: Q3" 注释
 *
 * 区间从标记单元开始，到下一区间起点的前一个单元（或最后一个单元）结束。
 * 纯函数：同一输入总是得到同一结果。
 */

#ifndef NBGRADE_GRADING_SEGMENTER_H
#define NBGRADE_GRADING_SEGMENTER_H

#include <string>
#include <vector>
#include <map>
#include <set>
#include <regex>

#include "core/types.h"
#include "core/rubric.h"
#include "core/utils.h"
#include "core/grader_logger.h"

namespace nbgrade {

/**
 * @brief 文档中一个小节占据的单元区间
 */
struct SectionSpan {
    std::string section_id;
    std::string title;
    size_t start_index = 0;
    size_t end_index = 0;               ///< 含
    std::vector<size_t> block_indices;
};

/**
 * @brief 分段结果
 */
struct Segmentation {
    std::map<std::string, SectionSpan> spans;
    std::vector<std::string> order;     ///< 按 start_index 排列的 id

    bool empty() const { return spans.empty(); }
    size_t size() const { return spans.size(); }

    const SectionSpan* find(const std::string &id) const {
        auto it = spans.find(id);
        return it == spans.end() ? nullptr : &it->second;
    }
};

namespace detail {

struct SpanMarker {
    size_t block_index;
    std::string id;
    std::string title;
};

/**
 * @brief 去掉 markdown 标题符号与强调符号
 */
inline std::string strip_markup(const std::string &line) {
    static const std::regex heading_re(R"(^\s*#+\s*)");
    std::string s = std::regex_replace(line, heading_re, "");
    std::string out;
    for (char c : s) {
        if (c != '*' && c != '_' && c != '`') out += c;
    }
    return trim(out);
}

inline std::string first_nonblank_line(const std::string &text) {
    for (const auto &line : split_lines(text)) {
        if (!trim(line).empty()) return line;
    }
    return "";
}

inline std::vector<SpanMarker> guided_markers(const Document &doc, const Rubric &rubric) {
    std::vector<std::pair<std::regex, const Section*>> patterns;
    for (const auto &s : rubric.sections()) {
        std::string pat = "(^|[^A-Za-z0-9_])" + regex_escape(s.id()) + "([^A-Za-z0-9_]|$)";
        patterns.emplace_back(std::regex(pat, std::regex::icase), &s);
    }

    std::vector<SpanMarker> markers;
    std::set<std::string> opened;
    for (size_t i = 0; i < doc.blocks.size(); i++) {
        const Block &b = doc.blocks[i];
        if (!b.is_narrative()) continue;
        // 未打开的 id 中取在文本里最早出现的一个，位置相同时按评分标准顺序
        const Section *best = nullptr;
        size_t best_pos = std::string::npos;
        for (const auto &p : patterns) {
            if (opened.count(p.second->id())) continue;
            std::smatch m;
            if (!std::regex_search(b.source, m, p.first)) continue;
            size_t pos = static_cast<size_t>(m.position(0) + m.length(1));
            if (!best || pos < best_pos) {
                best = p.second;
                best_pos = pos;
            }
        }
        if (best) {
            opened.insert(best->id());
            markers.push_back({i, best->id(), best->title()});
        }
    }
    return markers;
}

inline std::vector<SpanMarker> heuristic_markers(const Document &doc) {
    static const std::regex heading_re(
        R"(^\s*(#+\s*)?(\*\*|__)?\s*(Q|Question)\s*(\d+)\s*(\*\*|__)?\s*([.:)\-]|$|\s))",
        std::regex::icase);
    static const std::regex comment_re(
        R"(^\s*#\s*(AUTOGRADE\s*:\s*)?Q(\d+)\b)",
        std::regex::icase);

    std::vector<SpanMarker> markers;
    std::set<std::string> opened;
    for (size_t i = 0; i < doc.blocks.size(); i++) {
        const Block &b = doc.blocks[i];
        std::string line = first_nonblank_line(b.source);
        if (line.empty()) continue;

        std::smatch m;
        if (b.is_narrative()) {
            if (std::regex_search(line, m, heading_re)) {
                std::string id = "Q" + m[4].str();
                if (opened.insert(id).second) {
                    markers.push_back({i, id, strip_markup(line)});
                }
            }
        } else if (std::regex_search(line, m, comment_re)) {
            std::string id = "Q" + m[2].str();
            if (opened.insert(id).second) {
                markers.push_back({i, id, id});
            }
        }
    }
    return markers;
}

inline Segmentation build_spans(const std::vector<SpanMarker> &markers, size_t n_blocks) {
    Segmentation seg;
    for (size_t k = 0; k < markers.size(); k++) {
        SectionSpan span;
        span.section_id = markers[k].id;
        span.title = markers[k].title;
        span.start_index = markers[k].block_index;
        span.end_index = (k + 1 < markers.size()) ? markers[k + 1].block_index - 1 : n_blocks - 1;
        for (size_t i = span.start_index; i <= span.end_index; i++) {
            span.block_indices.push_back(i);
        }
        seg.order.push_back(span.section_id);
        seg.spans[span.section_id] = std::move(span);
    }
    return seg;
}

} // namespace detail

/**
 * @brief 分段
 * @param rubric 可为空，此时只用标题启发式
 */
inline Segmentation segment(const Document &doc, const Rubric *rubric = nullptr) {
    if (doc.blocks.empty()) {
        return Segmentation();
    }

    std::vector<detail::SpanMarker> markers;
    if (rubric && !rubric->empty()) {
        markers = detail::guided_markers(doc, *rubric);
        SLOG_DEBUG << "Rubric-guided segmentation found " << markers.size() << " section(s)";
    }
    if (markers.empty()) {
        markers = detail::heuristic_markers(doc);
        SLOG_DEBUG << "Heuristic segmentation found " << markers.size() << " section(s)";
    }
    return detail::build_spans(markers, doc.blocks.size());
}

} // namespace nbgrade

#endif // NBGRADE_GRADING_SEGMENTER_H
