/**
 * @file notebook_test.cpp
 * @brief nbformat 读写、标签过滤与预览
 */

#include <gtest/gtest.h>

#include "core/notebook.h"

using namespace nbgrade;

namespace {

const char *SAMPLE_NOTEBOOK = R"JSON({
  "nbformat": 4, "nbformat_minor": 5,
  "metadata": {"kernelspec": {"name": "python3", "language": "python"}},
  "cells": [
    {"cell_type": "markdown", "metadata": {}, "source": ["## Q1\n", "Load the data."]},
    {"cell_type": "code", "metadata": {"tags": ["setup"]}, "execution_count": 3,
     "source": "import pandas as pd\ndf = pd.read_csv('data.csv')",
     "outputs": [
        {"output_type": "stream", "name": "stdout", "text": ["loaded\n"]},
        {"output_type": "execute_result", "execution_count": 3, "metadata": {},
         "data": {"text/plain": ["(10, 2)"], "text/html": "<b>x</b>"}}
     ]},
    {"cell_type": "code", "metadata": {"tags": ["skip_autograde"]}, "execution_count": null,
     "source": "train_forever()", "outputs": []},
    {"cell_type": "code", "metadata": {}, "execution_count": 4, "source": "1/0",
     "outputs": [{"output_type": "error", "ename": "ZeroDivisionError",
                  "evalue": "division by zero", "traceback": ["line 1"]}]}
  ]
})JSON";

} // namespace

TEST(NotebookTest, ParsesBlocksAndOutputs) {
    auto r = parse_notebook(SAMPLE_NOTEBOOK);
    ASSERT_TRUE(r.ok()) << r.error().to_string();
    const Document &doc = r.value();
    ASSERT_EQ(doc.blocks.size(), 4u);
    EXPECT_EQ(doc.language, "python");

    EXPECT_TRUE(doc.blocks[0].is_narrative());
    EXPECT_EQ(doc.blocks[0].source, "## Q1\nLoad the data.");

    const Block &code = doc.blocks[1];
    EXPECT_TRUE(code.is_executable());
    EXPECT_EQ(code.execution_count, 3);
    EXPECT_EQ(code.tags.count("setup"), 1u);
    ASSERT_EQ(code.outputs.size(), 2u);
    EXPECT_EQ(code.outputs[0].kind, OutputKind::STREAM_TEXT);
    EXPECT_EQ(code.outputs[0].text, "loaded\n");
    EXPECT_EQ(code.outputs[1].kind, OutputKind::STRUCTURED_RESULT);
    EXPECT_EQ(code.outputs[1].text, "(10, 2)");
    EXPECT_EQ(code.outputs[1].mime.at("text/html"), "<b>x</b>");

    const Output &err = doc.blocks[3].outputs.at(0);
    EXPECT_EQ(err.kind, OutputKind::ERROR);
    EXPECT_EQ(err.error_name, "ZeroDivisionError");
    EXPECT_EQ(err.text, "division by zero");
}

TEST(NotebookTest, RejectsMalformedDocuments) {
    EXPECT_TRUE(parse_notebook("not json").is_error());
    EXPECT_TRUE(parse_notebook(R"({"metadata": {}})").is_error());

    auto bad_cell = parse_notebook(R"({"cells": [{"cell_type": "widget", "source": ""}]})");
    ASSERT_TRUE(bad_cell.is_error());
    EXPECT_EQ(bad_cell.error().code(), ErrorCode::DOCUMENT_PARSE_ERROR);
}

TEST(NotebookTest, WrongNestedTypesAreToleratedOrRejectedWithoutThrowing) {
    // metadata 类型不对时忽略
    Result<Document> r(ErrorCode::UNKNOWN_ERROR);
    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [], "metadata": []})"));
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().blocks.empty());

    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [
        {"cell_type": "markdown", "metadata": "x", "source": "# Q1"},
        {"cell_type": "code", "metadata": {"tags": "long"}, "source": ["x = 1"], "outputs": []}
    ], "metadata": {"kernelspec": 3}})"));
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value().blocks.size(), 2u);
    EXPECT_TRUE(r.value().blocks[1].tags.empty());
    EXPECT_EQ(r.value().language, "python");

    // 输出条目不是对象时整篇拒绝
    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [
        {"cell_type": "code", "source": "x", "outputs": ["oops"]}]})"));
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::DOCUMENT_PARSE_ERROR);

    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [
        {"cell_type": "code", "source": "x", "outputs": {"a": 1}}]})"));
    EXPECT_TRUE(r.is_error());

    // 类型不对的字段取默认值
    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [
        {"cell_type": "code", "source": "x", "outputs": [
            {"output_type": "error", "ename": ["E"], "evalue": 1, "traceback": "tb"},
            {"output_type": ["stream"], "text": "hi"}
        ]}]})"));
    ASSERT_TRUE(r.ok());
    const Block &b = r.value().blocks[0];
    ASSERT_EQ(b.outputs.size(), 2u);
    EXPECT_EQ(b.outputs[0].kind, OutputKind::ERROR);
    EXPECT_EQ(b.outputs[0].error_name, "");
    EXPECT_TRUE(b.outputs[0].trace.empty());
    EXPECT_EQ(b.outputs[1].kind, OutputKind::STRUCTURED_RESULT);

    EXPECT_NO_THROW(r = parse_notebook(R"({"cells": [{"cell_type": 7}]})"));
    EXPECT_TRUE(r.is_error());
}

TEST(NotebookTest, SkipTagsRemoveBlocks) {
    auto r = parse_notebook(SAMPLE_NOTEBOOK);
    ASSERT_TRUE(r.ok());
    Document filtered = filter_blocks_by_tags(r.value(), {"skip_autograde", "long"});
    ASSERT_EQ(filtered.blocks.size(), 3u);
    for (const auto &b : filtered.blocks) {
        EXPECT_EQ(b.tags.count("skip_autograde"), 0u);
    }
    // 原文档不受影响
    EXPECT_EQ(r.value().blocks.size(), 4u);
}

TEST(NotebookTest, StripOutputsClearsExecutionState) {
    auto r = parse_notebook(SAMPLE_NOTEBOOK);
    ASSERT_TRUE(r.ok());
    Document clean = strip_outputs(r.value());
    for (const auto &b : clean.blocks) {
        EXPECT_TRUE(b.outputs.empty());
        EXPECT_EQ(b.execution_count, 0);
    }
    EXPECT_EQ(clean.blocks[1].source, r.value().blocks[1].source);
}

TEST(NotebookTest, ExportKeepsOutputs) {
    auto r = parse_notebook(SAMPLE_NOTEBOOK);
    ASSERT_TRUE(r.ok());
    Json::Value exported = to_notebook_json(r.value());
    EXPECT_EQ(exported["nbformat"].asInt(), 4);
    ASSERT_EQ(exported["cells"].size(), 4u);

    auto again = parse_notebook(to_json_line(exported));
    ASSERT_TRUE(again.ok()) << again.error().to_string();
    EXPECT_EQ(again.value().blocks[3].outputs.at(0).error_name, "ZeroDivisionError");
    EXPECT_EQ(again.value().blocks[1].outputs.at(1).text, "(10, 2)");
}

TEST(NotebookTest, PreviewShowsSourcesAndOutputs) {
    auto r = parse_notebook(SAMPLE_NOTEBOOK);
    ASSERT_TRUE(r.ok());
    std::string preview = render_preview(r.value());
    EXPECT_NE(preview.find("Load the data."), std::string::npos);
    EXPECT_NE(preview.find("loaded"), std::string::npos);
    EXPECT_NE(preview.find("ZeroDivisionError: division by zero"), std::string::npos);
}
