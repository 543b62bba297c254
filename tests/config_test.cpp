/**
 * @file config_test.cpp
 * @brief 配置文件解析与日志级别
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

#include "core/config.h"
#include "core/logger.h"

using namespace nbgrade;
namespace fs = std::filesystem;

namespace {

std::string write_conf(const std::string &name, const std::string &content) {
    std::string path = (fs::temp_directory_path() / (name + "_" + std::to_string(::getpid()) + ".conf")).string();
    EXPECT_TRUE(write_file(path, content));
    return path;
}

} // namespace

TEST(ConfigTest, LoadsKeyValuePairs) {
    std::string path = write_conf("nbg_cfg", R"(# batch
rubric              /data/hw3/rubric.json
n_subjects          2
subject_1           alice
timeout_per_block   12.5
retry_on_timeout    off
skip_tags           skip_autograde, long,,
)");
    Config config;
    ASSERT_TRUE(config.load(path).ok());
    EXPECT_EQ(config.get_str("rubric"), "/data/hw3/rubric.json");
    EXPECT_EQ(config.get_int("n_subjects"), 2);
    EXPECT_EQ(config.get_str("subject", 1), "alice");
    EXPECT_DOUBLE_EQ(config.get_double("timeout_per_block"), 12.5);
    EXPECT_FALSE(config.get_bool("retry_on_timeout", true));
    EXPECT_TRUE(config.get_bool("missing", true));

    auto tags = config.get_list("skip_tags");
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[0], "skip_autograde");
    EXPECT_EQ(tags[1], "long");

    EXPECT_TRUE(config.require_str("rubric").ok());
    auto missing = config.require_str("work_root");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), ErrorCode::CONFIG_MISSING_KEY);

    config.add("rubric", "/other.json");
    EXPECT_TRUE(config.is("rubric", "/data/hw3/rubric.json"));
    fs::remove(path);
}

TEST(ConfigTest, KeyWithoutValueIsRejected) {
    std::string path = write_conf("nbg_cfg_bad", "rubric\n");
    Config config;
    auto r = config.load(path);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::CONFIG_PARSE_ERROR);
    fs::remove(path);

    EXPECT_EQ(Config().load("/nonexistent/grader.conf").error().code(), ErrorCode::FILE_NOT_FOUND);
}

TEST(LoggerTest, LevelFilteringAndFormatting) {
    auto sink = std::make_shared<MemorySink>();
    Logger logger("test");
    logger.set_level(LogLevel::WARN).show_timestamp(false).show_name(true);
    logger.add_sink(sink);

    LOGGER_INFO(logger) << "dropped " << 1;
    LOGGER_WARN(logger) << "kept " << 2;
    EXPECT_EQ(sink->size(), 1u);
    EXPECT_TRUE(sink->contains("[test] kept 2", LogLevel::WARN));
    EXPECT_FALSE(sink->contains("dropped"));
    EXPECT_FALSE(sink->contains("kept", LogLevel::ERROR));
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("Debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("verbose", LogLevel::ERROR), LogLevel::ERROR);
}
