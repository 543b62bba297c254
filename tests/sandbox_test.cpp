/**
 * @file sandbox_test.cpp
 * @brief 一次性子进程：输出重定向、超时、环境变量与文件大小限制
 *
 * 需要 /bin/sh，不存在时跳过。
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <sys/resource.h>
#include <unistd.h>

#include "sandbox/sandbox.h"
#include "core/utils.h"

using namespace nbgrade;
using namespace nbgrade::sandbox;
namespace fs = std::filesystem;

namespace {

const char *SHELL = "/bin/sh";

class SandboxTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        if (access(SHELL, X_OK) != 0) {
            GTEST_SKIP() << SHELL << " not available";
        }
        dir = (fs::temp_directory_path() / ("nbgrade_sbx_" + std::to_string(::getpid()))).string();
        fs::create_directories(dir);
    }

    void TearDown() override {
        if (!dir.empty()) {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }
    }

    std::string log_path() const { return dir + "/run.log"; }

    std::string log_text() const {
        std::string text;
        EXPECT_TRUE(read_file(log_path(), text));
        return text;
    }
};

} // namespace

TEST_F(SandboxTest, StdoutAndStderrGoToLogFile) {
    auto r = run_program(SHELL, {"-c", "echo out; echo err >&2"}, 5000, "", log_path());
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().ok());
    std::string text = log_text();
    EXPECT_NE(text.find("out"), std::string::npos);
    EXPECT_NE(text.find("err"), std::string::npos);
}

TEST_F(SandboxTest, OutputIsDiscardedWithoutLogFile) {
    // 子进程在 dir 中运行，没有日志文件时不会产生任何文件
    auto r = run_program(SHELL, {"-c", "echo noisy; echo traceback >&2; exit 1"}, 5000, dir);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, RunStatus::RUNTIME_ERROR);
    EXPECT_TRUE(fs::is_empty(dir));
}

TEST_F(SandboxTest, NoFileSizeLimitIsImposed) {
    struct rlimit parent;
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &parent), 0);
    if (parent.rlim_cur != RLIM_INFINITY) {
        GTEST_SKIP() << "test runner itself has a file size limit";
    }
    auto r = run_program(SHELL, {"-c", "ulimit -f"}, 5000, "", log_path());
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().ok());
    EXPECT_EQ(trim(log_text()), "unlimited");
}

TEST_F(SandboxTest, DeadlineKillsProcess) {
    auto r = run_program(SHELL, {"-c", "sleep 10"}, 200);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, RunStatus::TIME_LIMIT);
    EXPECT_FALSE(r.value().ok());
    EXPECT_LT(r.value().real_time_ms, 5000u);
}

TEST_F(SandboxTest, ExitCodeIsReported) {
    auto r = run_program(SHELL, {"-c", "exit 3"}, 5000);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().status, RunStatus::RUNTIME_ERROR);
    EXPECT_EQ(r.value().exit_code, 3);
}

TEST_F(SandboxTest, EnvOverridesInheritedVariable) {
    ASSERT_EQ(setenv("NBGRADE_SANDBOX_VAR", "parent", 1), 0);
    auto r = run_program(SHELL, {"-c", "echo \"$NBGRADE_SANDBOX_VAR\"; pwd"}, 5000, dir, log_path(),
                         {"NBGRADE_SANDBOX_VAR=child"});
    unsetenv("NBGRADE_SANDBOX_VAR");
    ASSERT_TRUE(r.ok());
    std::vector<std::string> lines = split_lines(trim(log_text()));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "child");
    EXPECT_EQ(fs::canonical(lines[1]), fs::canonical(dir));
}

TEST_F(SandboxTest, MissingProgramIsAnError) {
    auto r = run_program(dir + "/no_such_program", {}, 1000);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error().code(), ErrorCode::SANDBOX_ERROR);
}
