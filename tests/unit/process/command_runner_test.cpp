#include <gtest/gtest.h>
#include <dsm/process/command_runner.h>

#include "../../common/test_helpers.h"

using namespace dsm;
using namespace dsm::process;
using dsm::tests::TempDirScope;
using dsm::tests::write_script;

TEST(CommandRunnerTest, CapturesStdout) {
    CommandSpec spec;
    spec.argv = {"echo", "hello", "world"};
    spec.captureOutput = true;
    auto res = runCommand(spec);
    ASSERT_TRUE(res) << res.error().message;
    EXPECT_TRUE(res.value().ok());
    EXPECT_EQ(res.value().output, "hello world\n");
}

TEST(CommandRunnerTest, FeedsInput) {
    CommandSpec spec;
    spec.argv = {"cat"};
    spec.input = "CREATE DATABASE x;\n";
    spec.captureOutput = true;
    auto res = runCommand(spec);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().output, "CREATE DATABASE x;\n");
}

TEST(CommandRunnerTest, ReportsExitStatus) {
    auto res = runCommand(CommandSpec{.argv = {"/bin/sh", "-c", "exit 3"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().exitCode, 3);
    EXPECT_FALSE(res.value().ok());
}

TEST(CommandRunnerTest, ChildThatIgnoresInputDoesNotKillUs) {
    CommandSpec spec;
    spec.argv = {"/bin/sh", "-c", "exit 0"};
    spec.input = std::string(1 << 20, 'x');
    auto res = runCommand(spec);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().exitCode, 0);
}

TEST(CommandRunnerTest, MissingExecutableExits127) {
    auto res = runCommand(CommandSpec{.argv = {"/nonexistent/dsm-binary"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().exitCode, 127);
}

TEST(CommandRunnerTest, EmptyCommandIsInvalid) {
    auto res = runCommand(CommandSpec{});
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}

TEST(CommandRunnerTest, RunsInWorkdir) {
    TempDirScope dir;
    CommandSpec spec;
    spec.argv = {"pwd"};
    spec.captureOutput = true;
    spec.workdir = dir.path();
    auto res = runCommand(spec);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().output, std::filesystem::canonical(dir.path()).string() + "\n");
}

TEST(FindExecutableTest, SearchesPathThenGlobHints) {
    EXPECT_FALSE(findExecutable("sh").empty());
    EXPECT_TRUE(findExecutable("dsm-no-such-tool-4711").empty());

    TempDirScope dir;
    auto tool = write_script(dir.path() / "pkg-15" / "bin" / "dsm-hinted-tool", "exit 0");
    auto found = findExecutable("dsm-hinted-tool", {(dir.path() / "pkg-*" / "bin").string()});
    EXPECT_EQ(found, tool);
}

TEST(FindExecutableTest, CurrentExecutableDirIsKnown) {
    auto dir = currentExecutableDir();
    ASSERT_FALSE(dir.empty());
    EXPECT_TRUE(std::filesystem::is_directory(dir));
}
