#include <iostream>
#include <sstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <dsm/cli/dsm_cli.h>
#include <dsm/core/exit_codes.h>

#include "../../common/test_helpers.h"

using namespace dsm;
using namespace dsm::cli;
using dsm::tests::ScopedEnv;
using dsm::tests::TempDirScope;
using dsm::tests::write_file;
using dsm::tests::write_script;

namespace fs = std::filesystem;

class DsmCliTest : public ::testing::Test {
protected:
    // Runs `dsm --config <missing> --base <tmp> args...` in a fresh CLI and captures stdout.
    int run(std::vector<std::string> args) {
        args.insert(args.begin(), {"dsm", "--config", (root_.path() / "none.toml").string(),
                                   "--base", base_.string()});
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(a.data());
        }

        std::ostringstream captured;
        std::streambuf* oldCout = std::cout.rdbuf(captured.rdbuf());
        DsmCLI cli;
        int code = cli.run(static_cast<int>(argv.size()), argv.data());
        std::cout.rdbuf(oldCout);
        output_ = captured.str();
        return code;
    }

    fs::path addSite(const std::string& id, int port) {
        auto dir = base_ / ("site-" + id + "-" + std::to_string(port));
        fs::create_directories(dir / "www" / "run");
        fs::create_directories(dir / "db" / "run");
        return dir;
    }

    TempDirScope root_;
    fs::path base_ = root_.path() / "www";
    ScopedEnv baseEnv_{"DSM_BASE", nullptr};
    ScopedEnv levelEnv_{"DSM_LOG_LEVEL", "off"};
    ScopedEnv ctlEnv_{"DSM_CTL_BIN", "/bin/true"};
    std::string output_;
};

TEST_F(DsmCliTest, VersionExitsCleanly) {
    EXPECT_EQ(run({"--version"}), exit_code::Success);
}

TEST_F(DsmCliTest, SubcommandIsRequired) {
    EXPECT_EQ(run({}), exit_code::Usage);
    EXPECT_EQ(run({"frobnicate"}), exit_code::Usage);
}

TEST_F(DsmCliTest, ListOnEmptyBase) {
    EXPECT_EQ(run({"list"}), exit_code::Success);
    EXPECT_NE(output_.find("No sites"), std::string::npos);
}

TEST_F(DsmCliTest, ListAsJson) {
    addSite("blog", 10000);
    addSite("shop", 10003);
    ASSERT_EQ(run({"list", "--json"}), exit_code::Success);

    auto j = nlohmann::json::parse(output_);
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[0]["id"], "blog");
    EXPECT_EQ(j[0]["db_port"], 10002);
    EXPECT_EQ(j[1]["id"], "shop");
    EXPECT_EQ(j[1]["www"], "stopped");
}

TEST_F(DsmCliTest, GlobalJsonFlagAppliesToList) {
    addSite("blog", 10000);
    ASSERT_EQ(run({"--json", "ls"}), exit_code::Success);
    auto j = nlohmann::json::parse(output_);
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["http_port"], 10000);
}

TEST_F(DsmCliTest, ValidationFailuresExitWithUsage) {
    EXPECT_EQ(run({"install", "9lives"}), exit_code::Usage);
    EXPECT_FALSE(fs::exists(base_));

    EXPECT_EQ(run({"install", "blog", "--db", "sqlite"}), exit_code::Usage);
    EXPECT_EQ(run({"remove", "ghost"}), exit_code::Usage);
    EXPECT_EQ(run({"start", "ghost"}), exit_code::Usage);
    EXPECT_EQ(run({"stop", "blog", "--service", "cache"}), exit_code::Usage);
}

TEST_F(DsmCliTest, RemoveDeletesSite) {
    auto dir = addSite("blog", 10000);
    EXPECT_EQ(run({"rm", "blog"}), exit_code::Success);
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(DsmCliTest, StopTimeoutExitsWithTwo) {
    auto dir = addSite("blog", 10000);
    write_script(dir / "www.stop", "exit 2");
    write_script(dir / "db.stop", "exit 0");
    EXPECT_EQ(run({"stop", "blog"}), exit_code::Timeout);
}

TEST_F(DsmCliTest, StartRunsOneService) {
    auto dir = addSite("blog", 10000);
    auto marker = root_.path() / "marker";
    write_script(dir / "www.start", "echo www >> '" + marker.string() + "'");
    EXPECT_EQ(run({"start", "blog", "-s", "www"}), exit_code::Success);
    EXPECT_EQ(dsm::tests::read_file(marker), "www\n");
}

TEST_F(DsmCliTest, LogsPrintsTail) {
    auto dir = addSite("blog", 10000);
    write_file(dir / "www" / "log" / "apache2_error.log", "one\ntwo\nthree\n");
    ASSERT_EQ(run({"logs", "blog", "-n", "2"}), exit_code::Success);
    EXPECT_NE(output_.find("three"), std::string::npos);
    EXPECT_EQ(output_.find("one"), std::string::npos);
}

TEST_F(DsmCliTest, ApplicationsListsArchives) {
    write_file(base_ / "application" / "my-blog.tar.gz", "");
    ASSERT_EQ(run({"--json", "applications"}), exit_code::Success);
    auto j = nlohmann::json::parse(output_);
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["name"], "my-blog");
}
