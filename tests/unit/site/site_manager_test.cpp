#include <gtest/gtest.h>
#include <dsm/site/site_manager.h>

#include <chrono>
#include <csignal>
#include <limits>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include "../../common/test_helpers.h"

using namespace dsm;
using namespace dsm::site;
using dsm::tests::read_file;
using dsm::tests::TempDirScope;
using dsm::tests::write_file;
using dsm::tests::write_script;

namespace fs = std::filesystem;

namespace {

/**
 * Stack that renders templates from the test's override directory and
 * records what happens to it in a marker file.
 */
class FakeStack final : public IServiceStack {
public:
    FakeStack(ServiceKind kind, fs::path marker) : kind_(kind), marker_(std::move(marker)) {}

    std::string name() const override { return std::string("fake-") + serviceName(kind_); }
    ServiceKind kind() const override { return kind_; }

    std::vector<fs::path> directories(const Site& site) const override {
        return {site.serviceDir(kind_), site.logDir(kind_), site.runDir(kind_)};
    }

    Result<templating::SubstitutionContext> context(const Site& site) const override {
        return templating::SubstitutionContext{{"SITE", site.id},
                                               {"PORT", std::to_string(site.port)},
                                               {"NAME", serviceName(kind_)},
                                               {"MARKER", marker_.string()}};
    }

    std::vector<TemplateFile> files() const override {
        const std::string prefix = serviceName(kind_);
        return {{confTemplate, prefix + ".conf", kConfigMode},
                {"fake/start", prefix + ".start", kScriptMode},
                {"fake/stop", prefix + ".stop", kScriptMode}};
    }

    Result<void> bootstrap(const Site& site) const override {
        ++bootstraps;
        if (failBootstrap) {
            return Error{ErrorCode::DatabaseBootstrapFailed,
                         "Database bootstrap of site " + site.id + " failed: fake"};
        }
        return Result<void>();
    }

    std::string confTemplate = "fake/conf";
    bool failBootstrap = false;
    mutable int bootstraps = 0;

private:
    ServiceKind kind_;
    fs::path marker_;
};

// Forked `sleep 30` standing in for a site daemon.
pid_t spawnDaemon() {
    pid_t pid = ::fork();
    if (pid == 0) {
        ::execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
        _exit(127);
    }
    return pid;
}

// Reaps `pid` if it exits within `timeout`; kills it otherwise.
bool reapedWithin(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    return false;
}

} // namespace

class SiteManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.baseDir = root_.path() / "www";
        settings_.templateDir = root_.path() / "templates";
        settings_.user = "tester";
        settings_.group = "staff";

        write_file(settings_.templateDir / "fake/conf.template",
                   "site=***SITE*** port=***PORT***\n");
        write_file(settings_.templateDir / "fake/broken.template", "value=***UNDEFINED***\n");
        write_file(settings_.templateDir / "fake/start.template",
                   "#!/bin/sh\necho start-***NAME*** >> '***MARKER***'\n");
        write_file(settings_.templateDir / "fake/stop.template",
                   "#!/bin/sh\necho stop-***NAME*** >> '***MARKER***'\n");

        templates_ = std::make_unique<templating::TemplateLibrary>(settings_.templateDir);
        manager_ = std::make_unique<SiteManager>(settings_, *templates_);
    }

    InstallRequest request(const std::string& id) const {
        InstallRequest req;
        req.id = id;
        req.web = &web_;
        req.database = &db_;
        return req;
    }

    std::string marker() const { return read_file(marker_); }

    TempDirScope root_;
    fs::path marker_ = root_.path() / "marker";
    config::Settings settings_;
    std::unique_ptr<templating::TemplateLibrary> templates_;
    std::unique_ptr<SiteManager> manager_;
    FakeStack web_{ServiceKind::Web, marker_};
    FakeStack db_{ServiceKind::Database, marker_};
};

TEST_F(SiteManagerTest, InstallCreatesSiteDirectoryAndFiles) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed) << installed.error().message;

    const Site& site = installed.value();
    EXPECT_EQ(site.port, 10000);
    EXPECT_EQ(site.directory, settings_.baseDir / "site-blog-10000");
    EXPECT_TRUE(fs::is_directory(site.logDir(ServiceKind::Web)));
    EXPECT_TRUE(fs::is_directory(site.runDir(ServiceKind::Database)));

    EXPECT_EQ(read_file(site.directory / "www.conf"), "site=blog port=10000\n");
    EXPECT_EQ(fs::status(site.directory / "db.conf").permissions(), kConfigMode);
    EXPECT_EQ(fs::status(site.directory / "www.start").permissions(), kScriptMode);
    EXPECT_EQ(web_.bootstraps, 1);
    EXPECT_EQ(db_.bootstraps, 1);
}

TEST_F(SiteManagerTest, SecondSiteGetsNextPortBlock) {
    ASSERT_TRUE(manager_->install(request("blog")));
    auto second = manager_->install(request("shop"));
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_EQ(second.value().port, 10003);
    EXPECT_EQ(second.value().databasePort(), 10005);
}

TEST_F(SiteManagerTest, ExplicitPortIsHonouredAndChecked) {
    auto req = request("blog");
    req.port = 10030;
    auto installed = manager_->install(req);
    ASSERT_TRUE(installed) << installed.error().message;
    EXPECT_EQ(installed.value().directory.filename(), "site-blog-10030");

    auto clash = request("shop");
    clash.port = 10031;
    auto res = manager_->install(clash);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::PortRangeExhausted);

    auto outside = request("wiki");
    outside.port = 20000;
    res = manager_->install(outside);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SiteManagerTest, PortPastTheRangeCreatesNothing) {
    for (int port : {std::numeric_limits<int>::max(), settings_.portMax + 1}) {
        auto req = request("blog");
        req.port = port;
        auto res = manager_->install(req);
        ASSERT_FALSE(res) << port;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument) << port;
    }
    EXPECT_TRUE(manager_->registry().sites().empty());
    EXPECT_FALSE(fs::exists(settings_.baseDir / "site-blog-2147483647"));
    EXPECT_EQ(web_.bootstraps, 0);
}

TEST_F(SiteManagerTest, DuplicateIdIsRejected) {
    ASSERT_TRUE(manager_->install(request("blog")));
    auto again = manager_->install(request("blog"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::DuplicateSite);
    EXPECT_EQ(manager_->registry().sites().size(), 1u);
}

TEST_F(SiteManagerTest, InvalidIdTouchesNothing) {
    auto res = manager_->install(request("9lives"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidIdentifier);
    EXPECT_FALSE(fs::exists(settings_.baseDir));
}

TEST_F(SiteManagerTest, MissingStackIsInvalidArgument) {
    auto req = request("blog");
    req.database = nullptr;
    auto res = manager_->install(req);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SiteManagerTest, FailedBootstrapRollsBack) {
    db_.failBootstrap = true;
    auto res = manager_->install(request("blog"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::DatabaseBootstrapFailed);
    EXPECT_FALSE(fs::exists(settings_.baseDir / "site-blog-10000"));
    EXPECT_TRUE(manager_->registry().sites().empty());

    // The id and the ports are free again
    db_.failBootstrap = false;
    auto retry = manager_->install(request("blog"));
    ASSERT_TRUE(retry) << retry.error().message;
    EXPECT_EQ(retry.value().port, 10000);
}

TEST_F(SiteManagerTest, MissingTemplateVariableRollsBack) {
    web_.confTemplate = "fake/broken";
    auto res = manager_->install(request("blog"));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::MissingVariable);
    EXPECT_FALSE(fs::exists(settings_.baseDir / "site-blog-10000"));
    EXPECT_EQ(db_.bootstraps, 0);
}

TEST_F(SiteManagerTest, StartsDatabaseFirstAndStopsItLast) {
    ASSERT_TRUE(manager_->install(request("blog")));

    ASSERT_TRUE(manager_->start("blog", std::nullopt));
    EXPECT_EQ(marker(), "start-db\nstart-www\n");

    ASSERT_TRUE(manager_->stop("blog", std::nullopt));
    EXPECT_EQ(marker(), "start-db\nstart-www\nstop-www\nstop-db\n");
}

TEST_F(SiteManagerTest, SingleServiceCanBeControlled) {
    ASSERT_TRUE(manager_->install(request("blog")));
    ASSERT_TRUE(manager_->start("blog", ServiceKind::Web));
    EXPECT_EQ(marker(), "start-www\n");
}

TEST_F(SiteManagerTest, StopContinuesPastAFailingService) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed);
    write_script(installed.value().scriptPath(ServiceKind::Web, ServiceAction::Stop), "exit 1");

    auto res = manager_->stop("blog", std::nullopt);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InternalError);
    EXPECT_EQ(marker(), "stop-db\n");
}

TEST_F(SiteManagerTest, UnknownAndInvalidSitesAreRejected) {
    auto res = manager_->start("ghost", std::nullopt);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NotFound);

    res = manager_->remove("ghost");
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(fs::exists(settings_.baseDir));

    res = manager_->stop("not-valid", std::nullopt);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidIdentifier);
}

TEST_F(SiteManagerTest, RemoveDeletesTheWholeTree) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed);
    const fs::path dir = installed.value().directory;
    // Read-only content must not stop the removal
    write_file(dir / "db" / "data" / "ibdata1", "x");
    fs::permissions(dir / "db" / "data", fs::perms::owner_read | fs::perms::owner_exec);

    ASSERT_TRUE(manager_->remove("blog"));
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_FALSE(manager_->registry().findSite("blog").has_value());
}

TEST_F(SiteManagerTest, RemoveStopsRunningDaemonBeforeDeleting) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed);
    const Site& site = installed.value();

    pid_t daemon = spawnDaemon();
    ASSERT_GT(daemon, 0);
    const fs::path pidFile = site.pidFile(ServiceKind::Web);
    write_file(pidFile, std::to_string(daemon) + "\n");
    write_script(site.scriptPath(ServiceKind::Web, ServiceAction::Stop),
                 "if [ -f '" + (site.directory / "www.conf").string() + "' ]; then\n"
                 "  echo stop-www-tree-present >> '" + marker_.string() + "'\n"
                 "fi\n"
                 "kill " + std::to_string(daemon) + "\n"
                 "rm -f '" + pidFile.string() + "'");

    ASSERT_TRUE(manager_->remove("blog"));
    EXPECT_TRUE(reapedWithin(daemon, std::chrono::seconds(5)));
    EXPECT_EQ(marker(), "stop-www-tree-present\n");
    EXPECT_FALSE(fs::exists(site.directory));
}

TEST_F(SiteManagerTest, RemoveSignalsDaemonWhenStopScriptFails) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed);
    const Site& site = installed.value();

    pid_t daemon = spawnDaemon();
    ASSERT_GT(daemon, 0);
    write_file(site.pidFile(ServiceKind::Database), std::to_string(daemon));
    write_script(site.scriptPath(ServiceKind::Database, ServiceAction::Stop), "exit 1");

    ASSERT_TRUE(manager_->remove("blog"));
    EXPECT_TRUE(reapedWithin(daemon, std::chrono::seconds(5)));
    EXPECT_FALSE(fs::exists(site.directory));
}

TEST_F(SiteManagerTest, LogFilesListsBothServices) {
    auto installed = manager_->install(request("blog"));
    ASSERT_TRUE(installed);
    const Site& site = installed.value();
    write_file(site.logDir(ServiceKind::Web) / "apache2_error.log", "e\n");
    write_file(site.logDir(ServiceKind::Database) / "mysql_error.log", "m\n");

    auto logs = manager_->logFiles("blog");
    ASSERT_TRUE(logs);
    ASSERT_EQ(logs.value().size(), 2u);
    EXPECT_EQ(logs.value()[0].filename(), "mysql_error.log"); // db/ sorts before www/
    EXPECT_EQ(logs.value()[1].filename(), "apache2_error.log");
}
