#include <gtest/gtest.h>
#include <dsm/site/site_registry.h>

#include <unistd.h>

#include "../../common/test_helpers.h"

namespace fs = std::filesystem;
using namespace dsm::site;
using dsm::tests::TempDirScope;
using dsm::tests::write_file;

class SiteRegistryTest : public ::testing::Test {
protected:
    fs::path addSite(const std::string& id, int port) {
        auto dir = dir_.path() / siteDirectoryName(id, port);
        fs::create_directories(dir);
        return dir;
    }

    TempDirScope dir_;
};

TEST_F(SiteRegistryTest, MissingBaseDirectoryIsEmpty) {
    SiteRegistry registry(dir_.path() / "does-not-exist");
    EXPECT_TRUE(registry.listSites().empty());
    EXPECT_TRUE(registry.usedPorts().empty());
}

TEST_F(SiteRegistryTest, ListsSitesSortedByPort) {
    addSite("zeta", 10000);
    addSite("alpha", 10006);
    addSite("mid", 10003);

    SiteRegistry registry(dir_.path());
    auto sites = registry.sites();
    ASSERT_EQ(sites.size(), 3u);
    EXPECT_EQ(sites[0].id, "zeta");
    EXPECT_EQ(sites[1].id, "mid");
    EXPECT_EQ(sites[2].id, "alpha");
    EXPECT_EQ(registry.usedPorts(), (std::set<int>{10000, 10003, 10006}));
}

TEST_F(SiteRegistryTest, SkipsForeignEntries) {
    addSite("blog", 10000);
    fs::create_directories(dir_.path() / "template");
    fs::create_directories(dir_.path() / "application");
    fs::create_directories(dir_.path() / "site-bad-name-10003");
    fs::create_directories(dir_.path() / "site-shop-12");
    write_file(dir_.path() / "site-file-10006", "not a directory");
    write_file(dir_.path() / ".dsm.lock", "");

    SiteRegistry registry(dir_.path());
    auto sites = registry.listSites();
    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites[0].site.id, "blog");
    EXPECT_EQ(sites[0].site.port, 10000);
}

TEST_F(SiteRegistryTest, FreshSiteIsStopped) {
    addSite("blog", 10000);
    SiteRegistry registry(dir_.path());
    auto sites = registry.listSites();
    ASSERT_EQ(sites.size(), 1u);
    EXPECT_FALSE(sites[0].webRunning);
    EXPECT_FALSE(sites[0].dbRunning);
}

TEST_F(SiteRegistryTest, RunningStateComesFromPidFiles) {
    auto dir = addSite("blog", 10000);
    write_file(dir / "www" / "run" / "www.pid", std::to_string(::getpid()));
    write_file(dir / "db" / "run" / "db.pid", "4194303");

    SiteRegistry registry(dir_.path());
    auto sites = registry.listSites();
    ASSERT_EQ(sites.size(), 1u);
    EXPECT_TRUE(sites[0].webRunning);
    EXPECT_FALSE(sites[0].dbRunning);
}

TEST_F(SiteRegistryTest, FindSiteById) {
    addSite("blog", 10000);
    addSite("shop", 10003);
    SiteRegistry registry(dir_.path());

    auto shop = registry.findSite("shop");
    ASSERT_TRUE(shop.has_value());
    EXPECT_EQ(shop->port, 10003);
    EXPECT_EQ(shop->directory, dir_.path() / "site-shop-10003");
    EXPECT_FALSE(registry.findSite("wiki").has_value());
}

TEST_F(SiteRegistryTest, SeesChangesWithoutCaching) {
    SiteRegistry registry(dir_.path());
    EXPECT_TRUE(registry.sites().empty());
    auto dir = addSite("blog", 10000);
    EXPECT_EQ(registry.sites().size(), 1u);
    fs::remove_all(dir);
    EXPECT_TRUE(registry.sites().empty());
}
