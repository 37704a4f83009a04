#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <dsm/site/site.h>

namespace dsm::site {

struct SiteStatus {
    Site site;
    bool webRunning = false;
    bool dbRunning = false;
};

/**
 * Read-only view of the site directories under a base directory.
 *
 * There is no index: every call lists the base directory again, so results
 * always reflect concurrent installs and removals. Entries whose name does
 * not follow site-<id>-<port> are ignored. Results are ordered by port, then id.
 */
class SiteRegistry {
public:
    explicit SiteRegistry(std::filesystem::path baseDir) : baseDir_(std::move(baseDir)) {}

    const std::filesystem::path& baseDir() const { return baseDir_; }

    std::vector<Site> sites() const;

    // Sites with the running state of each service, probed through PID files.
    std::vector<SiteStatus> listSites() const;

    std::optional<Site> findSite(const std::string& id) const;

    std::set<int> usedPorts() const;

    static bool isServiceRunning(const Site& site, ServiceKind kind);

private:
    std::filesystem::path baseDir_;
};

} // namespace dsm::site
