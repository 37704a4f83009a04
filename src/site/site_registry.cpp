#include <dsm/site/site_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>

#include <dsm/process/pid_file.h>

namespace dsm::site {

std::vector<Site> SiteRegistry::sites() const {
    namespace fs = std::filesystem;
    std::vector<Site> found;

    std::error_code ec;
    fs::directory_iterator it(baseDir_, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("Cannot list {}: {}", baseDir_.string(), ec.message());
        }
        return found;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Listing {} stopped early: {}", baseDir_.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_directory(typeEc)) {
            continue;
        }
        auto parsed = parseSiteDirectoryName(entry.path().filename().string());
        if (!parsed) {
            spdlog::trace("Skipping {}", entry.path().string());
            continue;
        }
        found.push_back(Site{parsed->id, parsed->port, entry.path()});
    }

    std::sort(found.begin(), found.end(), [](const Site& a, const Site& b) {
        return a.port != b.port ? a.port < b.port : a.id < b.id;
    });
    return found;
}

std::vector<SiteStatus> SiteRegistry::listSites() const {
    std::vector<SiteStatus> statuses;
    for (auto& site : sites()) {
        SiteStatus status;
        status.webRunning = isServiceRunning(site, ServiceKind::Web);
        status.dbRunning = isServiceRunning(site, ServiceKind::Database);
        status.site = std::move(site);
        statuses.push_back(std::move(status));
    }
    return statuses;
}

std::optional<Site> SiteRegistry::findSite(const std::string& id) const {
    for (auto& site : sites()) {
        if (site.id == id) {
            return site;
        }
    }
    return std::nullopt;
}

std::set<int> SiteRegistry::usedPorts() const {
    std::set<int> ports;
    for (const auto& site : sites()) {
        ports.insert(site.port);
    }
    return ports;
}

bool SiteRegistry::isServiceRunning(const Site& site, ServiceKind kind) {
    return process::PidFile(site.pidFile(kind)).isRunning();
}

} // namespace dsm::site
