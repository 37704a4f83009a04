#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <dsm/config/settings.h>
#include <dsm/core/types.h>
#include <dsm/site/service_stack.h>
#include <dsm/site/site.h>
#include <dsm/site/site_registry.h>
#include <dsm/template/template_renderer.h>

namespace dsm::site {

struct InstallRequest {
    std::string id;
    std::optional<int> port; // allocated when unset
    const IServiceStack* web = nullptr;
    const IServiceStack* database = nullptr;
    std::optional<std::filesystem::path> application;
};

/**
 * @class SiteManager
 * @brief Provisions, removes, starts and stops sites under the base directory.
 *
 * The only state is the filesystem. Invalid ids and unknown sites are
 * rejected before anything is touched; a failed install removes the
 * half-built site directory again.
 */
class SiteManager {
public:
    SiteManager(const config::Settings& settings, const templating::TemplateLibrary& templates)
        : settings_(settings), templates_(templates), registry_(settings.baseDir) {}

    Result<Site> install(const InstallRequest& request) const;
    Result<void> remove(const std::string& id) const;

    // nullopt means both services (database first on start, web first on stop).
    Result<void> start(const std::string& id, std::optional<ServiceKind> service) const;
    Result<void> stop(const std::string& id, std::optional<ServiceKind> service) const;

    // Every file under www/log and db/log.
    Result<std::vector<std::filesystem::path>> logFiles(const std::string& id) const;

    const SiteRegistry& registry() const { return registry_; }

    static constexpr int kMaxReserveAttempts = 8;

private:
    Result<Site> lookup(const std::string& id) const;
    Result<Site> reserveSite(const InstallRequest& request) const;
    Result<void> provision(const Site& site, const InstallRequest& request) const;
    Result<void> writeServiceFiles(const Site& site, const IServiceStack& stack) const;
    void rollback(const Site& site) const;

    const config::Settings& settings_;
    const templating::TemplateLibrary& templates_;
    SiteRegistry registry_;
};

} // namespace dsm::site
