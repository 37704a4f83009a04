#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dsm::site {

enum class ServiceKind { Web, Database };

enum class ServiceAction { Start, Stop, IsRunning };

// "www" / "db": prefix of the per-site scripts and name of the service subdirectory.
const char* serviceName(ServiceKind kind);
std::optional<ServiceKind> parseServiceName(std::string_view name);

const char* actionName(ServiceAction action);

// [a-zA-Z][a-zA-Z0-9_]{0,23}
bool isValidSiteId(std::string_view id);

struct SiteName {
    std::string id;
    int port = 0;
};

// site-<id>-<port>
std::string siteDirectoryName(const std::string& id, int port);

// Inverse of siteDirectoryName; nullopt for anything that does not match exactly.
std::optional<SiteName> parseSiteDirectoryName(std::string_view name);

/**
 * One isolated web + database pair. Every path is derived from the site
 * directory; nothing about a site is stored anywhere else.
 */
struct Site {
    std::string id;
    int port = 0; // base port
    std::filesystem::path directory;

    int httpPort() const { return port; }
    int httpsPort() const { return port + 1; }
    int databasePort() const { return port + 2; }

    // www/ or db/
    std::filesystem::path serviceDir(ServiceKind kind) const;
    std::filesystem::path logDir(ServiceKind kind) const;
    std::filesystem::path runDir(ServiceKind kind) const;
    std::filesystem::path pidFile(ServiceKind kind) const;
    std::filesystem::path docDir() const;
    std::filesystem::path dataDir() const;

    // <directory>/www.start, db.stop, ...
    std::filesystem::path scriptPath(ServiceKind kind, ServiceAction action) const;
};

Site makeSite(const std::filesystem::path& baseDir, const std::string& id, int port);

} // namespace dsm::site
