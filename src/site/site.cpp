#include <dsm/site/site.h>

#include <charconv>
#include <regex>

namespace dsm::site {

namespace {

const std::regex& siteIdPattern() {
    static const std::regex pattern(R"(^[a-zA-Z][a-zA-Z0-9_]{0,23}$)");
    return pattern;
}

// Ports are 4 or 5 digits; ids cannot contain '-', so the split is unambiguous.
const std::regex& siteDirectoryPattern() {
    static const std::regex pattern(R"(^site-([a-zA-Z][a-zA-Z0-9_]{0,23})-([0-9]{4,5})$)");
    return pattern;
}

} // namespace

const char* serviceName(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::Web: return "www";
        case ServiceKind::Database: return "db";
    }
    return "unknown";
}

std::optional<ServiceKind> parseServiceName(std::string_view name) {
    if (name == "www" || name == "web") {
        return ServiceKind::Web;
    }
    if (name == "db" || name == "database") {
        return ServiceKind::Database;
    }
    return std::nullopt;
}

const char* actionName(ServiceAction action) {
    switch (action) {
        case ServiceAction::Start: return "start";
        case ServiceAction::Stop: return "stop";
        case ServiceAction::IsRunning: return "isrunning";
    }
    return "unknown";
}

bool isValidSiteId(std::string_view id) {
    return std::regex_match(id.begin(), id.end(), siteIdPattern());
}

std::string siteDirectoryName(const std::string& id, int port) {
    return "site-" + id + "-" + std::to_string(port);
}

std::optional<SiteName> parseSiteDirectoryName(std::string_view name) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(name.begin(), name.end(), match, siteDirectoryPattern())) {
        return std::nullopt;
    }

    SiteName parsed;
    parsed.id = match[1].str();
    const std::string digits = match[2].str();
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed.port);
    if (ec != std::errc() || parsed.port <= 0 || parsed.port > 65535) {
        return std::nullopt;
    }
    return parsed;
}

std::filesystem::path Site::serviceDir(ServiceKind kind) const {
    return directory / serviceName(kind);
}

std::filesystem::path Site::logDir(ServiceKind kind) const {
    return serviceDir(kind) / "log";
}

std::filesystem::path Site::runDir(ServiceKind kind) const {
    return serviceDir(kind) / "run";
}

std::filesystem::path Site::pidFile(ServiceKind kind) const {
    return runDir(kind) / (std::string(serviceName(kind)) + ".pid");
}

std::filesystem::path Site::docDir() const {
    return serviceDir(ServiceKind::Web) / "doc";
}

std::filesystem::path Site::dataDir() const {
    return serviceDir(ServiceKind::Database) / "data";
}

std::filesystem::path Site::scriptPath(ServiceKind kind, ServiceAction action) const {
    return directory / (std::string(serviceName(kind)) + "." + actionName(action));
}

Site makeSite(const std::filesystem::path& baseDir, const std::string& id, int port) {
    return Site{id, port, baseDir / siteDirectoryName(id, port)};
}

} // namespace dsm::site
