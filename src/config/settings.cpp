#include <dsm/config/settings.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <map>
#include <utility>

#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <dsm/config/config_helpers.h>
#include <dsm/process/command_runner.h>

namespace dsm::config {

namespace {

namespace fs = std::filesystem;

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return fs::current_path();
}

std::string currentUser() {
    if (struct passwd* pw = getpwuid(getuid()); pw && pw->pw_name) {
        return pw->pw_name;
    }
    if (const char* user = std::getenv("USER"); user && *user) {
        return user;
    }
    return std::to_string(getuid());
}

std::string currentGroup() {
    if (struct group* gr = getgrgid(getgid()); gr && gr->gr_name) {
        return gr->gr_name;
    }
    return std::to_string(getgid());
}

// A binary shipped under <base>/bin wins over the system one.
fs::path locate(const fs::path& baseDir, const std::string& name,
                const std::vector<std::string>& hints = {}) {
    std::error_code ec;
    auto local = baseDir / "bin" / name;
    if (fs::exists(local, ec)) {
        return local;
    }
    return process::findExecutable(name, hints);
}

fs::path defaultController() {
    auto dir = process::currentExecutableDir();
    if (!dir.empty()) {
        std::error_code ec;
        auto sibling = dir / "dsm-ctl";
        if (fs::exists(sibling, ec)) {
            return sibling;
        }
    }
    auto found = process::findExecutable("dsm-ctl");
    return found.empty() ? fs::path("dsm-ctl") : found;
}

const char* envValue(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

Result<int> parseInt(const std::string& key, const std::string& value) {
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid integer for " + key + ": '" + value + "'"};
    }
    return parsed;
}

class Overlay {
public:
    explicit Overlay(std::map<std::string, std::string> values) : values_(std::move(values)) {}

    const std::string* find(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return nullptr;
        }
        return &it->second;
    }

    void path(const std::string& key, fs::path& out) const {
        if (auto* v = find(key)) {
            out = expand_tilde(*v);
        }
    }

    void string(const std::string& key, std::string& out) const {
        if (auto* v = find(key)) {
            out = *v;
        }
    }

    Result<void> integer(const std::string& key, int& out) const {
        if (auto* v = find(key)) {
            auto parsed = parseInt(key, *v);
            if (!parsed) {
                return parsed.error();
            }
            out = parsed.value();
        }
        return Result<void>();
    }

    Result<void> seconds(const std::string& key, std::chrono::seconds& out) const {
        int value = static_cast<int>(out.count());
        if (auto r = integer(key, value); !r) {
            return r;
        }
        if (value <= 0) {
            return Error{ErrorCode::InvalidArgument, key + " must be positive"};
        }
        out = std::chrono::seconds(value);
        return Result<void>();
    }

private:
    std::map<std::string, std::string> values_;
};

// Fill in every binary location that is still unset, relative to the final base directory.
void resolveBinaries(Settings& s) {
    if (s.apache2.empty()) {
        s.apache2 = locate(s.baseDir, "apache2", {"/usr/sbin", "/usr/local/apache2/bin"});
    }
    if (s.mysqld.empty()) {
        s.mysqld = locate(s.baseDir, "mysqld", {"/usr/sbin", "/usr/local/mysql/bin"});
    }
    if (s.mysqlInstallDb.empty()) {
        s.mysqlInstallDb =
            locate(s.baseDir, "mysql_install_db", {"/usr/bin", "/usr/local/mysql/scripts"});
        // MySQL 5.7+ dropped mysql_install_db in favour of mysqld --initialize.
        if (s.mysqlInstallDb.empty()) {
            s.mysqlInstallDb = s.mysqld;
        }
    }
    if (s.mysqlClient.empty()) {
        s.mysqlClient = locate(s.baseDir, "mysql", {"/usr/local/mysql/bin"});
    }
    if (s.postgresBinDir.empty()) {
        auto postgres = process::findExecutable(
            "postgres", {"/usr/local/pgsql/bin", "/usr/lib/postgresql/*/bin", "/usr/pgsql-*/bin"});
        if (!postgres.empty()) {
            s.postgresBinDir = postgres.parent_path();
        }
    }
    if (s.controller.empty()) {
        s.controller = defaultController();
    }
}

} // namespace

Settings defaultSettings() {
    Settings s;
    s.baseDir = homeDir() / "www";
    s.user = currentUser();
    s.group = currentGroup();
    return s;
}

Result<Settings> loadSettings(const fs::path& config_path, const fs::path& base_override) {
    Settings s = defaultSettings();

    std::error_code ec;
    if (!config_path.empty() && fs::exists(config_path, ec)) {
        spdlog::debug("Loading configuration from {}", config_path.string());
    }
    Overlay file(parse_config_file(config_path));

    file.path("paths.base", s.baseDir);
    file.path("paths.templates", s.templateDir);
    file.path("paths.applications", s.applicationDir);

    if (auto r = file.integer("ports.min", s.portMin); !r) {
        return r.error();
    }
    if (auto r = file.integer("ports.max", s.portMax); !r) {
        return r.error();
    }
    if (auto r = file.integer("ports.stride", s.portStride); !r) {
        return r.error();
    }

    file.path("web.daemon", s.apache2);
    file.path("web.module_dir", s.apacheModuleDir);
    file.string("web.version", s.apacheVersion);

    file.string("database.engine", s.dbEngine);
    file.path("database.mysqld", s.mysqld);
    file.path("database.mysql_install_db", s.mysqlInstallDb);
    file.path("database.mysql", s.mysqlClient);
    file.path("database.postgres_bin_dir", s.postgresBinDir);

    file.path("control.controller", s.controller);
    if (auto r = file.seconds("control.start_timeout", s.startTimeout); !r) {
        return r.error();
    }
    if (auto r = file.seconds("control.stop_timeout", s.stopTimeout); !r) {
        return r.error();
    }

    if (const char* base = envValue("DSM_BASE")) {
        s.baseDir = expand_tilde(base);
    }
    if (const char* ctl = envValue("DSM_CTL_BIN")) {
        s.controller = expand_tilde(ctl);
    }
    if (!base_override.empty()) {
        s.baseDir = expand_tilde(base_override.string());
    }

    if (s.templateDir.empty()) {
        s.templateDir = s.baseDir / "template";
    }
    if (s.applicationDir.empty()) {
        s.applicationDir = s.baseDir / "application";
    }

    if (s.portMin <= 0 || s.portMax > 65535 || s.portMin > s.portMax || s.portStride <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid port range {}-{} with stride {}", s.portMin, s.portMax,
                                 s.portStride)};
    }
    if (s.dbEngine != "mysql" && s.dbEngine != "pgsql") {
        return Error{ErrorCode::InvalidArgument,
                     "Unsupported database.engine '" + s.dbEngine + "' (mysql or pgsql)"};
    }
    if (s.apacheVersion != "auto" && s.apacheVersion != "2.2" && s.apacheVersion != "2.4") {
        return Error{ErrorCode::InvalidArgument,
                     "Unsupported web.version '" + s.apacheVersion + "' (2.2, 2.4 or auto)"};
    }

    resolveBinaries(s);

    // The generated service scripts single-quote every one of these.
    const std::pair<const char*, const fs::path*> quoted[] = {
        {"paths.base", &s.baseDir},
        {"web.daemon", &s.apache2},
        {"web.module_dir", &s.apacheModuleDir},
        {"database.mysqld", &s.mysqld},
        {"database.mysql_install_db", &s.mysqlInstallDb},
        {"database.mysql", &s.mysqlClient},
        {"database.postgres_bin_dir", &s.postgresBinDir},
        {"control.controller", &s.controller},
    };
    for (const auto& [key, value] : quoted) {
        if (value->string().find('\'') != std::string::npos) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(key) + " must not contain a single quote: " +
                             value->string()};
        }
    }

    spdlog::debug("Base directory {}, controller {}", s.baseDir.string(), s.controller.string());
    return s;
}

} // namespace dsm::config
