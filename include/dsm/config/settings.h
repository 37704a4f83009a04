#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <dsm/core/types.h>

namespace dsm::config {

/**
 * Effective configuration of one dsm invocation.
 *
 * Precedence: command line > environment (DSM_BASE, DSM_CTL_BIN) > config.toml > defaults.
 */
struct Settings {
    std::filesystem::path baseDir;        // holds the site-<id>-<port> directories
    std::filesystem::path templateDir;    // optional template overrides
    std::filesystem::path applicationDir; // application archives

    int portMin = 10000;
    int portMax = 10100;
    int portStride = 3; // HTTP, HTTPS, DB

    std::string user;
    std::string group;

    std::filesystem::path apache2;
    std::filesystem::path apacheModuleDir = "/usr/lib/apache2/modules";
    std::string apacheVersion = "auto"; // "2.2", "2.4" or "auto"

    std::string dbEngine = "mysql";
    std::filesystem::path mysqld;
    std::filesystem::path mysqlInstallDb;
    std::filesystem::path mysqlClient;
    std::filesystem::path postgresBinDir;

    std::filesystem::path controller; // dsm-ctl, invoked by the generated scripts
    std::chrono::seconds startTimeout{5};
    std::chrono::seconds stopTimeout{5};
};

// Built-in defaults for the current user, without reading any file.
Settings defaultSettings();

// Defaults overlaid with config_path (if it exists), the environment and,
// when non-empty, a base directory given on the command line.
Result<Settings> loadSettings(const std::filesystem::path& config_path,
                              const std::filesystem::path& base_override = {});

} // namespace dsm::config
