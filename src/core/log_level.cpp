#include <dsm/core/log_level.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>

namespace dsm {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void applyLogLevel(bool verbose, const std::string& requested) {
    if (const char* envLvl = std::getenv("DSM_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLogLevel(envLvl)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    if (!requested.empty()) {
        if (auto lvl = parseLogLevel(requested)) {
            spdlog::set_level(*lvl);
            return;
        }
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace dsm
