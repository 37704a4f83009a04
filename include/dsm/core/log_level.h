#pragma once

#include <optional>
#include <string>
#include <spdlog/common.h>

namespace dsm {

// "trace", "debug", "info", "warn", "error", "critical", "off" (case-insensitive).
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& name);

/**
 * Set the default logger level. Precedence: DSM_LOG_LEVEL, then `requested`
 * (an explicit --log-level), then debug when verbose, else warn.
 */
void applyLogLevel(bool verbose, const std::string& requested = "");

} // namespace dsm
