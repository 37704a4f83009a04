#pragma once

#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include <dsm/core/types.h>
#include <dsm/process/readiness.h>

namespace dsm::process {

struct LaunchSpec {
    std::vector<std::string> argv;             // daemon command line, run in the foreground
    std::filesystem::path pidFile;             // written by the daemon once it is up
    std::optional<std::filesystem::path> logFile; // receives the daemon's stdout/stderr
    std::optional<std::filesystem::path> workdir;
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds pollInterval{kDefaultPollInterval};
};

struct StopSpec {
    std::filesystem::path pidFile;
    std::vector<std::string> stopCommand; // daemon's own stop sub-command; empty means signal
    int signal = SIGTERM;
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds pollInterval{kDefaultPollInterval};
};

enum class StartOutcome { Started, AlreadyRunning };
enum class StopOutcome { Stopped, NotRunning };

/**
 * @class ProcessController
 * @brief Starts and stops a daemon tracked only through its PID file.
 *
 * start() launches the daemon detached from the calling session and waits
 * for its PID file; the daemon keeps running after the controller exits.
 * stop() asks the recorded process to terminate and waits for it to go away.
 * Timeouts leave PID files and logs in place for diagnosis.
 */
class ProcessController {
public:
    Result<StartOutcome> start(const LaunchSpec& spec) const;
    Result<StopOutcome> stop(const StopSpec& spec) const;
    bool status(const std::filesystem::path& pidFile) const;

private:
    Result<void> launchDetached(const LaunchSpec& spec) const;
};

// "TERM", "SIGTERM", "term" or "15"; nullopt for anything unknown.
std::optional<int> parseSignal(std::string_view name);

} // namespace dsm::process
