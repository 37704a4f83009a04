#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <iostream>
#include <sstream>
#include <dsm/core/exit_codes.h>
#include <dsm/core/log_level.h>
#include <dsm/process/pid_file.h>
#include <dsm/process/process_controller.h>
#include <dsm/version.hpp>

// Daemon supervisor used by the generated www.* and db.* scripts:
//   dsm-ctl start  --pid-file F [--log-file L] [--timeout S] -- daemon args...
//   dsm-ctl stop   --pid-file F [--signal TERM] [--stop-command CMD] [--timeout S]
//   dsm-ctl status --pid-file F

namespace {

using dsm::ErrorCode;
using dsm::exitCodeFor;
namespace exit_code = dsm::exit_code;

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> words;
    std::istringstream in(s);
    std::string w;
    while (in >> w) {
        words.push_back(w);
    }
    return words;
}

int report(const dsm::Error& error) {
    spdlog::error("{}", error.message);
    return exitCodeFor(error.code);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("dsm-ctl"));
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"Start, stop and query a daemon through its PID file", "dsm-ctl"};
    app.set_version_flag("--version", std::string(dsm::version::string_v));
    app.require_subcommand(1);

    std::string logLevel;
    bool verbose = false;
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or off");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    std::string pidFile;
    std::string logFile;
    int timeoutSeconds = 5;
    std::string signalName = "TERM";
    std::string stopCommand;
    std::vector<std::string> daemonArgv;

    auto* start = app.add_subcommand("start", "Launch a daemon and wait for its PID file");
    start->add_option("--pid-file", pidFile, "PID file written by the daemon")->required();
    start->add_option("--log-file", logFile, "Receives the daemon's stdout and stderr");
    start->add_option("--timeout", timeoutSeconds, "Seconds to wait for the PID file")
        ->check(CLI::PositiveNumber);
    start->add_option("command", daemonArgv, "Daemon command line, after --")->required();

    auto* stop = app.add_subcommand("stop", "Stop the daemon recorded in a PID file");
    stop->add_option("--pid-file", pidFile, "PID file of the daemon")->required();
    stop->add_option("--signal", signalName, "Signal to send (default TERM)");
    stop->add_option("--stop-command", stopCommand, "Run this instead of sending a signal");
    stop->add_option("--timeout", timeoutSeconds, "Seconds to wait for the daemon to exit")
        ->check(CLI::PositiveNumber);

    auto* status = app.add_subcommand("status", "Exit 0 when the daemon is running");
    status->add_option("--pid-file", pidFile, "PID file of the daemon")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? exit_code::Success : exit_code::Usage;
    }

    dsm::applyLogLevel(verbose, logLevel);

    dsm::process::ProcessController controller;
    const auto timeout = std::chrono::milliseconds(std::chrono::seconds(timeoutSeconds));

    if (*start) {
        dsm::process::LaunchSpec spec;
        spec.argv = daemonArgv;
        spec.pidFile = pidFile;
        if (!logFile.empty()) {
            spec.logFile = logFile;
        }
        spec.timeout = timeout;
        auto started = controller.start(spec);
        if (!started) {
            return report(started.error());
        }
        return exit_code::Success;
    }

    if (*stop) {
        auto signal = dsm::process::parseSignal(signalName);
        if (!signal) {
            return report(
                dsm::Error{ErrorCode::InvalidArgument, "Unknown signal '" + signalName + "'"});
        }
        dsm::process::StopSpec spec;
        spec.pidFile = pidFile;
        spec.signal = *signal;
        spec.stopCommand = splitWords(stopCommand);
        spec.timeout = timeout;
        auto stopped = controller.stop(spec);
        if (!stopped) {
            return report(stopped.error());
        }
        return exit_code::Success;
    }

    dsm::process::PidFile pid(pidFile);
    if (controller.status(pidFile)) {
        std::cout << "running (PID " << pid.readPid().value_or(0) << ")\n";
        return exit_code::Success;
    }
    std::cout << (pid.exists() ? "not running (stale PID file)" : "not running") << "\n";
    return exit_code::Failure;
}
