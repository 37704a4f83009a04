#include <dsm/process/process_controller.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <dsm/process/command_runner.h>
#include <dsm/process/pid_file.h>

namespace dsm::process {

namespace {

void closeInheritedDescriptors(int keep) {
    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0 || maxFd > 65536) {
        maxFd = 65536;
    }
    for (int fd = STDERR_FILENO + 1; fd < maxFd; ++fd) {
        if (fd != keep) {
            ::close(fd);
        }
    }
}

// Runs in the grandchild; never returns.
[[noreturn]] void execDaemon(const LaunchSpec& spec, int errorPipe) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
    }
    int out = -1;
    if (spec.logFile) {
        out = ::open(spec.logFile->c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    }
    if (out < 0) {
        out = devnull;
    }
    if (out >= 0) {
        ::dup2(out, STDOUT_FILENO);
        ::dup2(out, STDERR_FILENO);
    }
    closeInheritedDescriptors(errorPipe);

    if (spec.workdir && ::chdir(spec.workdir->c_str()) < 0) {
        int err = errno;
        (void)!::write(errorPipe, &err, sizeof(err));
        _exit(127);
    }

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    ::execvp(argv[0], argv.data());

    int err = errno;
    (void)!::write(errorPipe, &err, sizeof(err));
    _exit(127);
}

} // namespace

Result<void> ProcessController::launchDetached(const LaunchSpec& spec) const {
    if (spec.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "No daemon command given"};
    }

    // Reports exec failure from the grandchild; closed on successful exec.
    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
        return Error{ErrorCode::InternalError,
                     "Failed to create pipe: " + std::string(strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        return Error{ErrorCode::InternalError, "Failed to fork: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
        // First child: leave the controlling session, then fork the daemon so
        // it is reparented away from us and never becomes our zombie.
        ::close(errorPipe[0]);
        if (::setsid() < 0) {
            _exit(1);
        }
        pid_t daemonPid = ::fork();
        if (daemonPid < 0) {
            _exit(1);
        }
        if (daemonPid == 0) {
            execDaemon(spec, errorPipe[1]);
        }
        _exit(0);
    }

    ::close(errorPipe[1]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Error{ErrorCode::InternalError, "Failed to detach daemon process"};
    }
    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        return Error{ErrorCode::InternalError,
                     "Failed to exec '" + spec.argv.front() + "': " + strerror(execErrno)};
    }
    return Result<void>();
}

Result<StartOutcome> ProcessController::start(const LaunchSpec& spec) const {
    PidFile pidFile(spec.pidFile);

    if (pidFile.isRunning()) {
        spdlog::info("Already running (PID {}), not starting another instance",
                     pidFile.readPid().value_or(0));
        return StartOutcome::AlreadyRunning;
    }
    if (pidFile.exists()) {
        spdlog::warn("Removing stale PID file {}", spec.pidFile.string());
        if (auto rm = pidFile.remove(); !rm) {
            return rm.error();
        }
    }

    if (auto launched = launchDetached(spec); !launched) {
        return launched.error();
    }

    bool ready = waitFor([&pidFile]() { return pidFile.readPid().has_value(); }, spec.timeout,
                         spec.pollInterval);
    if (!ready) {
        std::string where = spec.logFile ? ", see " + spec.logFile->string() : std::string();
        return Error{ErrorCode::ProcessStartTimeout,
                     "PID file " + spec.pidFile.string() + " did not appear within " +
                         std::to_string(spec.timeout.count()) + "ms" + where};
    }

    spdlog::info("Started {} (PID {})", spec.argv.front(), pidFile.readPid().value_or(0));
    return StartOutcome::Started;
}

Result<StopOutcome> ProcessController::stop(const StopSpec& spec) const {
    PidFile pidFile(spec.pidFile);

    if (!pidFile.exists()) {
        spdlog::debug("No PID file at {}, nothing to stop", spec.pidFile.string());
        return StopOutcome::NotRunning;
    }

    auto pid = pidFile.readPid();
    if (!pid || !isProcessAlive(*pid)) {
        spdlog::warn("Removing stale PID file {}", spec.pidFile.string());
        if (auto rm = pidFile.remove(); !rm) {
            return rm.error();
        }
        return StopOutcome::NotRunning;
    }

    bool requested = false;
    if (!spec.stopCommand.empty()) {
        auto res = runCommand(CommandSpec{.argv = spec.stopCommand});
        if (res && res.value().ok()) {
            requested = true;
        } else {
            spdlog::warn("Stop command '{}' failed, falling back to signal {}",
                         spec.stopCommand.front(), spec.signal);
        }
    }
    if (!requested) {
        if (::kill(*pid, spec.signal) == -1 && errno != ESRCH) {
            return Error{ErrorCode::PermissionDenied, "Failed to signal PID " +
                                                          std::to_string(*pid) + ": " +
                                                          strerror(errno)};
        }
    }

    const pid_t target = *pid;
    bool gone = waitFor(
        [&pidFile, target]() { return !pidFile.exists() || !isProcessAlive(target); },
        spec.timeout, spec.pollInterval);
    if (!gone) {
        return Error{ErrorCode::ProcessStopTimeout,
                     "PID " + std::to_string(target) + " still running after " +
                         std::to_string(spec.timeout.count()) + "ms"};
    }

    if (pidFile.exists()) {
        if (auto rm = pidFile.remove(); !rm) {
            return rm.error();
        }
    }
    spdlog::info("Stopped PID {}", target);
    return StopOutcome::Stopped;
}

std::optional<int> parseSignal(std::string_view name) {
    static constexpr std::array<std::pair<std::string_view, int>, 8> kSignals = {{
        {"TERM", SIGTERM},
        {"INT", SIGINT},
        {"QUIT", SIGQUIT},
        {"HUP", SIGHUP},
        {"KILL", SIGKILL},
        {"USR1", SIGUSR1},
        {"USR2", SIGUSR2},
        {"WINCH", SIGWINCH},
    }};

    int number = 0;
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), number);
    if (ec == std::errc() && ptr == name.data() + name.size()) {
        if (number > 0 && number < NSIG) {
            return number;
        }
        return std::nullopt;
    }

    std::string upper;
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    std::string_view bare = upper;
    if (bare.substr(0, 3) == "SIG") {
        bare.remove_prefix(3);
    }
    for (const auto& [signalName, value] : kSignals) {
        if (bare == signalName) {
            return value;
        }
    }
    return std::nullopt;
}

bool ProcessController::status(const std::filesystem::path& pidFile) const {
    return PidFile(pidFile).isRunning();
}

} // namespace dsm::process
