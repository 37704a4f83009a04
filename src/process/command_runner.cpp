#include <dsm/process/command_runner.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <glob.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dsm::process {

namespace {

// Ignore SIGPIPE while feeding a child that may exit before reading its input.
class ScopedIgnoreSigpipe {
public:
    ScopedIgnoreSigpipe() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        active_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }
    ~ScopedIgnoreSigpipe() {
        if (active_) {
            ::sigaction(SIGPIPE, &previous_, nullptr);
        }
    }
    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&) = delete;
    ScopedIgnoreSigpipe& operator=(const ScopedIgnoreSigpipe&) = delete;

private:
    struct sigaction previous_ {};
    bool active_{false};
};

void closeIfOpen(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) {
            oss << ' ';
        }
        oss << argv[i];
    }
    return oss.str();
}

} // namespace

Result<CommandResult> runCommand(const CommandSpec& spec) {
    if (spec.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty command line"};
    }

    int stdinPipe[2] = {-1, -1};
    int stdoutPipe[2] = {-1, -1};
    if (spec.input && ::pipe(stdinPipe) < 0) {
        return Error{ErrorCode::InternalError,
                     "Failed to create pipe: " + std::string(strerror(errno))};
    }
    if (spec.captureOutput && ::pipe(stdoutPipe) < 0) {
        closeIfOpen(stdinPipe[0]);
        closeIfOpen(stdinPipe[1]);
        return Error{ErrorCode::InternalError,
                     "Failed to create pipe: " + std::string(strerror(errno))};
    }

    spdlog::debug("Running: {}", joinArgs(spec.argv));

    pid_t pid = ::fork();
    if (pid < 0) {
        closeIfOpen(stdinPipe[0]);
        closeIfOpen(stdinPipe[1]);
        closeIfOpen(stdoutPipe[0]);
        closeIfOpen(stdoutPipe[1]);
        return Error{ErrorCode::InternalError, "fork() failed: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDWR);
        if (spec.input) {
            ::dup2(stdinPipe[0], STDIN_FILENO);
        } else if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        if (spec.captureOutput) {
            ::dup2(stdoutPipe[1], STDOUT_FILENO);
        } else if (spec.quiet && devnull >= 0) {
            ::dup2(devnull, STDOUT_FILENO);
        }
        if (spec.quiet && devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
        }
        for (int fd : {stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1], devnull}) {
            if (fd > STDERR_FILENO) {
                ::close(fd);
            }
        }
        if (spec.workdir && ::chdir(spec.workdir->c_str()) < 0) {
            _exit(127);
        }

        std::vector<char*> argv;
        argv.reserve(spec.argv.size() + 1);
        for (const auto& arg : spec.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    closeIfOpen(stdinPipe[0]);
    closeIfOpen(stdoutPipe[1]);

    if (spec.input) {
        ScopedIgnoreSigpipe guard;
        const std::string& data = *spec.input;
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(stdinPipe[1], data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                spdlog::debug("Child stopped reading its input: {}", strerror(errno));
                break;
            }
            written += static_cast<size_t>(n);
        }
        closeIfOpen(stdinPipe[1]);
    }

    CommandResult result;
    if (spec.captureOutput) {
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(stdoutPipe[0], buf, sizeof(buf));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            result.output.append(buf, static_cast<size_t>(n));
        }
        closeIfOpen(stdoutPipe[0]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return Error{ErrorCode::InternalError,
                         "waitpid() failed: " + std::string(strerror(errno))};
        }
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    spdlog::debug("Command '{}' exited with {}", spec.argv.front(), result.exitCode);
    return result;
}

std::filesystem::path findExecutable(const std::string& name,
                                     const std::vector<std::string>& hints) {
    namespace fs = std::filesystem;
    auto isExecutable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        return isExecutable(name) ? fs::path(name) : fs::path();
    }

    std::vector<std::string> dirs;
    if (const char* path = std::getenv("PATH"); path && *path) {
        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) {
                dirs.push_back(dir);
            }
        }
    }
    dirs.insert(dirs.end(), hints.begin(), hints.end());

    for (const auto& dir : dirs) {
        std::string pattern = (fs::path(dir) / name).string();
        glob_t matches{};
        if (::glob(pattern.c_str(), 0, nullptr, &matches) == 0) {
            for (size_t i = 0; i < matches.gl_pathc; ++i) {
                fs::path candidate(matches.gl_pathv[i]);
                if (isExecutable(candidate)) {
                    ::globfree(&matches);
                    return candidate;
                }
            }
        }
        ::globfree(&matches);
    }
    return {};
}

std::filesystem::path currentExecutableDir() {
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) {
        return {};
    }
    buf[n] = '\0';
    return std::filesystem::path(buf).parent_path();
}

} // namespace dsm::process
