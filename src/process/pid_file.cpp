#include <dsm/process/pid_file.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace dsm::process {

namespace {

// A zombie still answers kill(pid, 0) until its parent reaps it.
bool isZombie(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) {
        return false;
    }
    std::string line;
    std::getline(stat, line);
    auto pos = line.rfind(')');
    if (pos == std::string::npos || pos + 2 >= line.size()) {
        return false;
    }
    char state = line[pos + 2];
    return state == 'Z' || state == 'X';
}

} // namespace

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return !isZombie(pid);
    }
    if (errno == EPERM) {
        // Process exists but we lack permission to signal it; treat as running.
        spdlog::debug("PID {} exists but is owned by another user (EPERM)", pid);
        return true;
    }
    return false;
}

bool PidFile::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::optional<pid_t> PidFile::readPid() const {
    std::ifstream in(path_);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    const char* begin = content.c_str();
    while (*begin == ' ' || *begin == '\t' || *begin == '\n' || *begin == '\r') {
        ++begin;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || errno != 0 || value <= 0 || value > std::numeric_limits<pid_t>::max()) {
        return std::nullopt;
    }
    while (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r') {
        ++end;
    }
    if (*end != '\0') {
        return std::nullopt;
    }
    return static_cast<pid_t>(value);
}

bool PidFile::isRunning() const {
    auto pid = readPid();
    return pid && isProcessAlive(*pid);
}

bool PidFile::isStale() const {
    return exists() && !isRunning();
}

Result<void> PidFile::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Failed to remove PID file '" + path_.string() + "': " + ec.message()};
    }
    return Result<void>();
}

} // namespace dsm::process
