#pragma once

#include <filesystem>
#include <optional>

#include <sys/types.h>

#include <dsm/core/types.h>

namespace dsm::process {

/**
 * Path-based handle on a daemon's PID file.
 *
 * The daemon writes the file; this class only reads it, probes the recorded
 * process and removes the file when the process is gone.
 */
class PidFile {
public:
    explicit PidFile(std::filesystem::path path) : path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

    bool exists() const;

    // Recorded PID, or nullopt when the file is missing, empty or malformed.
    std::optional<pid_t> readPid() const;

    // File exists and the recorded process is in the process table.
    bool isRunning() const;

    // File exists but its process is gone (or the content is unusable).
    bool isStale() const;

    // Remove the file; a missing file is not an error.
    Result<void> remove() const;

private:
    std::filesystem::path path_;
};

// kill(pid, 0) succeeds, or fails only because the process belongs to someone else.
bool isProcessAlive(pid_t pid);

} // namespace dsm::process
