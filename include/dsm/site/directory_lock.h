#pragma once

#include <filesystem>

#include <dsm/core/types.h>

namespace dsm::site {

/**
 * Exclusive advisory lock (flock) on a file, held for the lifetime of the
 * object. Used to serialise the scan-then-create step of concurrent installs.
 */
class DirectoryLock {
public:
    static Result<DirectoryLock> acquire(const std::filesystem::path& lockFile);

    DirectoryLock(DirectoryLock&& other) noexcept;
    DirectoryLock& operator=(DirectoryLock&& other) noexcept;
    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;
    ~DirectoryLock();

    void release();

private:
    explicit DirectoryLock(int fd) : fd_(fd) {}

    int fd_ = -1;
};

} // namespace dsm::site
