#include <dsm/site/directory_lock.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace dsm::site {

Result<DirectoryLock> DirectoryLock::acquire(const std::filesystem::path& lockFile) {
    int fd = ::open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error{ErrorCode::IOError,
                     "Cannot open lock file " + lockFile.string() + ": " + strerror(errno)};
    }
    while (::flock(fd, LOCK_EX) == -1) {
        if (errno == EINTR) {
            continue;
        }
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::IOError,
                     "Cannot lock " + lockFile.string() + ": " + strerror(err)};
    }
    return DirectoryLock(fd);
}

DirectoryLock::DirectoryLock(DirectoryLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

DirectoryLock& DirectoryLock::operator=(DirectoryLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

DirectoryLock::~DirectoryLock() {
    release();
}

void DirectoryLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace dsm::site
