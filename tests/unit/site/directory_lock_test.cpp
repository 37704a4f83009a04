#include <gtest/gtest.h>
#include <dsm/site/directory_lock.h>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "../../common/test_helpers.h"

using namespace dsm;
using namespace dsm::site;
using dsm::tests::TempDirScope;

namespace {

// True when a separate open file description can take the lock right now.
bool lockIsFree(const std::filesystem::path& file) {
    int fd = ::open(file.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool free = ::flock(fd, LOCK_EX | LOCK_NB) == 0;
    ::close(fd);
    return free;
}

} // namespace

TEST(DirectoryLockTest, HeldUntilReleased) {
    TempDirScope dir;
    auto file = dir.path() / ".dsm.lock";

    auto lock = DirectoryLock::acquire(file);
    ASSERT_TRUE(lock) << lock.error().message;
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_FALSE(lockIsFree(file));

    DirectoryLock held = std::move(lock).value();
    held.release();
    EXPECT_TRUE(lockIsFree(file));
}

TEST(DirectoryLockTest, ReleasedOnDestruction) {
    TempDirScope dir;
    auto file = dir.path() / ".dsm.lock";
    {
        auto lock = DirectoryLock::acquire(file);
        ASSERT_TRUE(lock);
        EXPECT_FALSE(lockIsFree(file));
    }
    EXPECT_TRUE(lockIsFree(file));
}

TEST(DirectoryLockTest, MissingDirectoryIsAnError) {
    TempDirScope dir;
    auto lock = DirectoryLock::acquire(dir.path() / "missing" / ".dsm.lock");
    ASSERT_FALSE(lock);
    EXPECT_EQ(lock.error().code, ErrorCode::IOError);
}
