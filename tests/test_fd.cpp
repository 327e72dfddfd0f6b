#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        fwfleet::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseGivesUpOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        fwfleet::Fd holder(fd);
        EXPECT_EQ(holder.Release(), fd);
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(::close(fd), 0);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    fwfleet::Fd a(fd);
    fwfleet::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), fd);
    EXPECT_EQ(b.Close(), 0);
    EXPECT_FALSE(b.Valid());
}

} // namespace
