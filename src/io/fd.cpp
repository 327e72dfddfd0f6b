#include "io/fd.hpp"

#include <unistd.h>

namespace fwfleet {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Reset(other.Release());
    }
    return *this;
}

Fd::~Fd() { (void)Close(); }

void Fd::Reset(int fd) {
    (void)Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

int Fd::Close() {
    int rc = 0;
    if (fd_ >= 0) {
        rc = ::close(fd_);
    }
    fd_ = -1;
    return rc;
}

} // namespace fwfleet
