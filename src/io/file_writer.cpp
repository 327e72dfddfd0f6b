#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fwfleet {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);
    out.written_ = 0;

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(
            err, "Failed to open output: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::Adopt(Fd fd, std::string path, FileWriter& out) {
    if (!fd.Valid()) return Result::Fail(EBADF, "Invalid descriptor for " + path);
    out.path_ = std::move(path);
    out.fd_ = std::move(fd);
    out.written_ = 0;
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            written_ += static_cast<std::uint64_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int err = errno;
        return Result::Fail(err, "Write failed: " + path_ + " (" + std::strerror(err) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        const int err = errno;
        return Result::Fail(err, "fsync failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    if (fd_.Close() != 0) {
        const int err = errno;
        return Result::Fail(err, "close failed: " + path_ + " (" + std::strerror(err) + ")");
    }
    return Result::Ok();
}

} // namespace fwfleet
