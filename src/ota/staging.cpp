#include "ota/staging.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fwfleet {

namespace {

std::vector<char> MakeTemplate(const std::string& dir, const std::string& prefix) {
    const std::string tmpl = (std::filesystem::path(dir) / (prefix + "XXXXXX")).string();
    return std::vector<char>(tmpl.c_str(), tmpl.c_str() + tmpl.size() + 1);
}

} // namespace

Result TempFile::CreateIn(const std::string& dir, const std::string& prefix, TempFile& out) {
    auto tmpl = MakeTemplate(dir, prefix);
    const int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err, "mkstemp failed in " + dir + ": " + std::strerror(err));
    }
    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = tmpl.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

Fd TempFile::TakeFd() { return std::move(fd_); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Cleanup() {
    (void)fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result StagingDir::CreateIn(const std::string& dir, const std::string& prefix, StagingDir& out) {
    auto tmpl = MakeTemplate(dir, prefix);
    if (::mkdtemp(tmpl.data()) == nullptr) {
        const int err = errno;
        return Result::Fail(err, "mkdtemp failed in " + dir + ": " + std::strerror(err));
    }
    out = StagingDir();
    out.path_ = tmpl.data();
    return Result::Ok();
}

StagingDir::StagingDir() = default;
StagingDir::StagingDir(StagingDir&& other) noexcept { *this = std::move(other); }
StagingDir& StagingDir::operator=(StagingDir&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
StagingDir::~StagingDir() { Cleanup(); }

void StagingDir::Cleanup() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) LogWarn("could not remove %s: %s", path_.c_str(), ec.message().c_str());
    path_.clear();
}

Result FsyncDir(const std::string& dir) {
    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.Valid()) {
        const int err = errno;
        return Result::Fail(err, "open " + dir + ": " + std::strerror(err));
    }
    if (::fsync(fd.Get()) != 0) {
        const int err = errno;
        return Result::Fail(err, "fsync " + dir + ": " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace fwfleet
