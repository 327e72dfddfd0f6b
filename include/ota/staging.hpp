#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace fwfleet {

// mkstemp file that is unlinked on destruction unless released.
class TempFile {
public:
    static Result CreateIn(const std::string& dir, const std::string& prefix, TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    // Hands the descriptor to the caller; the path stays owned.
    Fd TakeFd();
    const std::string& Path() const;

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// mkdtemp directory removed recursively on destruction unless released.
class StagingDir {
public:
    static Result CreateIn(const std::string& dir, const std::string& prefix, StagingDir& out);

    StagingDir();
    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;
    StagingDir(StagingDir&& other) noexcept;
    StagingDir& operator=(StagingDir&& other) noexcept;
    ~StagingDir();

    const std::string& Path() const { return path_; }
    // Stop owning the path (it was renamed into place).
    void Release() { path_.clear(); }

private:
    void Cleanup();

    std::string path_;
};

Result FsyncDir(const std::string& dir);

} // namespace fwfleet
