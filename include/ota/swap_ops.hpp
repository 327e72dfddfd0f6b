#pragma once

#include "util/result.hpp"

#include <cerrno>
#include <memory>
#include <string>

namespace fwfleet {

// Filesystem primitives the installer's swap step is built from. The
// default implementation is the real filesystem; tests substitute one that
// fails at a chosen step.
class ISwapOps {
  public:
    virtual ~ISwapOps() = default;
    // Atomically exchange two existing paths (renameat2 RENAME_EXCHANGE).
    // Fails with err EINVAL/ENOSYS/ENOTSUP when the filesystem can't.
    virtual Result Exchange(const std::string& a, const std::string& b) const = 0;
    virtual Result Rename(const std::string& from, const std::string& to) const = 0;
    virtual Result RemoveTree(const std::string& path) const = 0;
};

std::shared_ptr<const ISwapOps> DefaultSwapOps();

inline bool ExchangeUnsupported(const Result& r) {
    return !r.ok && (r.err == EINVAL || r.err == ENOSYS || r.err == ENOTSUP || r.err == EOPNOTSUPP);
}

} // namespace fwfleet
