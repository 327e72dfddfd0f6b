#pragma once
#include <string>
#include <utility>

namespace fwfleet {

enum class Errc : int {
    Ok = 0,
    Io,
    InvalidArgument,
    Cancelled,
    NotFound,
    SourceUnavailable,
    NoAssetFound,
    ChecksumUnavailable,
    ChecksumMismatch,
    InstallFailed,
    StoreUnavailable,
};

const char* ToString(Errc code);

struct Result {
    bool ok{true};
    Errc code{Errc::Ok};
    int err{0}; // errno when the failure came from a syscall
    std::string msg;

    bool is_ok() const { return ok; }
    bool Is(Errc c) const { return code == c; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .code = Errc::Io, .err = e, .msg = std::move(m)};
    }
    static Result Fail(Errc c, std::string m) {
        return {.ok = false, .code = c, .err = 0, .msg = std::move(m)};
    }

    // Re-tag a lower level failure with the code the caller reports.
    Result As(Errc c) const {
        Result r = *this;
        r.code = c;
        return r;
    }
};

} // namespace fwfleet
