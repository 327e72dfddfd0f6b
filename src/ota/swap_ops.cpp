#include "ota/swap_ops.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>

namespace fwfleet {

namespace {

class FilesystemSwapOps final : public ISwapOps {
  public:
    Result Exchange(const std::string& a, const std::string& b) const override {
        if (::renameat2(AT_FDCWD, a.c_str(), AT_FDCWD, b.c_str(), RENAME_EXCHANGE) != 0) {
            const int err = errno;
            return Result::Fail(err, "exchange " + a + " <-> " + b + ": " + std::strerror(err));
        }
        return Result::Ok();
    }

    Result Rename(const std::string& from, const std::string& to) const override {
        if (::rename(from.c_str(), to.c_str()) != 0) {
            const int err = errno;
            return Result::Fail(err, "rename " + from + " -> " + to + ": " + std::strerror(err));
        }
        return Result::Ok();
    }

    Result RemoveTree(const std::string& path) const override {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) return Result::Fail(ec.value(), "remove " + path + ": " + ec.message());
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const ISwapOps> DefaultSwapOps() {
    static const auto ops = std::make_shared<const FilesystemSwapOps>();
    return ops;
}

} // namespace fwfleet
