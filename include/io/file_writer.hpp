#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace fwfleet {

// Sequential writer over an owned descriptor. Used for download temp files
// and the install receipt.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);
    static Result Adopt(Fd fd, std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;
    Result Close();

    std::uint64_t BytesWritten() const { return written_; }
    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
    std::uint64_t written_ = 0;
};

} // namespace fwfleet
