#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace fwfleet {

// Streaming gzip decoder over another reader. Truncated or corrupt input is
// reported as a read error rather than a short stream.
class GzipReader final : public IReader {
  public:
    static Result Create(std::unique_ptr<IReader> source, std::unique_ptr<GzipReader>& out);

    ~GzipReader() override;
    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

  private:
    explicit GzipReader(std::unique_ptr<IReader> source);

    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    bool initialized_ = false;
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
};

} // namespace fwfleet
