#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace fwfleet {

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view data);
std::string Sha256Hex(IReader& reader);
Result Sha256HexFile(const std::string& path, std::string& out_hex);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);
    void Update(std::string_view data);
    // Empty string if the digest could not be produced.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Writer that hashes everything passing through it before forwarding to
// |inner|. Lets the installer compute the digest while the download is
// written, without a second pass over the file.
class HashingWriter final : public IWriter {
public:
    explicit HashingWriter(IWriter& inner) : inner_(inner) {}

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override { return inner_.FsyncNow(); }

    std::string FinalHex() { return hasher_.FinalHex(); }
    std::uint64_t BytesWritten() const { return written_; }

private:
    IWriter& inner_;
    Sha256Hasher hasher_;
    std::uint64_t written_ = 0;
};

} // namespace fwfleet
