#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace fwfleet {

// SHA-256 digests and the comparisons the installer and `verify` rely on.
class IntegrityVerifier {
public:
    std::string Digest(std::span<const std::uint8_t> bytes) const;
    std::string Digest(std::string_view bytes) const;
    Result DigestFile(const std::string& path, std::string& out_hex) const;

    // Digest of a directory tree: every entry's relative path plus file
    // contents or symlink target, in sorted path order. Independent of
    // directory iteration order and of timestamps.
    Result DigestTree(const std::string& dir, std::string& out_hex) const;

    // Case-insensitive hex comparison. An empty digest never matches.
    static bool Verify(std::string_view actual, std::string_view expected);

    // Ok on match, ChecksumUnavailable without an expectation,
    // ChecksumMismatch otherwise.
    static Result Check(std::string_view actual, const std::optional<std::string>& expected);

    // Digest of the file at |path| checked against |expected|, as Check does.
    // Io when the file cannot be read.
    Result CheckFile(const std::string& path, const std::optional<std::string>& expected) const;

    // Companion checksum assets are "<hex>  <filename>" text; the first
    // whitespace-delimited token must be a 64 character hex digest.
    static std::expected<std::string, std::string> ParseChecksumText(std::string_view text);

    static std::string NormalizeHex(std::string_view hex);
};

} // namespace fwfleet
