#include "crypto/integrity_verifier.hpp"

#include "crypto/sha256.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace fwfleet {

namespace {

constexpr size_t kSha256HexLen = 64;

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool IsHex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

std::string IntegrityVerifier::NormalizeHex(std::string_view hex) {
    std::string out(Trim(hex));
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string IntegrityVerifier::Digest(std::span<const std::uint8_t> bytes) const {
    return Sha256Hex(bytes);
}

std::string IntegrityVerifier::Digest(std::string_view bytes) const { return Sha256Hex(bytes); }

Result IntegrityVerifier::DigestFile(const std::string& path, std::string& out_hex) const {
    return Sha256HexFile(path, out_hex);
}

Result IntegrityVerifier::DigestTree(const std::string& dir, std::string& out_hex) const {
    namespace fs = std::filesystem;

    const fs::path root(dir);
    std::error_code ec;
    if (!fs::is_directory(root, ec) || ec) {
        return Result::Fail(Errc::NotFound, "not a directory: " + dir);
    }

    std::vector<fs::path> entries;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) return Result::Fail(ec.value(), "walk " + dir + ": " + ec.message());

    std::vector<std::pair<std::string, fs::path>> sorted;
    sorted.reserve(entries.size());
    for (const auto& p : entries) {
        sorted.emplace_back(p.lexically_relative(root).generic_string(), p);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    Sha256Hasher tree;
    for (const auto& [rel, abs] : sorted) {
        const auto st = fs::symlink_status(abs, ec);
        if (ec) return Result::Fail(ec.value(), "stat " + abs.string() + ": " + ec.message());

        if (fs::is_symlink(st)) {
            const auto target = fs::read_symlink(abs, ec);
            if (ec) return Result::Fail(ec.value(), "readlink " + abs.string() + ": " + ec.message());
            tree.Update("l " + rel + " -> " + target.generic_string() + "\n");
        } else if (fs::is_directory(st)) {
            tree.Update("d " + rel + "\n");
        } else if (fs::is_regular_file(st)) {
            std::string file_hex;
            auto r = DigestFile(abs.string(), file_hex);
            if (!r.ok) return r;
            tree.Update("f " + rel + " " + file_hex + "\n");
        } else {
            tree.Update("o " + rel + "\n");
        }
    }

    out_hex = tree.FinalHex();
    if (out_hex.empty()) return Result::Fail(Errc::Io, "tree digest failed: " + dir);
    return Result::Ok();
}

bool IntegrityVerifier::Verify(std::string_view actual, std::string_view expected) {
    const std::string a = NormalizeHex(actual);
    const std::string e = NormalizeHex(expected);
    return !a.empty() && a == e;
}

Result IntegrityVerifier::Check(std::string_view actual, const std::optional<std::string>& expected) {
    if (!expected || Trim(*expected).empty()) {
        return Result::Fail(Errc::ChecksumUnavailable, "no checksum published");
    }
    if (!Verify(actual, *expected)) {
        return Result::Fail(Errc::ChecksumMismatch,
                            "sha256 mismatch: expected=" + NormalizeHex(*expected) +
                                " actual=" + NormalizeHex(actual));
    }
    return Result::Ok();
}

Result IntegrityVerifier::CheckFile(const std::string& path, const std::optional<std::string>& expected) const {
    std::string actual;
    if (auto r = DigestFile(path, actual); !r.ok) return r;
    return Check(actual, expected);
}

std::expected<std::string, std::string> IntegrityVerifier::ParseChecksumText(std::string_view text) {
    text = Trim(text);
    const auto end = std::find_if(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    const std::string_view token = text.substr(0, static_cast<size_t>(end - text.begin()));
    if (token.empty()) {
        return std::unexpected("empty checksum file");
    }
    if (token.size() != kSha256HexLen || !IsHex(token)) {
        return std::unexpected("malformed sha256 token: " + std::string(token.substr(0, 80)));
    }
    return NormalizeHex(token);
}

} // namespace fwfleet
