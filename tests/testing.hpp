#pragma once

#include "crypto/sha256.hpp"
#include "io/io.hpp"
#include "ota/swap_ops.hpp"
#include "release/asset_downloader.hpp"
#include "release/release.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/fwfleet_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

class MemoryReader final : public fwfleet::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

class MemoryWriter final : public fwfleet::IWriter {
  public:
    fwfleet::Result WriteAll(std::span<const std::uint8_t> in) override {
        data.append(reinterpret_cast<const char*>(in.data()), in.size());
        return fwfleet::Result::Ok();
    }
    fwfleet::Result FsyncNow() override { return fwfleet::Result::Ok(); }

    std::string data;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type;
};

inline std::vector<std::uint8_t> BuildArchive(const std::vector<TarEntry>& entries, bool gzip) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_pax_restricted failed");
    }
    if (gzip && archive_write_add_filter_gzip(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_add_filter_gzip failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        if (entry.file_type == AE_IFLNK) {
            archive_entry_set_symlink(hdr, entry.contents.c_str());
            archive_entry_set_size(hdr, 0);
        } else {
            archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        }
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (entry.file_type == AE_IFREG && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries) {
    return BuildArchive(entries, false);
}

inline std::vector<std::uint8_t> BuildTarGz(const std::vector<TarEntry>& entries) {
    return BuildArchive(entries, true);
}

inline std::string ReadAll(fwfleet::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline void WriteFile(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream os(p, std::ios::binary | std::ios::trunc);
    os.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!os.good()) throw std::runtime_error("write failed: " + p.string());
}

inline void WriteFile(const std::filesystem::path& p, const std::vector<std::uint8_t>& data) {
    WriteFile(p, std::string(data.begin(), data.end()));
}

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Relative path -> contents ("<dir>" for directories) of every entry below |root|.
inline std::map<std::string, std::string> Snapshot(const std::filesystem::path& root) {
    std::map<std::string, std::string> out;
    for (const auto& e : std::filesystem::recursive_directory_iterator(root)) {
        const std::string rel = std::filesystem::relative(e.path(), root).string();
        out[rel] = e.is_directory() ? std::string("<dir>") : ReadFile(e.path());
    }
    return out;
}

// Names in |dir| starting with |prefix|.
inline std::vector<std::string> EntriesWithPrefix(const std::filesystem::path& dir, const std::string& prefix) {
    std::vector<std::string> out;
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        const std::string name = e.path().filename().string();
        if (name.rfind(prefix, 0) == 0) out.push_back(name);
    }
    return out;
}

enum class ChecksumAsset { Matching, Wrong, Malformed, None };

struct ReleaseFiles {
    std::string version;
    std::vector<std::pair<std::string, std::string>> files; // path below the top dir -> contents
    ChecksumAsset checksum = ChecksumAsset::Matching;
};

// Publishes one component release as files under |dir|: the payload
// <component>-<version>.tar.gz with a single top-level directory and,
// unless ChecksumAsset::None, a companion .sha256.
inline fwfleet::ReleaseMetadata PublishRelease(const std::filesystem::path& dir,
                                               const std::string& component,
                                               const ReleaseFiles& files) {
    const std::string top = component + "-" + files.version;
    std::vector<TarEntry> entries{{top + "/", "", AE_IFDIR}};
    for (const auto& [path, contents] : files.files) {
        entries.push_back({top + "/" + path, contents, AE_IFREG});
    }
    const auto payload = BuildTarGz(entries);

    const std::string payload_name = top + ".tar.gz";
    const auto payload_path = dir / payload_name;
    WriteFile(payload_path, payload);

    fwfleet::ReleaseMetadata rel;
    rel.tag = "v" + files.version;
    rel.version = files.version;
    rel.release_date = "2024-10-01";
    rel.notes = component + " " + files.version;
    rel.assets.push_back({payload_name, "file://" + payload_path.string()});

    std::string text;
    switch (files.checksum) {
        case ChecksumAsset::Matching:
            text = fwfleet::Sha256Hex(std::span<const std::uint8_t>(payload.data(), payload.size())) + "  " +
                   payload_name + "\n";
            break;
        case ChecksumAsset::Wrong:
            text = std::string(64, 'a') + "  " + payload_name + "\n";
            break;
        case ChecksumAsset::Malformed:
            text = "not-a-digest\n";
            break;
        case ChecksumAsset::None:
            return rel;
    }
    const auto sum_path = dir / (payload_name + ".sha256");
    WriteFile(sum_path, text);
    rel.assets.push_back({payload_name + ".sha256", sum_path.string()});
    return rel;
}

// Fails Exchange (and the fallback's final Rename into the target) while armed.
class FailingSwapOps final : public fwfleet::ISwapOps {
  public:
    explicit FailingSwapOps(std::shared_ptr<const fwfleet::ISwapOps> inner = fwfleet::DefaultSwapOps())
        : inner_(std::move(inner)) {}

    fwfleet::Result Exchange(const std::string& a, const std::string& b) const override {
        if (armed.load()) return fwfleet::Result::Fail(EIO, "injected exchange failure");
        return inner_->Exchange(a, b);
    }
    fwfleet::Result Rename(const std::string& from, const std::string& to) const override {
        if (armed.load() && from.find(".staging-") != std::string::npos) {
            return fwfleet::Result::Fail(EIO, "injected rename failure");
        }
        return inner_->Rename(from, to);
    }
    fwfleet::Result RemoveTree(const std::string& path) const override { return inner_->RemoveTree(path); }

    mutable std::atomic_bool armed{false};

  private:
    std::shared_ptr<const fwfleet::ISwapOps> inner_;
};

// Reports every exchange as unsupported so the rename-aside path runs.
class NoExchangeSwapOps final : public fwfleet::ISwapOps {
  public:
    NoExchangeSwapOps() : inner_(fwfleet::DefaultSwapOps()) {}

    fwfleet::Result Exchange(const std::string&, const std::string&) const override {
        return fwfleet::Result::Fail(EINVAL, "exchange not supported");
    }
    fwfleet::Result Rename(const std::string& from, const std::string& to) const override {
        return inner_->Rename(from, to);
    }
    fwfleet::Result RemoveTree(const std::string& path) const override { return inner_->RemoveTree(path); }

  private:
    std::shared_ptr<const fwfleet::ISwapOps> inner_;
};

// Delegates to |inner| and runs the hooks around each payload download.
class HookedAssetDownloader final : public fwfleet::IAssetDownloader {
  public:
    explicit HookedAssetDownloader(std::shared_ptr<fwfleet::IAssetDownloader> inner) : inner_(std::move(inner)) {}

    fwfleet::Result Download(const fwfleet::ReleaseAsset& asset,
                             fwfleet::IWriter& sink,
                             const fwfleet::TransferOptions& opt) override {
        if (before_download) before_download();
        auto r = inner_->Download(asset, sink, opt);
        if (after_download) after_download();
        return r;
    }
    fwfleet::Result FetchText(const fwfleet::ReleaseAsset& asset,
                              std::string& out,
                              const fwfleet::TransferOptions& opt) override {
        return inner_->FetchText(asset, out, opt);
    }

    std::function<void()> before_download;
    std::function<void()> after_download;

  private:
    std::shared_ptr<fwfleet::IAssetDownloader> inner_;
};

} // namespace testutil
