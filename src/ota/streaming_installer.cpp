#include "ota/streaming_installer.hpp"

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "ota/install_receipt.hpp"
#include "ota/tar_stream_extractor.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/time_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include <unistd.h>

namespace fwfleet {

namespace fs = std::filesystem;

StreamingInstaller::StreamingInstaller(std::shared_ptr<IAssetDownloader> downloader,
                                       Options opt,
                                       std::shared_ptr<const ISwapOps> swap_ops)
    : downloader_(std::move(downloader)), opt_(opt), swap_ops_(std::move(swap_ops)) {}

Result StreamingInstaller::Install(const InstallRequest& req, InstallOutcome& out) {
    out = InstallOutcome{};

    if (req.target_dir.empty()) {
        return Result::Fail(Errc::InvalidArgument, "install target is empty");
    }
    if (req.asset.download_url.empty()) {
        return Result::Fail(Errc::InvalidArgument, "asset has no download URL: " + req.asset.name);
    }

    fs::path target = fs::path(req.target_dir).lexically_normal();
    while (!target.empty() && !target.has_filename()) target = target.parent_path();
    const std::string target_dir = target.string();
    const std::string name = target.filename().string();
    const std::string parent = target.has_parent_path() ? target.parent_path().string() : std::string(".");
    const std::string tag = req.tag.empty() ? name : req.tag;

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Result::Fail(Errc::InstallFailed, "cannot create " + parent + ": " + ec.message());
    }

    RecoverInterrupted(parent, name, target_dir);

    if (!req.expected_sha256 && opt_.require_checksum) {
        out.failed_in = InstallPhase::Verifying;
        return Result::Fail(Errc::ChecksumUnavailable,
                            "no checksum published for " + req.asset.name + ", refusing unverified install");
    }

    // Downloading
    out.failed_in = InstallPhase::Downloading;
    TempFile payload;
    auto r = Download(req, parent, name, payload, out);
    if (!r.ok) {
        LogWarn("[%s] download of %s failed: %s", tag.c_str(), req.asset.name.c_str(), r.msg.c_str());
        return r;
    }

    // Verifying
    out.failed_in = InstallPhase::Verifying;
    if (req.expected_sha256) {
        r = IntegrityVerifier::Check(out.payload_sha256, req.expected_sha256);
        if (!r.ok) {
            LogError("[%s] %s: %s", tag.c_str(), req.asset.name.c_str(), r.msg.c_str());
            return r;
        }
        out.verification = Verification::Verified;
        LogInfo("[%s] sha256 verified: %s", tag.c_str(), out.payload_sha256.c_str());
    } else {
        out.verification = Verification::Skipped;
        LogWarn("[%s] no checksum published for %s, installing unverified payload",
                tag.c_str(), req.asset.name.c_str());
    }

    // Installing. From here on every failure, cancellation included, is
    // InstallFailed.
    out.failed_in = InstallPhase::Installing;
    StagingDir staging;
    r = StagingDir::CreateIn(parent, "." + name + ".staging-", staging);
    if (!r.ok) return r.As(Errc::InstallFailed);
    // mkdtemp creates 0700; the staging dir becomes the live target.
    fs::permissions(staging.Path(), fs::perms(0755), ec);
    if (ec) {
        return Result::Fail(Errc::InstallFailed, "chmod " + staging.Path() + ": " + ec.message());
    }

    r = Extract(req, payload.Path(), staging.Path(), out);
    if (!r.ok) {
        LogError("[%s] extraction failed: %s", tag.c_str(), r.msg.c_str());
        return r.As(Errc::InstallFailed);
    }
    payload = TempFile();

    r = verifier_.DigestTree(staging.Path(), out.tree_sha256);
    if (!r.ok) return r.As(Errc::InstallFailed);

    // The old receipt describes the old tree and must not survive the swap.
    const std::string receipt_path = InstallReceipt::PathFor(target_dir);
    InstallReceipt previous_receipt;
    const bool had_receipt = InstallReceipt::Load(receipt_path, previous_receipt).ok;
    r = RemoveReceipt(receipt_path, parent);
    if (!r.ok) return r.As(Errc::InstallFailed);

    r = Swap(staging, target_dir, parent, name);
    if (!r.ok) {
        LogError("[%s] swap into %s failed: %s", tag.c_str(), target_dir.c_str(), r.msg.c_str());
        if (had_receipt) {
            if (auto wr = InstallReceipt::Write(receipt_path, previous_receipt); !wr.ok) {
                LogWarn("[%s] previous install receipt not restored: %s", tag.c_str(), wr.msg.c_str());
            }
        }
        return r;
    }

    if (auto sr = FsyncDir(parent); !sr.ok) {
        LogWarn("[%s] %s", tag.c_str(), sr.msg.c_str());
    }

    InstallReceipt receipt;
    receipt.version = req.version;
    receipt.payload_sha256 = out.payload_sha256;
    receipt.tree_sha256 = out.tree_sha256;
    receipt.installed_at = UtcNowIso8601();
    if (auto wr = InstallReceipt::Write(receipt_path, receipt); !wr.ok) {
        LogWarn("[%s] install receipt not written: %s", tag.c_str(), wr.msg.c_str());
    }

    LogInfo("[%s] installed %s into %s (%llu bytes, %llu entries)",
            tag.c_str(),
            req.asset.name.c_str(),
            target_dir.c_str(),
            (unsigned long long)out.payload_bytes,
            (unsigned long long)out.entries);
    return Result::Ok();
}

Result StreamingInstaller::Download(const InstallRequest& req,
                                    const std::string& parent,
                                    const std::string& name,
                                    TempFile& out_file,
                                    InstallOutcome& out) const {
    auto r = TempFile::CreateIn(parent, "." + name + ".download-", out_file);
    if (!r.ok) return r.As(Errc::InstallFailed);

    FileWriter writer;
    r = FileWriter::Adopt(out_file.TakeFd(), out_file.Path(), writer);
    if (!r.ok) return r.As(Errc::InstallFailed);

    HashingWriter hashing(writer);

    TransferOptions transfer;
    transfer.timeout_seconds = opt_.download_timeout_seconds;
    transfer.cancel = req.cancel;
    transfer.progress = opt_.progress_sink;
    transfer.tag = req.tag.empty() ? req.asset.name : req.tag;

    LogInfo("[%s] downloading %s", transfer.tag.c_str(), req.asset.download_url.c_str());
    r = downloader_->Download(req.asset, hashing, transfer);
    if (!r.ok) {
        // A failing sink is local disk trouble, not the source's.
        return r.Is(Errc::Io) ? r.As(Errc::InstallFailed) : r;
    }

    r = writer.FsyncNow();
    if (r.ok) r = writer.Close();
    if (!r.ok) return r.As(Errc::InstallFailed);

    out.payload_sha256 = hashing.FinalHex();
    out.payload_bytes = hashing.BytesWritten();
    if (out.payload_sha256.empty()) {
        return Result::Fail(Errc::InstallFailed, "sha256 compute failed for " + req.asset.name);
    }
    return Result::Ok();
}

Result StreamingInstaller::Extract(const InstallRequest& req,
                                   const std::string& payload_path,
                                   const std::string& staging_dir,
                                   InstallOutcome& out) const {
    auto file = std::make_unique<FileReader>();
    auto r = FileReader::Open(payload_path, *file);
    if (!r.ok) return r.As(Errc::InstallFailed);

    std::unique_ptr<IReader> stream = std::move(file);
    if (EndsWith(req.asset.name, ".gz")) {
        std::unique_ptr<GzipReader> gz;
        r = GzipReader::Create(std::move(stream), gz);
        if (!r.ok) return r.As(Errc::InstallFailed);
        stream = std::move(gz);
    }

    TarStreamExtractor::Options eopt;
    eopt.strip_components = opt_.strip_components;
    eopt.cancel = req.cancel;
    eopt.progress_sink = opt_.progress_sink;

    TarStreamExtractor extractor(eopt);
    TarStreamExtractor::Stats stats;
    const std::string tag = req.tag.empty() ? req.asset.name : req.tag;
    r = extractor.ExtractToDir(*stream, staging_dir, tag, &stats);
    if (!r.ok) return r.As(Errc::InstallFailed);

    if (stats.entries == 0) {
        return Result::Fail(Errc::InstallFailed, "payload has no entries below its top-level directory: " +
                                                     req.asset.name);
    }
    out.entries = stats.entries;
    return Result::Ok();
}

Result StreamingInstaller::RemoveReceipt(const std::string& receipt_path, const std::string& parent) const {
    if (::unlink(receipt_path.c_str()) != 0) {
        const int err = errno;
        if (err == ENOENT) return Result::Ok();
        return Result::Fail(err, "unlink " + receipt_path + ": " + std::strerror(err));
    }
    if (auto r = FsyncDir(parent); !r.ok) {
        LogWarn("%s", r.msg.c_str());
    }
    return Result::Ok();
}

Result StreamingInstaller::Swap(StagingDir& staging,
                                const std::string& target_dir,
                                const std::string& parent,
                                const std::string& name) const {
    std::error_code ec;
    const bool has_target = fs::exists(fs::symlink_status(target_dir, ec));

    if (!has_target) {
        auto r = swap_ops_->Rename(staging.Path(), target_dir);
        if (!r.ok) return r.As(Errc::InstallFailed);
        staging.Release();
        return Result::Ok();
    }

    auto r = swap_ops_->Exchange(staging.Path(), target_dir);
    if (r.ok) {
        // |staging| now names the previous tree and is removed with it.
        return Result::Ok();
    }
    if (!ExchangeUnsupported(r)) return r.As(Errc::InstallFailed);

    LogDebug("atomic exchange unsupported for %s (%s), using rename pair", target_dir.c_str(), r.msg.c_str());

    StagingDir previous;
    r = StagingDir::CreateIn(parent, "." + name + ".previous-", previous);
    if (!r.ok) return r.As(Errc::InstallFailed);

    r = swap_ops_->Rename(target_dir, previous.Path());
    if (!r.ok) return r.As(Errc::InstallFailed);

    r = swap_ops_->Rename(staging.Path(), target_dir);
    if (!r.ok) {
        auto restore = swap_ops_->Rename(previous.Path(), target_dir);
        if (!restore.ok) {
            // Keep the old tree on disk; the next Install moves it back.
            previous.Release();
            LogError("previous install left at aside path: %s", restore.msg.c_str());
        }
        return r.As(Errc::InstallFailed);
    }

    staging.Release();
    return Result::Ok();
}

void StreamingInstaller::RecoverInterrupted(const std::string& parent,
                                            const std::string& name,
                                            const std::string& target_dir) const {
    const std::string previous_prefix = "." + name + ".previous-";
    const std::string staging_prefix = "." + name + ".staging-";
    const std::string download_prefix = "." + name + ".download-";

    std::vector<fs::path> previous;
    std::vector<fs::path> stale;

    std::error_code ec;
    fs::directory_iterator it(parent, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const std::string fname = it->path().filename().string();
        if (fname.rfind(previous_prefix, 0) == 0) {
            previous.push_back(it->path());
        } else if (fname.rfind(staging_prefix, 0) == 0 || fname.rfind(download_prefix, 0) == 0) {
            stale.push_back(it->path());
        }
    }

    if (!fs::exists(fs::symlink_status(target_dir, ec)) && !previous.empty()) {
        auto newest = std::max_element(previous.begin(), previous.end(), [](const fs::path& a, const fs::path& b) {
            std::error_code ea, eb;
            return fs::last_write_time(a, ea) < fs::last_write_time(b, eb);
        });
        auto r = swap_ops_->Rename(newest->string(), target_dir);
        if (r.ok) {
            LogWarn("restored %s from interrupted swap (%s)", target_dir.c_str(), newest->c_str());
            previous.erase(newest);
        } else {
            LogError("cannot restore %s: %s", target_dir.c_str(), r.msg.c_str());
            return;
        }
    }

    stale.insert(stale.end(), previous.begin(), previous.end());
    for (const auto& p : stale) {
        auto r = swap_ops_->RemoveTree(p.string());
        if (r.ok) {
            LogInfo("removed leftover %s", p.c_str());
        } else {
            LogWarn("%s", r.msg.c_str());
        }
    }
}

} // namespace fwfleet
