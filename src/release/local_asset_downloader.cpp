#include "release/local_asset_downloader.hpp"

#include "io/file_reader.hpp"
#include "system/signals.hpp"

#include <chrono>
#include <vector>

namespace fwfleet {

std::string LocalAssetDownloader::PathFromUrl(const std::string& url) {
    constexpr std::string_view kScheme = "file://";
    if (url.rfind(kScheme, 0) == 0) return url.substr(kScheme.size());
    return url;
}

Result LocalAssetDownloader::Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) {
    FileReader reader;
    auto r = FileReader::Open(PathFromUrl(asset.download_url), reader);
    if (!r.ok) return r.As(Errc::SourceUnavailable);

    const std::string_view tag = opt.tag.empty() ? std::string_view(asset.name) : std::string_view(opt.tag);
    const std::uint64_t total = reader.TotalSize().value_or(0);
    std::uint64_t done = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opt.timeout_seconds);

    std::vector<std::uint8_t> buf(chunk_size_ ? chunk_size_ : 64 * 1024);
    while (true) {
        if (CancelRequested(opt.cancel)) {
            return Result::Fail(Errc::Cancelled, "transfer cancelled: " + asset.download_url);
        }
        if (opt.timeout_seconds > 0 && std::chrono::steady_clock::now() > deadline) {
            return Result::Fail(Errc::SourceUnavailable, "timed out: " + asset.download_url);
        }
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(Errc::SourceUnavailable, "read failed: " + asset.download_url);

        auto wr = sink.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.ok) return wr;

        done += static_cast<std::uint64_t>(n);
        if (opt.progress) {
            opt.progress->OnProgress(ProgressEvent{.component = tag, .comp_done = done, .comp_total = total});
        }
    }
    return Result::Ok();
}

Result LocalAssetDownloader::FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) {
    out.clear();
    FileReader reader;
    auto r = FileReader::Open(PathFromUrl(asset.download_url), reader);
    if (!r.ok) return r.As(Errc::SourceUnavailable);

    std::vector<std::uint8_t> buf(4096);
    while (true) {
        if (CancelRequested(opt.cancel)) {
            return Result::Fail(Errc::Cancelled, "transfer cancelled: " + asset.download_url);
        }
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(Errc::SourceUnavailable, "read failed: " + asset.download_url);
        if (out.size() + static_cast<size_t>(n) > kMaxChecksumAssetBytes) {
            return Result::Fail(Errc::SourceUnavailable, "checksum asset too large: " + asset.download_url);
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace fwfleet
