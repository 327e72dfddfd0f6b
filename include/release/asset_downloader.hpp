#pragma once

#include "io/io.hpp"
#include "ota/progress.hpp"
#include "release/release.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace fwfleet {

struct TransferOptions {
    long timeout_seconds = 600;               // whole transfer, 0 => none
    const std::atomic_bool* cancel = nullptr; // per attempt
    IProgress* progress = nullptr;
    std::string tag;                          // label for progress/logs
};

inline constexpr std::size_t kMaxChecksumAssetBytes = 64 * 1024;

// Moves asset bytes. Download streams into |sink| in bounded chunks and never
// holds the payload in memory. Errors: SourceUnavailable (transport, HTTP
// status, timeout), Cancelled, Io (sink failure).
class IAssetDownloader {
  public:
    virtual ~IAssetDownloader() = default;
    virtual Result Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) = 0;
    virtual Result FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) = 0;
};

} // namespace fwfleet
