#pragma once

#include "release/asset_downloader.hpp"

#include <cstddef>
#include <string>

namespace fwfleet {

// Serves assets from the local filesystem ("file:///path" or a plain path).
// Used by the offline catalogue and by tests.
class LocalAssetDownloader final : public IAssetDownloader {
  public:
    explicit LocalAssetDownloader(std::size_t chunk_size = 64 * 1024) : chunk_size_(chunk_size) {}

    Result Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) override;
    Result FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) override;

    static std::string PathFromUrl(const std::string& url);

  private:
    std::size_t chunk_size_;
};

} // namespace fwfleet
