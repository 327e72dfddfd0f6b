#pragma once

#include "release/asset_downloader.hpp"

#include <memory>
#include <string>

namespace fwfleet {

// http(s):// URLs go to |remote|, everything else (file:// or a plain path)
// to |local|.
class RoutingAssetDownloader final : public IAssetDownloader {
  public:
    RoutingAssetDownloader(std::shared_ptr<IAssetDownloader> remote, std::shared_ptr<IAssetDownloader> local);

    Result Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) override;
    Result FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) override;

    static bool IsRemote(const std::string& url);

  private:
    IAssetDownloader& Route(const ReleaseAsset& asset) const;

    std::shared_ptr<IAssetDownloader> remote_;
    std::shared_ptr<IAssetDownloader> local_;
};

} // namespace fwfleet
