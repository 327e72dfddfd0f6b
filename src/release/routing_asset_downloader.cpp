#include "release/routing_asset_downloader.hpp"

namespace fwfleet {

RoutingAssetDownloader::RoutingAssetDownloader(std::shared_ptr<IAssetDownloader> remote,
                                               std::shared_ptr<IAssetDownloader> local)
    : remote_(std::move(remote)), local_(std::move(local)) {}

bool RoutingAssetDownloader::IsRemote(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

IAssetDownloader& RoutingAssetDownloader::Route(const ReleaseAsset& asset) const {
    return IsRemote(asset.download_url) ? *remote_ : *local_;
}

Result RoutingAssetDownloader::Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) {
    return Route(asset).Download(asset, sink, opt);
}

Result RoutingAssetDownloader::FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) {
    return Route(asset).FetchText(asset, out, opt);
}

} // namespace fwfleet
