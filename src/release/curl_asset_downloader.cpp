#include "release/curl_asset_downloader.hpp"

namespace fwfleet {

CurlAssetDownloader::CurlAssetDownloader(std::shared_ptr<const HttpClient> http, std::string bearer_token)
    : http_(std::move(http)), bearer_token_(std::move(bearer_token)) {}

HttpClient::Request CurlAssetDownloader::MakeRequest(const ReleaseAsset& asset,
                                                     const TransferOptions& opt) const {
    HttpClient::Request req;
    req.url = asset.download_url;
    req.accept = "application/octet-stream";
    req.bearer_token = bearer_token_;
    req.timeout_seconds = opt.timeout_seconds;
    req.cancel = opt.cancel;
    req.progress = opt.progress;
    req.tag = opt.tag.empty() ? asset.name : opt.tag;
    return req;
}

Result CurlAssetDownloader::Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) {
    long status = 0;
    auto r = http_->Stream(MakeRequest(asset, opt), sink, status);
    if (!r.ok && r.Is(Errc::NotFound)) return r.As(Errc::SourceUnavailable);
    return r;
}

Result CurlAssetDownloader::FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) {
    long status = 0;
    auto req = MakeRequest(asset, opt);
    req.progress = nullptr;
    auto r = http_->Get(req, out, kMaxChecksumAssetBytes, status);
    if (!r.ok && r.Is(Errc::NotFound)) return r.As(Errc::SourceUnavailable);
    return r;
}

} // namespace fwfleet
