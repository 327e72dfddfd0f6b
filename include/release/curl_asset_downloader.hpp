#pragma once

#include "release/asset_downloader.hpp"
#include "release/http_client.hpp"

#include <memory>
#include <string>

namespace fwfleet {

class CurlAssetDownloader final : public IAssetDownloader {
  public:
    CurlAssetDownloader(std::shared_ptr<const HttpClient> http, std::string bearer_token);

    Result Download(const ReleaseAsset& asset, IWriter& sink, const TransferOptions& opt) override;
    Result FetchText(const ReleaseAsset& asset, std::string& out, const TransferOptions& opt) override;

  private:
    HttpClient::Request MakeRequest(const ReleaseAsset& asset, const TransferOptions& opt) const;

    std::shared_ptr<const HttpClient> http_;
    std::string bearer_token_;
};

} // namespace fwfleet
