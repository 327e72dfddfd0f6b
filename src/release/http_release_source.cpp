#include "release/http_release_source.hpp"

#include "release/routing_asset_downloader.hpp"
#include "util/logger.hpp"

#include <vector>

namespace fwfleet {

namespace {
constexpr std::size_t kMaxReleaseDocumentBytes = 4 * 1024 * 1024;
} // namespace

HttpReleaseSource::HttpReleaseSource(Options opt, std::shared_ptr<const HttpClient> http)
    : opt_(std::move(opt)), http_(std::move(http)) {
    while (!opt_.api_base.empty() && opt_.api_base.back() == '/') opt_.api_base.pop_back();
}

std::string HttpReleaseSource::LatestReleaseUrl(const std::string& repo) const {
    return opt_.api_base + "/repos/" + repo + "/releases/latest";
}

std::size_t HttpReleaseSource::DropNonRemoteAssets(ReleaseMetadata& rel) {
    const auto before = rel.assets.size();
    std::erase_if(rel.assets, [](const ReleaseAsset& a) { return !RoutingAssetDownloader::IsRemote(a.download_url); });
    return before - rel.assets.size();
}

Result HttpReleaseSource::LatestRelease(const std::string& component, ReleaseMetadata& out) {
    auto it = opt_.repos.find(component);
    if (it == opt_.repos.end()) {
        return Result::Fail(Errc::NotFound, "no registry repository configured for " + component);
    }

    HttpClient::Request req;
    req.url = LatestReleaseUrl(it->second);
    req.accept = "application/vnd.github+json";
    req.bearer_token = opt_.bearer_token;
    req.timeout_seconds = opt_.timeout_seconds;
    req.tag = component;

    std::string body;
    long status = 0;
    auto r = http_->Get(req, body, kMaxReleaseDocumentBytes, status);
    if (!r.ok) {
        if (r.Is(Errc::NotFound)) {
            LogInfo("[%s] no published release at %s", component.c_str(), req.url.c_str());
            return r;
        }
        LogWarn("[%s] release query failed: %s", component.c_str(), r.msg.c_str());
        return r.As(Errc::SourceUnavailable);
    }

    auto parsed = parser_.Parse(body);
    if (!parsed) {
        return Result::Fail(Errc::SourceUnavailable,
                            "bad release document from " + req.url + ": " + parsed.error());
    }
    out = std::move(*parsed);
    if (const auto dropped = DropNonRemoteAssets(out); dropped > 0) {
        LogWarn("[%s] ignored %zu asset(s) without an http(s) URL in %s", component.c_str(), dropped, req.url.c_str());
    }
    LogDebug("[%s] latest release %s (%zu assets)", component.c_str(), out.tag.c_str(), out.assets.size());
    return Result::Ok();
}

} // namespace fwfleet
