#pragma once

#include "release/http_client.hpp"
#include "release/release_parser.hpp"
#include "release/release_source.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>

namespace fwfleet {

// GitHub-style registry: GET {api_base}/repos/{owner/repo}/releases/latest,
// one repository per component.
class HttpReleaseSource final : public IReleaseSource {
  public:
    struct Options {
        std::string api_base = "https://api.github.com";
        std::map<std::string, std::string> repos; // component -> "owner/repo"
        std::string bearer_token;
        long timeout_seconds = 30;
    };

    HttpReleaseSource(Options opt, std::shared_ptr<const HttpClient> http);

    Result LatestRelease(const std::string& component, ReleaseMetadata& out) override;

    std::string LatestReleaseUrl(const std::string& repo) const;

    // Removes assets whose URL is not http(s); a registry document must not
    // point an install at a local path. Returns how many were dropped.
    static std::size_t DropNonRemoteAssets(ReleaseMetadata& rel);

  private:
    Options opt_;
    std::shared_ptr<const HttpClient> http_;
    ReleaseParser parser_;
};

} // namespace fwfleet
