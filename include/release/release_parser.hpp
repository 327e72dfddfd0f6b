#pragma once

#include "release/release.hpp"

#include <expected>
#include <string>

namespace fwfleet {

// Parses a GitHub-style "latest release" document:
// {"tag_name": ..., "published_at": ..., "body": ..., "html_url": ...,
//  "assets": [{"name": ..., "browser_download_url": ...}]}
class ReleaseParser {
  public:
    std::expected<ReleaseMetadata, std::string> Parse(const std::string& json_input) const;
};

} // namespace fwfleet
