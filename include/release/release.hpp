#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwfleet {

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

struct ReleaseMetadata {
    std::string tag;          // as published, e.g. "v6.6.51"
    std::string version;      // tag without the leading 'v'
    std::string release_date; // YYYY-MM-DD, may be empty
    std::string notes;
    std::string html_url;
    std::vector<ReleaseAsset> assets;
};

inline constexpr std::string_view kPayloadSuffix = ".tar.gz";

std::string VersionFromTag(std::string_view tag);

// First asset whose name ends in ".tar.gz"; NoAssetFound otherwise.
Result SelectPayloadAsset(const ReleaseMetadata& release, ReleaseAsset& out);

// Companion digest for |payload|: "<payload>.sha256" when published, else any
// ".sha256"/".sha256sum" asset.
std::optional<ReleaseAsset> SelectChecksumAsset(const ReleaseMetadata& release,
                                                const ReleaseAsset& payload);

} // namespace fwfleet
