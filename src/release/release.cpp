#include "release/release.hpp"

#include "util/path_utils.hpp"

namespace fwfleet {

std::string VersionFromTag(std::string_view tag) {
    if (!tag.empty() && (tag.front() == 'v' || tag.front() == 'V')) tag.remove_prefix(1);
    return std::string(tag);
}

Result SelectPayloadAsset(const ReleaseMetadata& release, ReleaseAsset& out) {
    for (const auto& asset : release.assets) {
        if (EndsWith(asset.name, kPayloadSuffix)) {
            out = asset;
            return Result::Ok();
        }
    }
    return Result::Fail(Errc::NoAssetFound,
                        "no " + std::string(kPayloadSuffix) + " asset in release " + release.tag);
}

std::optional<ReleaseAsset> SelectChecksumAsset(const ReleaseMetadata& release,
                                                const ReleaseAsset& payload) {
    const std::string sibling = payload.name + ".sha256";
    for (const auto& asset : release.assets) {
        if (asset.name == sibling) return asset;
    }
    for (const auto& asset : release.assets) {
        if (EndsWith(asset.name, ".sha256") || EndsWith(asset.name, ".sha256sum")) return asset;
    }
    return std::nullopt;
}

} // namespace fwfleet
