#include "release/catalog_release_source.hpp"

namespace fwfleet {

CatalogReleaseSource::CatalogReleaseSource(std::map<std::string, ReleaseMetadata> catalog)
    : catalog_(std::move(catalog)) {}

void CatalogReleaseSource::Publish(const std::string& component, ReleaseMetadata release) {
    if (release.version.empty()) release.version = VersionFromTag(release.tag);
    std::lock_guard<std::mutex> lk(mu_);
    catalog_[component] = std::move(release);
}

Result CatalogReleaseSource::LatestRelease(const std::string& component, ReleaseMetadata& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = catalog_.find(component);
    if (it == catalog_.end()) {
        return Result::Fail(Errc::NotFound, "no catalogued release for " + component);
    }
    out = it->second;
    return Result::Ok();
}

} // namespace fwfleet
