#pragma once

#include "release/release_source.hpp"

#include <map>
#include <mutex>
#include <string>

namespace fwfleet {

// Fixed in-process catalogue of the latest release per component. Backs the
// offline fleet mode and tests; Publish replaces an entry.
class CatalogReleaseSource final : public IReleaseSource {
  public:
    CatalogReleaseSource() = default;
    explicit CatalogReleaseSource(std::map<std::string, ReleaseMetadata> catalog);

    void Publish(const std::string& component, ReleaseMetadata release);

    Result LatestRelease(const std::string& component, ReleaseMetadata& out) override;

  private:
    std::mutex mu_;
    std::map<std::string, ReleaseMetadata> catalog_;
};

} // namespace fwfleet
