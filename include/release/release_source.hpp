#pragma once

#include "release/release.hpp"
#include "util/result.hpp"

#include <string>

namespace fwfleet {

// Answers "what is the latest release of component X". Implementations report
// NotFound when the registry has no release and SourceUnavailable for
// transport or registry errors; the two must never be merged.
class IReleaseSource {
  public:
    virtual ~IReleaseSource() = default;
    virtual Result LatestRelease(const std::string& component, ReleaseMetadata& out) = 0;
};

} // namespace fwfleet
