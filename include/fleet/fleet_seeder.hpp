#pragma once

#include "release/release.hpp"
#include "store/firmware_state_store.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace fwfleet {

// device -> component -> version believed installed before fwfleet manages it.
using SeedVersions = std::map<std::string, std::map<std::string, std::string>>;

// Inserts a record for every seeded pair that has none yet. Status is current
// when the seed equals the catalogue's latest version, available otherwise.
// Seeded checksums are placeholders (sha256 of "<device>-<component>-<version>"):
// there is no payload to digest, and `verify` reports such pairs unverified.
Result SeedFleet(IFirmwareStateStore& store,
                 const SeedVersions& seed,
                 const std::map<std::string, ReleaseMetadata>& catalog,
                 std::size_t& inserted);

} // namespace fwfleet
