#include "fleet/fleet_seeder.hpp"

#include "crypto/sha256.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

namespace fwfleet {

Result SeedFleet(IFirmwareStateStore& store,
                 const SeedVersions& seed,
                 const std::map<std::string, ReleaseMetadata>& catalog,
                 std::size_t& inserted) {
    inserted = 0;
    const std::string now = UtcNowIso8601();

    for (const auto& [device, components] : seed) {
        for (const auto& [component, version] : components) {
            FirmwareRecord rec;
            rec.device = device;
            rec.component = component;
            rec.version = version;
            rec.release_date = version;
            rec.checksum = Sha256Hex(device + "-" + component + "-" + version);
            rec.status = FirmwareStatus::Available;
            rec.created_at = now;

            auto it = catalog.find(component);
            if (it != catalog.end()) {
                if (it->second.version == version) rec.status = FirmwareStatus::Current;
                rec.download_url = it->second.html_url;
                rec.notes = it->second.notes;
            }

            bool added = false;
            if (auto r = store.InsertIfAbsent(rec, added); !r.ok) return r;
            if (added) {
                ++inserted;
                LogDebug("seeded %s/%s at %s", device.c_str(), component.c_str(), version.c_str());
            }
        }
    }
    return Result::Ok();
}

} // namespace fwfleet
