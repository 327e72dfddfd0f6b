#pragma once

#include "store/firmware_record.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fwfleet {

// Persistent per-(device, component) records plus the append-only update log.
// Every failure is reported as Errc::StoreUnavailable.
class IFirmwareStateStore {
public:
    virtual ~IFirmwareStateStore() = default;

    // |out| is empty when the pair has no record.
    virtual Result Get(const std::string& device,
                       const std::string& component,
                       std::optional<FirmwareRecord>& out) = 0;

    // Ordered by (device, component).
    virtual Result List(const RecordFilter& filter, std::vector<FirmwareRecord>& out) = 0;

    virtual Result Upsert(const FirmwareRecord& record) = 0;

    // Assigns entry.id; the stored copy is returned through |assigned_id|.
    virtual Result AppendLog(const UpdateLogEntry& entry, std::int64_t& assigned_id) = 0;

    // Most recent first.
    virtual Result RecentLog(std::size_t limit, std::vector<UpdateLogEntry>& out) = 0;

    // Upsert (when |record| is set) and log append applied together or not at all.
    virtual Result RecordAttempt(const std::optional<FirmwareRecord>& record, const UpdateLogEntry& entry) = 0;

    // Seeding: leaves an existing record alone.
    virtual Result InsertIfAbsent(const FirmwareRecord& record, bool& inserted) = 0;
};

} // namespace fwfleet
