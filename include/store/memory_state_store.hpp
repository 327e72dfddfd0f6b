#pragma once

#include "store/firmware_state_store.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace fwfleet {

// Process-local store for dry environments and tests. Same ordering and id
// rules as the SQLite store; nothing survives the process.
class MemoryStateStore final : public IFirmwareStateStore {
public:
    Result Get(const std::string& device,
               const std::string& component,
               std::optional<FirmwareRecord>& out) override;
    Result List(const RecordFilter& filter, std::vector<FirmwareRecord>& out) override;
    Result Upsert(const FirmwareRecord& record) override;
    Result AppendLog(const UpdateLogEntry& entry, std::int64_t& assigned_id) override;
    Result RecentLog(std::size_t limit, std::vector<UpdateLogEntry>& out) override;
    Result RecordAttempt(const std::optional<FirmwareRecord>& record, const UpdateLogEntry& entry) override;
    Result InsertIfAbsent(const FirmwareRecord& record, bool& inserted) override;

private:
    using Key = std::pair<std::string, std::string>;

    std::int64_t AppendLocked(const UpdateLogEntry& entry);

    std::mutex mu_;
    std::map<Key, FirmwareRecord> records_;
    std::vector<UpdateLogEntry> log_;
    std::int64_t next_id_ = 1;
};

} // namespace fwfleet
