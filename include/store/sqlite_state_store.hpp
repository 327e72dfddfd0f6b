#pragma once

#include "store/firmware_state_store.hpp"
#include "store/sqlite_db.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace fwfleet {

// Tables firmware_versions (PRIMARY KEY(device, component)) and update_log
// (AUTOINCREMENT ids). One connection; mu_ serializes every statement so a
// transaction never interleaves with another thread's.
class SqliteStateStore final : public IFirmwareStateStore {
public:
    // Creates the parent directory and the schema when missing.
    static Result Open(const std::string& path, std::unique_ptr<SqliteStateStore>& out);

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
    explicit SqliteStateStore(std::unique_ptr<SqliteDb> db);

    Result Migrate();
    Result UpsertLocked(const FirmwareRecord& record);
    Result AppendLogLocked(const UpdateLogEntry& entry, std::int64_t& assigned_id);

    std::unique_ptr<SqliteDb> db_;
    std::mutex mu_;
};

} // namespace fwfleet
