#include "store/memory_state_store.hpp"

#include <algorithm>

namespace fwfleet {

Result MemoryStateStore::Get(const std::string& device,
                             const std::string& component,
                             std::optional<FirmwareRecord>& out) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(Key{device, component});
    if (it == records_.end()) {
        out.reset();
    } else {
        out = it->second;
    }
    return Result::Ok();
}

Result MemoryStateStore::List(const RecordFilter& filter, std::vector<FirmwareRecord>& out) {
    out.clear();
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [key, rec] : records_) {
        if (filter.Matches(rec)) out.push_back(rec);
    }
    return Result::Ok();
}

Result MemoryStateStore::Upsert(const FirmwareRecord& record) {
    std::lock_guard<std::mutex> lk(mu_);
    records_[Key{record.device, record.component}] = record;
    return Result::Ok();
}

std::int64_t MemoryStateStore::AppendLocked(const UpdateLogEntry& entry) {
    UpdateLogEntry stored = entry;
    stored.id = next_id_++;
    log_.push_back(stored);
    return stored.id;
}

Result MemoryStateStore::AppendLog(const UpdateLogEntry& entry, std::int64_t& assigned_id) {
    std::lock_guard<std::mutex> lk(mu_);
    assigned_id = AppendLocked(entry);
    return Result::Ok();
}

Result MemoryStateStore::RecentLog(std::size_t limit, std::vector<UpdateLogEntry>& out) {
    out.clear();
    std::lock_guard<std::mutex> lk(mu_);
    const std::size_t n = std::min(limit, log_.size());
    out.assign(log_.rbegin(), log_.rbegin() + static_cast<std::ptrdiff_t>(n));
    return Result::Ok();
}

Result MemoryStateStore::RecordAttempt(const std::optional<FirmwareRecord>& record, const UpdateLogEntry& entry) {
    std::lock_guard<std::mutex> lk(mu_);
    if (record) records_[Key{record->device, record->component}] = *record;
    AppendLocked(entry);
    return Result::Ok();
}

Result MemoryStateStore::InsertIfAbsent(const FirmwareRecord& record, bool& inserted) {
    std::lock_guard<std::mutex> lk(mu_);
    inserted = records_.emplace(Key{record.device, record.component}, record).second;
    return Result::Ok();
}

} // namespace fwfleet
