#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fwfleet {

enum class FirmwareStatus {
    Current,
    Available,
    Deprecated,
    Pending,
};

enum class LogStatus {
    Success,
    Failed,
};

const char* ToString(FirmwareStatus s);
const char* ToString(LogStatus s);
bool ParseFirmwareStatus(std::string_view s, FirmwareStatus& out);
bool ParseLogStatus(std::string_view s, LogStatus& out);

// What the orchestrator believes is installed for one (device, component).
struct FirmwareRecord {
    std::string device;
    std::string component;
    std::string version;
    std::string release_date;
    std::string checksum; // hex sha256 of the installed payload
    FirmwareStatus status = FirmwareStatus::Current;
    std::string download_url;
    std::string notes;
    std::string created_at;
};

// One install attempt. |id| is assigned by the store and never reused.
struct UpdateLogEntry {
    std::int64_t id = 0;
    std::string device;
    std::string component;
    std::string from_version;
    std::string to_version;
    LogStatus status = LogStatus::Success;
    std::string applied_at;
};

struct RecordFilter {
    std::optional<std::string> device;
    std::optional<std::string> component;
    std::optional<FirmwareStatus> status;

    bool Matches(const FirmwareRecord& r) const;
};

// Version string reported for a pair without a record.
inline constexpr std::string_view kUnknownVersion = "unknown";

} // namespace fwfleet
