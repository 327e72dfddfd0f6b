#include "store/firmware_record.hpp"

namespace fwfleet {

const char* ToString(FirmwareStatus s) {
    switch (s) {
        case FirmwareStatus::Current:
            return "current";
        case FirmwareStatus::Available:
            return "available";
        case FirmwareStatus::Deprecated:
            return "deprecated";
        case FirmwareStatus::Pending:
            return "pending";
    }
    return "unknown";
}

const char* ToString(LogStatus s) {
    switch (s) {
        case LogStatus::Success:
            return "success";
        case LogStatus::Failed:
            return "failed";
    }
    return "unknown";
}

bool ParseFirmwareStatus(std::string_view s, FirmwareStatus& out) {
    if (s == "current") {
        out = FirmwareStatus::Current;
    } else if (s == "available") {
        out = FirmwareStatus::Available;
    } else if (s == "deprecated") {
        out = FirmwareStatus::Deprecated;
    } else if (s == "pending") {
        out = FirmwareStatus::Pending;
    } else {
        return false;
    }
    return true;
}

bool ParseLogStatus(std::string_view s, LogStatus& out) {
    if (s == "success") {
        out = LogStatus::Success;
    } else if (s == "failed") {
        out = LogStatus::Failed;
    } else {
        return false;
    }
    return true;
}

bool RecordFilter::Matches(const FirmwareRecord& r) const {
    if (device && r.device != *device) return false;
    if (component && r.component != *component) return false;
    if (status && r.status != *status) return false;
    return true;
}

} // namespace fwfleet
