#include "util/time_utils.hpp"

#include <ctime>

namespace fwfleet {

namespace {

std::string Format(TimePoint tp, const char* fmt) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return {};
    char buf[32]{};
    const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

TimePoint Now() { return Clock::now(); }

std::string FormatIso8601Utc(TimePoint tp) { return Format(tp, "%Y-%m-%dT%H:%M:%SZ"); }

std::string UtcNowIso8601() { return FormatIso8601Utc(Now()); }

std::string FormatDateUtc(TimePoint tp) { return Format(tp, "%Y-%m-%d"); }

std::string UtcToday() { return FormatDateUtc(Now()); }

std::string DatePart(const std::string& timestamp) {
    const auto t = timestamp.find('T');
    return t == std::string::npos ? timestamp : timestamp.substr(0, t);
}

} // namespace fwfleet
