#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fwfleet {

// Total order over dot-separated numeric versions ("6.6.51"). Date tags
// ("2024-11-19") are accepted with '-' as a separator. Missing trailing
// segments count as zero, so "6.6" == "6.6.0". Strings that do not parse are
// lower than every parseable version and equal to one another.
class VersionComparator {
public:
    static int Compare(const std::string& lhs, const std::string& rhs);

    static bool IsNewer(const std::string& candidate, const std::string& current) {
        return Compare(candidate, current) > 0;
    }
    static bool IsSame(const std::string& lhs, const std::string& rhs) {
        return Compare(lhs, rhs) == 0;
    }

    static std::optional<std::vector<std::uint64_t>> Parse(const std::string& version);
};

} // namespace fwfleet
