#include "util/version_comparator.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>
#include <string_view>

namespace fwfleet {

namespace {

bool IsSeparator(char c) { return c == '.' || c == '-'; }

} // namespace

std::optional<std::vector<std::uint64_t>> VersionComparator::Parse(const std::string& version) {
    if (version.empty())
        return std::nullopt;

    auto parts = version | std::views::split('.') |
                 std::views::transform([](auto&& rng) { return std::string_view(rng); });

    std::vector<std::uint64_t> out;
    for (std::string_view dotted : parts) {
        // Each dot segment may itself be a dash-joined date: "2024-11-19".
        while (true) {
            const auto dash = std::ranges::find_if(dotted, IsSeparator);
            const std::string_view seg = dotted.substr(0, static_cast<size_t>(dash - dotted.begin()));
            if (seg.empty())
                return std::nullopt;

            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(seg.data(), seg.data() + seg.size(), value);
            if (ec != std::errc{} || ptr != seg.data() + seg.size())
                return std::nullopt;
            out.push_back(value);

            if (dash == dotted.end())
                break;
            dotted.remove_prefix(seg.size() + 1);
        }
    }
    return out;
}

int VersionComparator::Compare(const std::string& lhs, const std::string& rhs) {
    const auto lhs_parts = Parse(lhs);
    const auto rhs_parts = Parse(rhs);

    if (!lhs_parts && !rhs_parts)
        return 0;
    if (!lhs_parts)
        return -1;
    if (!rhs_parts)
        return 1;

    const size_t n = std::max(lhs_parts->size(), rhs_parts->size());
    for (size_t i = 0; i < n; ++i) {
        const std::uint64_t lhs_val = i < lhs_parts->size() ? (*lhs_parts)[i] : 0;
        const std::uint64_t rhs_val = i < rhs_parts->size() ? (*rhs_parts)[i] : 0;

        if (lhs_val > rhs_val)
            return 1;
        if (lhs_val < rhs_val)
            return -1;
    }

    return 0;
}

} // namespace fwfleet
