#include "ota/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <string_view>

namespace fwfleet {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string::npos) return false;

    std::string_view sv(p);
    while (!sv.empty()) {
        while (!sv.empty() && sv.front() == '/') sv.remove_prefix(1);
        const auto pos = sv.find('/');
        const auto seg = sv.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        sv.remove_prefix(pos);
    }
    return true;
}

Result ArchivePathPolicy::Normalize(const char* raw_path,
                                    const char* what,
                                    std::string& out_relative) const {
    out_relative.clear();
    if (!raw_path || !*raw_path) return Result::Ok();

    std::string normalized = NormalizeTarPath(std::string(raw_path));
    if (normalized.empty() || normalized == ".") return Result::Ok();

    if (safe_paths_only_ && !IsSafeRelativePath(normalized)) {
        return Result::Fail(Errc::InstallFailed, std::string("Unsafe ") + what + " in archive: " + normalized);
    }

    out_relative = StripLeadingComponents(normalized, strip_components_);
    if (out_relative == ".") out_relative.clear();
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "path", out_relative);
}

Result ArchivePathPolicy::NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "hardlink target", out_relative);
}

} // namespace fwfleet
