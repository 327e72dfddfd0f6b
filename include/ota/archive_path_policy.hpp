#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <string>

namespace fwfleet {

class ArchivePathPolicy {
  public:
    ArchivePathPolicy(bool safe_paths_only, std::size_t strip_components)
        : safe_paths_only_(safe_paths_only), strip_components_(strip_components) {}

    // |out_relative| is empty when the entry vanishes after stripping and
    // must be skipped.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

  private:
    static bool IsSafeRelativePath(const std::string& p);
    Result Normalize(const char* raw_path, const char* what, std::string& out_relative) const;

    bool safe_paths_only_ = true;
    std::size_t strip_components_ = 0;
};

} // namespace fwfleet
