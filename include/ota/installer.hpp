#pragma once

#include "release/release.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace fwfleet {

struct InstallRequest {
    ReleaseAsset asset;
    std::string target_dir;
    std::optional<std::string> expected_sha256;
    std::string version;                      // recorded in the install receipt
    std::string tag;                          // "device/component" for logs
    const std::atomic_bool* cancel = nullptr; // per attempt
};

enum class Verification { Verified, Skipped };

// Stage an install stopped in; meaningful only when Install fails.
enum class InstallPhase { Downloading, Verifying, Installing };

struct InstallOutcome {
    Verification verification = Verification::Skipped;
    std::string payload_sha256;
    std::string tree_sha256;
    std::uint64_t payload_bytes = 0;
    std::uint64_t entries = 0;
    InstallPhase failed_in = InstallPhase::Downloading;
};

// Download, verify, then install a payload over |target_dir|. On any error
// the previously installed tree is left as it was. Errors:
// SourceUnavailable / Cancelled (transfer), ChecksumMismatch,
// ChecksumUnavailable (unverified payload refused by policy), InstallFailed
// (anything after a verified download, cancellation included).
class IInstaller {
  public:
    virtual ~IInstaller() = default;
    virtual Result Install(const InstallRequest& req, InstallOutcome& out) = 0;
};

} // namespace fwfleet
