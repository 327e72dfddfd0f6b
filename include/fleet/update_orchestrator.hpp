#pragma once

#include "crypto/integrity_verifier.hpp"
#include "fleet/key_lock_table.hpp"
#include "ota/installer.hpp"
#include "release/asset_downloader.hpp"
#include "release/release_source.hpp"
#include "store/firmware_state_store.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fwfleet {

enum class DeployState {
    Idle,
    Checking,
    Downloading,
    Verifying,
    Installing,
    Success,
    Failed,
};

enum class DeployOutcome {
    AlreadyCurrent,    // Success, nothing touched
    WouldUpdate,       // dry run stopped after Checking
    Updated,
    NoUpdateAvailable, // no release or no payload asset this cycle
    Failed,
};

const char* ToString(DeployState s);
const char* ToString(DeployOutcome o);

struct DeployResult {
    std::string device;
    std::string component;
    std::string from_version;
    std::string to_version; // empty when the latest release could not be resolved

    DeployState state = DeployState::Idle; // terminal state
    DeployState failed_in = DeployState::Idle;
    DeployOutcome outcome = DeployOutcome::Failed;
    Result result;                         // failure detail, Ok otherwise

    Verification verification = Verification::Skipped;
    bool logged = false; // an update_log entry was appended
};

struct PendingUpdate {
    std::string device;
    std::string component;
    std::string current;
    std::string latest;
    std::string notes;
};

struct UnknownUpdate {
    std::string device;
    std::string component;
    std::string current;
    Result reason;
};

struct CheckReport {
    std::vector<PendingUpdate> pending;
    std::vector<UnknownUpdate> unknown;
};

enum class VerifyStatus {
    Ok,
    Mismatch,
    Unverified, // no receipt for the recorded version; the record was not written by an install
    Missing,    // no record for the pair
};

const char* ToString(VerifyStatus s);

struct VerifyReport {
    std::string device;
    std::string component;
    std::string version;
    VerifyStatus status = VerifyStatus::Missing;
    std::string detail;
};

class UpdateOrchestrator {
public:
    struct Options {
        std::string install_root;            // target = <root>/<device>/<component>
        std::vector<std::string> devices;    // fleet roster
        std::vector<std::string> components; // tracked components
        std::size_t workers = 2;             // DeployAll pool size
        long checksum_timeout_seconds = 60;
    };

    UpdateOrchestrator(Options opt,
                       std::shared_ptr<IReleaseSource> source,
                       std::shared_ptr<IAssetDownloader> downloader,
                       std::shared_ptr<IInstaller> installer,
                       std::shared_ptr<IFirmwareStateStore> store);

    // Every roster device (or just |device|) times every tracked component.
    // Registry errors mark a pair unknown; only store errors fail the call.
    Result CheckUpdates(const std::optional<std::string>& device, CheckReport& out);

    DeployResult Deploy(const std::string& device, const std::string& component, bool dry_run);

    // Fans the selected pairs out over the worker pool. Results keep the
    // device-major order of the selection.
    std::vector<DeployResult> DeployAll(const std::optional<std::string>& device,
                                        const std::optional<std::string>& component,
                                        bool dry_run);

    Result Verify(const std::string& device, const std::string& component, VerifyReport& out);

    // Aborts the in-flight transfer for one pair (no-op when idle).
    void Cancel(const std::string& device, const std::string& component);

    std::string TargetDir(const std::string& device, const std::string& component) const;
    const Options& options() const { return opt_; }

    bool KnownDevice(const std::string& device) const;
    bool TrackedComponent(const std::string& component) const;

private:
    using Key = std::pair<std::string, std::string>;

    Result ResolveExpectedChecksum(const ReleaseMetadata& release,
                                   const ReleaseAsset& payload,
                                   const std::atomic_bool* cancel,
                                   std::optional<std::string>& out);

    void Fail(DeployResult& res, DeployState phase, Result r) const;
    void RecordFailure(DeployResult& res);

    Options opt_;
    std::shared_ptr<IReleaseSource> source_;
    std::shared_ptr<IAssetDownloader> downloader_;
    std::shared_ptr<IInstaller> installer_;
    std::shared_ptr<IFirmwareStateStore> store_;
    IntegrityVerifier verifier_;
    KeyLockTable locks_;

    std::mutex active_mu_;
    std::map<Key, std::atomic_bool*> active_;
};

} // namespace fwfleet
