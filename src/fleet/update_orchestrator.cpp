#include "fleet/update_orchestrator.hpp"

#include "fleet/work_queue.hpp"
#include "ota/install_receipt.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"
#include "util/version_comparator.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

namespace fwfleet {

namespace {

DeployState StateOf(InstallPhase phase) {
    switch (phase) {
        case InstallPhase::Downloading:
            return DeployState::Downloading;
        case InstallPhase::Verifying:
            return DeployState::Verifying;
        case InstallPhase::Installing:
            return DeployState::Installing;
    }
    return DeployState::Installing;
}

bool Contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

const char* ToString(DeployState s) {
    switch (s) {
        case DeployState::Idle:
            return "idle";
        case DeployState::Checking:
            return "checking";
        case DeployState::Downloading:
            return "downloading";
        case DeployState::Verifying:
            return "verifying";
        case DeployState::Installing:
            return "installing";
        case DeployState::Success:
            return "success";
        case DeployState::Failed:
            return "failed";
    }
    return "unknown";
}

const char* ToString(DeployOutcome o) {
    switch (o) {
        case DeployOutcome::AlreadyCurrent:
            return "up-to-date";
        case DeployOutcome::WouldUpdate:
            return "would-update";
        case DeployOutcome::Updated:
            return "updated";
        case DeployOutcome::NoUpdateAvailable:
            return "no-update";
        case DeployOutcome::Failed:
            return "failed";
    }
    return "unknown";
}

const char* ToString(VerifyStatus s) {
    switch (s) {
        case VerifyStatus::Ok:
            return "ok";
        case VerifyStatus::Mismatch:
            return "mismatch";
        case VerifyStatus::Unverified:
            return "unverified";
        case VerifyStatus::Missing:
            return "missing";
    }
    return "unknown";
}

UpdateOrchestrator::UpdateOrchestrator(Options opt,
                                       std::shared_ptr<IReleaseSource> source,
                                       std::shared_ptr<IAssetDownloader> downloader,
                                       std::shared_ptr<IInstaller> installer,
                                       std::shared_ptr<IFirmwareStateStore> store)
    : opt_(std::move(opt)),
      source_(std::move(source)),
      downloader_(std::move(downloader)),
      installer_(std::move(installer)),
      store_(std::move(store)) {
    if (opt_.workers == 0) opt_.workers = 1;
}

bool UpdateOrchestrator::KnownDevice(const std::string& device) const { return Contains(opt_.devices, device); }

bool UpdateOrchestrator::TrackedComponent(const std::string& component) const {
    return Contains(opt_.components, component);
}

std::string UpdateOrchestrator::TargetDir(const std::string& device, const std::string& component) const {
    return (std::filesystem::path(opt_.install_root) / device / component).string();
}

Result UpdateOrchestrator::CheckUpdates(const std::optional<std::string>& device, CheckReport& out) {
    out = CheckReport{};

    if (device && !KnownDevice(*device)) {
        return Result::Fail(Errc::InvalidArgument, "unknown device: " + *device);
    }
    const std::vector<std::string> devices = device ? std::vector<std::string>{*device} : opt_.devices;

    // One registry query per component, shared by every device.
    std::map<std::string, std::pair<Result, ReleaseMetadata>> latest;
    for (const auto& component : opt_.components) {
        ReleaseMetadata rel;
        auto r = source_->LatestRelease(component, rel);
        if (!r.ok) {
            LogWarn("latest release of %s unknown: %s", component.c_str(), r.msg.c_str());
        }
        latest.emplace(component, std::make_pair(r, std::move(rel)));
    }

    for (const auto& dev : devices) {
        for (const auto& component : opt_.components) {
            std::optional<FirmwareRecord> rec;
            if (auto r = store_->Get(dev, component, rec); !r.ok) return r;
            const std::string current = rec ? rec->version : std::string(kUnknownVersion);

            const auto& [status, rel] = latest.at(component);
            if (!status.ok) {
                out.unknown.push_back(UnknownUpdate{dev, component, current, status});
                continue;
            }
            if (rec && VersionComparator::IsSame(rec->version, rel.version)) continue;

            out.pending.push_back(PendingUpdate{dev, component, current, rel.version, rel.notes});
        }
    }
    return Result::Ok();
}

void UpdateOrchestrator::Fail(DeployResult& res, DeployState phase, Result r) const {
    res.state = DeployState::Failed;
    res.failed_in = phase;
    res.outcome = DeployOutcome::Failed;
    res.result = std::move(r);
}

void UpdateOrchestrator::RecordFailure(DeployResult& res) {
    UpdateLogEntry entry;
    entry.device = res.device;
    entry.component = res.component;
    entry.from_version = res.from_version;
    entry.to_version = res.to_version;
    entry.status = LogStatus::Failed;
    entry.applied_at = UtcNowIso8601();

    std::int64_t id = 0;
    if (auto r = store_->AppendLog(entry, id); !r.ok) {
        LogError("%s/%s: failed attempt not logged: %s", res.device.c_str(), res.component.c_str(), r.msg.c_str());
        res.result = Result::Fail(Errc::StoreUnavailable, res.result.msg + "; " + r.msg);
        return;
    }
    res.logged = true;
}

Result UpdateOrchestrator::ResolveExpectedChecksum(const ReleaseMetadata& release,
                                                   const ReleaseAsset& payload,
                                                   const std::atomic_bool* cancel,
                                                   std::optional<std::string>& out) {
    out.reset();
    const auto asset = SelectChecksumAsset(release, payload);
    if (!asset) return Result::Ok();

    TransferOptions topt;
    topt.timeout_seconds = opt_.checksum_timeout_seconds;
    topt.cancel = cancel;
    topt.tag = asset->name;

    std::string text;
    auto r = downloader_->FetchText(*asset, text, topt);
    if (!r.ok) return r;

    auto parsed = IntegrityVerifier::ParseChecksumText(text);
    if (!parsed) {
        LogWarn("ignoring checksum asset %s: %s", asset->name.c_str(), parsed.error().c_str());
        return Result::Ok();
    }
    out = std::move(*parsed);
    return Result::Ok();
}

DeployResult UpdateOrchestrator::Deploy(const std::string& device, const std::string& component, bool dry_run) {
    DeployResult res;
    res.device = device;
    res.component = component;
    res.from_version = std::string(kUnknownVersion);

    if (!KnownDevice(device)) {
        Fail(res, DeployState::Idle, Result::Fail(Errc::InvalidArgument, "unknown device: " + device));
        return res;
    }
    if (!TrackedComponent(component)) {
        Fail(res, DeployState::Idle, Result::Fail(Errc::InvalidArgument, "unknown component: " + component));
        return res;
    }

    auto key_lock = locks_.Acquire(device, component);
    const std::string tag = device + "/" + component;

    // Checking
    std::optional<FirmwareRecord> rec;
    if (auto r = store_->Get(device, component, rec); !r.ok) {
        Fail(res, DeployState::Checking, r);
        return res;
    }
    if (rec) res.from_version = rec->version;

    ReleaseMetadata release;
    if (auto r = source_->LatestRelease(component, release); !r.ok) {
        if (r.Is(Errc::NotFound)) {
            res.state = DeployState::Idle;
            res.outcome = DeployOutcome::NoUpdateAvailable;
            res.result = r;
            LogInfo("[%s] no release published", tag.c_str());
        } else {
            Fail(res, DeployState::Checking, r);
            LogWarn("[%s] release source unavailable: %s", tag.c_str(), r.msg.c_str());
        }
        return res;
    }
    res.to_version = release.version;

    if (rec && VersionComparator::IsSame(rec->version, release.version)) {
        res.state = DeployState::Success;
        res.outcome = DeployOutcome::AlreadyCurrent;
        LogInfo("[%s] already at %s", tag.c_str(), release.version.c_str());
        return res;
    }

    ReleaseAsset payload;
    if (auto r = SelectPayloadAsset(release, payload); !r.ok) {
        res.state = DeployState::Idle;
        res.outcome = DeployOutcome::NoUpdateAvailable;
        res.result = r;
        LogWarn("[%s] %s", tag.c_str(), r.msg.c_str());
        return res;
    }

    if (dry_run) {
        res.state = DeployState::Success;
        res.outcome = DeployOutcome::WouldUpdate;
        LogInfo("[%s] dry run: %s -> %s", tag.c_str(), res.from_version.c_str(), res.to_version.c_str());
        return res;
    }

    std::atomic_bool cancel{false};
    {
        std::lock_guard<std::mutex> lk(active_mu_);
        active_[{device, component}] = &cancel;
    }
    auto unregister = [&] {
        std::lock_guard<std::mutex> lk(active_mu_);
        active_.erase({device, component});
    };

    // Downloading / Verifying / Installing
    InstallRequest req;
    req.asset = payload;
    req.target_dir = TargetDir(device, component);
    req.version = release.version;
    req.tag = tag;
    req.cancel = &cancel;

    auto r = ResolveExpectedChecksum(release, payload, &cancel, req.expected_sha256);
    if (!r.ok) {
        unregister();
        Fail(res, DeployState::Downloading, r);
        LogWarn("[%s] checksum asset unavailable: %s", tag.c_str(), r.msg.c_str());
        return res;
    }

    LogInfo("[%s] updating %s -> %s", tag.c_str(), res.from_version.c_str(), res.to_version.c_str());
    InstallOutcome outcome;
    r = installer_->Install(req, outcome);
    unregister();
    res.verification = outcome.verification;

    if (!r.ok) {
        Fail(res, StateOf(outcome.failed_in), r);
        if (r.Is(Errc::ChecksumMismatch) || r.Is(Errc::InstallFailed)) {
            RecordFailure(res);
        }
        LogError("[%s] update to %s failed (%s): %s",
                 tag.c_str(),
                 res.to_version.c_str(),
                 ToString(res.result.code),
                 res.result.msg.c_str());
        return res;
    }

    FirmwareRecord next;
    next.device = device;
    next.component = component;
    next.version = release.version;
    next.release_date = release.release_date.empty() ? UtcToday() : release.release_date;
    next.checksum = outcome.payload_sha256;
    next.status = FirmwareStatus::Current;
    next.download_url = payload.download_url;
    next.notes = release.notes;
    next.created_at = UtcNowIso8601();

    UpdateLogEntry entry;
    entry.device = device;
    entry.component = component;
    entry.from_version = res.from_version;
    entry.to_version = release.version;
    entry.status = LogStatus::Success;
    entry.applied_at = next.created_at;

    if (r = store_->RecordAttempt(next, entry); !r.ok) {
        Fail(res, DeployState::Installing, r);
        LogError("[%s] installed %s but could not record it: %s", tag.c_str(), release.version.c_str(), r.msg.c_str());
        return res;
    }

    res.state = DeployState::Success;
    res.outcome = DeployOutcome::Updated;
    res.logged = true;
    LogInfo("[%s] updated to %s", tag.c_str(), release.version.c_str());
    return res;
}

std::vector<DeployResult> UpdateOrchestrator::DeployAll(const std::optional<std::string>& device,
                                                        const std::optional<std::string>& component,
                                                        bool dry_run) {
    std::vector<Key> jobs;
    const std::vector<std::string> devices = device ? std::vector<std::string>{*device} : opt_.devices;
    const std::vector<std::string> components = component ? std::vector<std::string>{*component} : opt_.components;
    for (const auto& d : devices) {
        for (const auto& c : components) jobs.emplace_back(d, c);
    }

    std::vector<DeployResult> results(jobs.size());
    if (jobs.empty()) return results;

    WorkQueue<std::size_t> queue;
    for (std::size_t i = 0; i < jobs.size(); ++i) queue.Push(i);
    queue.Shutdown();

    const std::size_t n = std::min(opt_.workers, jobs.size());
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t w = 0; w < n; ++w) {
        workers.emplace_back([&] {
            while (auto idx = queue.Pop()) {
                results[*idx] = Deploy(jobs[*idx].first, jobs[*idx].second, dry_run);
            }
        });
    }
    for (auto& t : workers) t.join();
    return results;
}

Result UpdateOrchestrator::Verify(const std::string& device, const std::string& component, VerifyReport& out) {
    out = VerifyReport{};
    out.device = device;
    out.component = component;

    if (!KnownDevice(device)) return Result::Fail(Errc::InvalidArgument, "unknown device: " + device);
    if (!TrackedComponent(component)) return Result::Fail(Errc::InvalidArgument, "unknown component: " + component);

    std::optional<FirmwareRecord> rec;
    if (auto r = store_->Get(device, component, rec); !r.ok) return r;
    if (!rec) {
        out.status = VerifyStatus::Missing;
        out.detail = "no firmware record";
        return Result::Ok();
    }
    out.version = rec->version;

    const std::string target = TargetDir(device, component);
    InstallReceipt receipt;
    if (auto r = InstallReceipt::Load(InstallReceipt::PathFor(target), receipt); !r.ok) {
        if (r.Is(Errc::NotFound)) {
            out.status = VerifyStatus::Unverified;
            out.detail = "no install receipt";
        } else {
            out.status = VerifyStatus::Mismatch;
            out.detail = r.msg;
        }
        return Result::Ok();
    }

    if (!VersionComparator::IsSame(receipt.version, rec->version)) {
        out.status = VerifyStatus::Unverified;
        out.detail = "install receipt is for " + receipt.version + ", not " + rec->version;
        return Result::Ok();
    }
    if (!IntegrityVerifier::Verify(receipt.payload_sha256, rec->checksum)) {
        out.status = VerifyStatus::Mismatch;
        out.detail = "recorded checksum " + rec->checksum + " differs from installed payload " + receipt.payload_sha256;
        return Result::Ok();
    }

    std::string tree;
    if (auto r = verifier_.DigestTree(target, tree); !r.ok) {
        out.status = VerifyStatus::Mismatch;
        out.detail = r.msg;
        return Result::Ok();
    }
    if (!IntegrityVerifier::Verify(tree, receipt.tree_sha256)) {
        out.status = VerifyStatus::Mismatch;
        out.detail = "installed tree changed since " + receipt.installed_at;
        return Result::Ok();
    }

    out.status = VerifyStatus::Ok;
    return Result::Ok();
}

void UpdateOrchestrator::Cancel(const std::string& device, const std::string& component) {
    std::lock_guard<std::mutex> lk(active_mu_);
    auto it = active_.find({device, component});
    if (it != active_.end()) it->second->store(true);
}

} // namespace fwfleet
