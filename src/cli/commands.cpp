#include "cli/commands.hpp"

#include "util/logger.hpp"

#include <cstdlib>
#include <getopt.h>

namespace fwfleet::cli {

namespace {

const char* Str(const std::optional<std::string>& s) { return s ? s->c_str() : "*"; }

Result CheckScope(const CommandArgs& args, const UpdateOrchestrator& orch) {
    if (args.device && !orch.KnownDevice(*args.device)) {
        return Result::Fail(Errc::InvalidArgument, "unknown device: " + *args.device);
    }
    if (args.component && !orch.TrackedComponent(*args.component)) {
        return Result::Fail(Errc::InvalidArgument, "unknown component: " + *args.component);
    }
    return Result::Ok();
}

int RunList(const CommandArgs& args, IFirmwareStateStore& store, std::FILE* out) {
    RecordFilter filter;
    filter.device = args.device;
    filter.component = args.component;
    filter.status = args.status;

    std::vector<FirmwareRecord> records;
    if (auto r = store.List(filter, records); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (records.empty()) {
        std::fprintf(out, "No firmware records found.\n");
        return 0;
    }

    std::fprintf(out, "%-20s  %-14s  %-24s  %-12s  %s\n", "Device", "Component", "Version", "Date", "Status");
    for (const auto& rec : records) {
        std::fprintf(out,
                     "%-20s  %-14s  %-24s  %-12s  %s\n",
                     rec.device.c_str(),
                     rec.component.c_str(),
                     rec.version.c_str(),
                     rec.release_date.c_str(),
                     ToString(rec.status));
    }
    return 0;
}

int RunCheck(const CommandArgs& args, UpdateOrchestrator& orch, std::FILE* out) {
    CheckReport report;
    if (auto r = orch.CheckUpdates(args.device, report); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    if (report.pending.empty() && report.unknown.empty()) {
        std::fprintf(out, "All devices are up-to-date.\n");
        return 0;
    }
    if (!report.pending.empty()) {
        std::fprintf(out, "%zu update(s) available:\n", report.pending.size());
        for (const auto& p : report.pending) {
            std::fprintf(out,
                         "  %-20s  %-14s  %-22s -> %s\n",
                         p.device.c_str(),
                         p.component.c_str(),
                         p.current.c_str(),
                         p.latest.c_str());
            if (!p.notes.empty()) std::fprintf(out, "    %s\n", p.notes.c_str());
        }
    }
    if (!report.unknown.empty()) {
        std::fprintf(out, "%zu pair(s) could not be checked:\n", report.unknown.size());
        for (const auto& u : report.unknown) {
            std::fprintf(out,
                         "  %-20s  %-14s  %-22s  [%s] %s\n",
                         u.device.c_str(),
                         u.component.c_str(),
                         u.current.c_str(),
                         ToString(u.reason.code),
                         u.reason.msg.c_str());
        }
    }
    return 0;
}

int RunUpdate(const CommandArgs& args, UpdateOrchestrator& orch, std::FILE* out) {
    if (auto r = CheckScope(args, orch); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    const auto results = orch.DeployAll(args.device, args.component, args.dry_run);

    int rc = 0;
    for (const auto& res : results) {
        std::fprintf(out,
                     "  %-20s  %-14s  %-22s -> %-22s  [%s]",
                     res.device.c_str(),
                     res.component.c_str(),
                     res.from_version.c_str(),
                     res.to_version.empty() ? "?" : res.to_version.c_str(),
                     ToString(res.outcome));
        if (res.outcome == DeployOutcome::Updated && res.verification == Verification::Skipped) {
            std::fprintf(out, " (unverified)");
        }
        if (!res.result.ok) {
            std::fprintf(out, " %s: %s", ToString(res.result.code), res.result.msg.c_str());
        }
        std::fprintf(out, "\n");

        // A registry outage is retried next cycle; everything else counts.
        if (res.state == DeployState::Failed && !res.result.Is(Errc::SourceUnavailable)) rc = 1;
    }
    if (args.dry_run) std::fprintf(out, "[dry-run] No changes applied.\n");
    return rc;
}

int RunVerify(const CommandArgs& args, UpdateOrchestrator& orch, std::FILE* out) {
    if (auto r = CheckScope(args, orch); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    const auto& opt = orch.options();
    const std::vector<std::string> devices = args.device ? std::vector<std::string>{*args.device} : opt.devices;
    const std::vector<std::string> components =
        args.component ? std::vector<std::string>{*args.component} : opt.components;

    bool all_ok = true;
    for (const auto& device : devices) {
        for (const auto& component : components) {
            VerifyReport report;
            if (auto r = orch.Verify(device, component, report); !r.ok) {
                LogError("%s/%s: %s", device.c_str(), component.c_str(), r.msg.c_str());
                return 1;
            }
            std::fprintf(out,
                         "  %-20s  %-14s  %-22s  [%s]",
                         device.c_str(),
                         component.c_str(),
                         report.version.empty() ? "-" : report.version.c_str(),
                         ToString(report.status));
            if (!report.detail.empty()) std::fprintf(out, " %s", report.detail.c_str());
            std::fprintf(out, "\n");

            if (report.status == VerifyStatus::Mismatch || report.status == VerifyStatus::Missing) all_ok = false;
        }
    }

    std::fprintf(out, all_ok ? "All checksums verified.\n" : "Some checksums failed.\n");
    return all_ok ? 0 : 1;
}

int RunLog(const CommandArgs& args, IFirmwareStateStore& store, std::FILE* out) {
    std::vector<UpdateLogEntry> entries;
    if (auto r = store.RecentLog(args.limit, entries); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (entries.empty()) {
        std::fprintf(out, "No update log entries found.\n");
        return 0;
    }
    for (const auto& e : entries) {
        std::fprintf(out,
                     "  %-20s  %-20s  %-14s  %-22s -> %-22s  [%s]\n",
                     e.applied_at.substr(0, 19).c_str(),
                     e.device.c_str(),
                     e.component.c_str(),
                     e.from_version.c_str(),
                     e.to_version.c_str(),
                     ToString(e.status));
    }
    return 0;
}

} // namespace

bool ParseCommand(std::string_view name, Command& out) {
    if (name == "list") {
        out = Command::List;
    } else if (name == "check") {
        out = Command::Check;
    } else if (name == "update") {
        out = Command::Update;
    } else if (name == "verify") {
        out = Command::Verify;
    } else if (name == "log") {
        out = Command::Log;
    } else {
        return false;
    }
    return true;
}

const char* ToString(Command cmd) {
    switch (cmd) {
        case Command::List:
            return "list";
        case Command::Check:
            return "check";
        case Command::Update:
            return "update";
        case Command::Verify:
            return "verify";
        case Command::Log:
            return "log";
    }
    return "unknown";
}

Result ParseCommandArgs(Command cmd, int argc, char** argv, CommandArgs& out) {
    out = CommandArgs{};

    enum : int { kDevice = 1000, kComponent, kStatus, kDryRun, kLimit };
    static option long_opts[] = {
        {"device", required_argument, nullptr, kDevice},
        {"component", required_argument, nullptr, kComponent},
        {"status", required_argument, nullptr, kStatus},
        {"dry-run", no_argument, nullptr, kDryRun},
        {"limit", required_argument, nullptr, kLimit},
        {nullptr, 0, nullptr, 0},
    };

    const auto reject = [cmd](const char* opt) {
        return Result::Fail(Errc::InvalidArgument, std::string(ToString(cmd)) + " does not take --" + opt);
    };

    optind = 0; // full rescan of the new argv
    opterr = 0;
    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "+", long_opts, &idx)) != -1) {
        switch (c) {
            case kDevice:
                if (cmd == Command::Log) return reject("device");
                out.device = optarg;
                break;

            case kComponent:
                if (cmd == Command::Log || cmd == Command::Check) return reject("component");
                out.component = optarg;
                break;

            case kStatus: {
                if (cmd != Command::List) return reject("status");
                FirmwareStatus s{};
                if (!ParseFirmwareStatus(optarg, s)) {
                    return Result::Fail(Errc::InvalidArgument, std::string("invalid --status: ") + optarg);
                }
                out.status = s;
                break;
            }

            case kDryRun:
                if (cmd != Command::Update) return reject("dry-run");
                out.dry_run = true;
                break;

            case kLimit: {
                if (cmd != Command::Log) return reject("limit");
                char* end = nullptr;
                const unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || optarg[0] == '-') {
                    return Result::Fail(Errc::InvalidArgument, std::string("invalid --limit: ") + optarg);
                }
                out.limit = static_cast<std::size_t>(v);
                break;
            }

            default:
                return Result::Fail(Errc::InvalidArgument,
                                    std::string("unrecognized option for ") + ToString(cmd) + ": " +
                                        (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }

    if (optind < argc) {
        return Result::Fail(Errc::InvalidArgument, std::string("unexpected argument: ") + argv[optind]);
    }
    return Result::Ok();
}

int RunCommand(Command cmd,
               const CommandArgs& args,
               IFirmwareStateStore& store,
               UpdateOrchestrator& orchestrator,
               std::FILE* out) {
    LogDebug("running %s (device=%s component=%s)", ToString(cmd), Str(args.device), Str(args.component));

    switch (cmd) {
        case Command::List:
            return RunList(args, store, out);
        case Command::Check:
            return RunCheck(args, orchestrator, out);
        case Command::Update:
            return RunUpdate(args, orchestrator, out);
        case Command::Verify:
            return RunVerify(args, orchestrator, out);
        case Command::Log:
            return RunLog(args, store, out);
    }
    return 2;
}

void PrintCommandUsage(std::FILE* out) {
    std::fprintf(out,
                 "Commands:\n"
                 "  list   [--device D] [--component C] [--status current|available|deprecated|pending]\n"
                 "  check  [--device D]\n"
                 "  update [--device D] [--component C] [--dry-run]\n"
                 "  verify [--device D] [--component C]\n"
                 "  log    [--limit N]            (default 20)\n");
}

} // namespace fwfleet::cli
