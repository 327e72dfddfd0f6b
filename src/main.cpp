#include "cli/commands.hpp"
#include "fleet/fleet_seeder.hpp"
#include "fleet/update_orchestrator.hpp"
#include "ota/progress_sinks.hpp"
#include "ota/streaming_installer.hpp"
#include "release/catalog_release_source.hpp"
#include "release/curl_asset_downloader.hpp"
#include "release/http_client.hpp"
#include "release/http_release_source.hpp"
#include "release/local_asset_downloader.hpp"
#include "release/routing_asset_downloader.hpp"
#include "store/sqlite_state_store.hpp"
#include "system/signals.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage:\n"
                 "   %s [-c <config>] [--db <path>] [--log-level <level>] <command> [options]\n"
                 "\n"
                 "Options:\n"
                 "  -c, --config           Config file (default %s)\n"
                 "      --db               SQLite state database (overrides Database)\n"
                 "      --log-level        debug|info|warn|error\n"
                 "  -h, --help             Show this help\n"
                 "\n",
                 argv0,
                 fwfleet::config::kDefaultConfigPath);
    fwfleet::cli::PrintCommandUsage(stderr);
}

std::shared_ptr<fwfleet::IReleaseSource> MakeReleaseSource(const fwfleet::config::FleetConfig& cfg,
                                                           std::shared_ptr<const fwfleet::HttpClient> http,
                                                           const std::string& token) {
    if (cfg.catalog) {
        return std::make_shared<fwfleet::CatalogReleaseSource>(*cfg.catalog);
    }
    fwfleet::HttpReleaseSource::Options opt;
    opt.api_base = cfg.registry.api_base;
    opt.repos = cfg.registry.repos;
    opt.bearer_token = token;
    return std::make_shared<fwfleet::HttpReleaseSource>(std::move(opt), std::move(http));
}

} // namespace

int main(int argc, char** argv) {
    fwfleet::InstallSignalHandlers();

    std::string config_path = fwfleet::config::kDefaultConfigPath;
    const char* db_cli = nullptr;
    const char* level_cli = nullptr;

    enum : int { kDb = 1000, kLogLevel };
    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"db", required_argument, nullptr, kDb},
        {"log-level", required_argument, nullptr, kLogLevel},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    // '+' stops at the subcommand; its options are parsed separately.
    while ((c = getopt_long(argc, argv, "+hc:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case kDb:
                db_cli = optarg;
                break;

            case kLogLevel:
                level_cli = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    fwfleet::cli::Command cmd{};
    if (!fwfleet::cli::ParseCommand(argv[optind], cmd)) {
        std::fprintf(stderr, "Unknown command: %s\n\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    fwfleet::cli::CommandArgs args;
    if (auto r = fwfleet::cli::ParseCommandArgs(cmd, argc - optind, argv + optind, args); !r.ok) {
        std::fprintf(stderr, "%s\n\n", r.msg.c_str());
        PrintUsage(argv[0]);
        return 2;
    }

    fwfleet::LogLevel level = fwfleet::LogLevel::Info;
    if (level_cli && !fwfleet::ParseLogLevel(level_cli, level)) {
        std::fprintf(stderr, "Invalid --log-level: %s\n", level_cli);
        return 2;
    }
    fwfleet::Logger::Instance().SetLevel(level);

    fwfleet::config::FleetConfig cfg;
    if (auto r = cfg.LoadFile(config_path); !r.ok) {
        if (!r.Is(fwfleet::Errc::NotFound)) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
        LogWarn("%s, using defaults", r.msg.c_str());
    }
    if (!level_cli && cfg.log_level) {
        fwfleet::Logger::Instance().SetLevel(*cfg.log_level);
    }
    if (db_cli) cfg.database = db_cli;

    std::unique_ptr<fwfleet::SqliteStateStore> sqlite;
    if (auto r = fwfleet::SqliteStateStore::Open(cfg.database, sqlite); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    std::shared_ptr<fwfleet::IFirmwareStateStore> store = std::move(sqlite);

    {
        const std::map<std::string, fwfleet::ReleaseMetadata> no_catalog;
        std::size_t seeded = 0;
        if (auto r = fwfleet::SeedFleet(*store, cfg.seed, cfg.catalog ? *cfg.catalog : no_catalog, seeded); !r.ok) {
            LogError("seeding failed: %s", r.msg.c_str());
            return 1;
        }
        if (seeded > 0) LogInfo("seeded %zu firmware record(s)", seeded);
    }

    std::string token;
    if (!cfg.registry.token_env.empty()) {
        if (const char* t = std::getenv(cfg.registry.token_env.c_str())) token = t;
    }

    auto http = std::make_shared<const fwfleet::HttpClient>();
    auto source = MakeReleaseSource(cfg, http, token);
    auto downloader = std::make_shared<fwfleet::RoutingAssetDownloader>(
        std::make_shared<fwfleet::CurlAssetDownloader>(http, token),
        std::make_shared<fwfleet::LocalAssetDownloader>());

    fwfleet::LogProgressSink progress;
    fwfleet::StreamingInstaller::Options iopt;
    iopt.require_checksum = cfg.require_checksum;
    iopt.download_timeout_seconds = static_cast<long>(cfg.download_timeout_seconds);
    iopt.progress_sink = &progress;
    auto installer = std::make_shared<fwfleet::StreamingInstaller>(downloader, iopt);

    fwfleet::UpdateOrchestrator::Options oopt;
    oopt.install_root = cfg.install_root;
    oopt.devices = cfg.devices;
    oopt.components = cfg.components;
    oopt.workers = static_cast<std::size_t>(cfg.workers);
    fwfleet::UpdateOrchestrator orchestrator(std::move(oopt), source, downloader, installer, store);

    return fwfleet::cli::RunCommand(cmd, args, *store, orchestrator, stdout);
}
