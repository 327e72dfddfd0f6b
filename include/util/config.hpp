#pragma once

#include "fleet/fleet_seeder.hpp"
#include "release/release.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fwfleet::config {

inline constexpr const char* kDefaultConfigPath = "/etc/fwfleet/fwfleet.conf";

struct RegistryConfig {
    std::string api_base = "https://api.github.com";
    std::string token_env = "FWFLEET_TOKEN"; // environment variable holding the bearer token
    std::map<std::string, std::string> repos; // component -> "owner/repo"
};

class FleetConfig {
public:
    std::string database;     // default ~/.fwfleet/firmware.db
    std::string install_root; // default /var/lib/fwfleet
    std::vector<std::string> devices;
    std::vector<std::string> components;
    RegistryConfig registry;

    // Offline catalogue; replaces the HTTP registry when present.
    std::optional<std::map<std::string, ReleaseMetadata>> catalog;

    bool require_checksum = true;
    std::uint64_t download_timeout_seconds = 600;
    std::uint64_t workers = 2;
    std::optional<LogLevel> log_level;
    SeedVersions seed;

    FleetConfig() { Reset(); }

    // NotFound when |path| does not exist (defaults stay in place),
    // InvalidArgument for malformed content.
    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& text);

    void Reset();

    static std::string DefaultDatabasePath();
};

} // namespace fwfleet::config
