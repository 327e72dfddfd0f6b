#include "util/config.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <pwd.h>
#include <unistd.h>

namespace fwfleet::config {

namespace {

using nlohmann::json;

std::string HomeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) return pw->pw_dir;
    return ".";
}

bool FillRegistry(const json& j, RegistryConfig& reg, std::string& err) {
    if (!j.is_object()) {
        err = "Registry must be an object";
        return false;
    }
    detail::GetStringIfPresent(j, "ApiBase", reg.api_base);
    detail::GetStringIfPresent(j, "TokenEnv", reg.token_env);

    auto it = j.find("Repos");
    if (it == j.end()) return true;
    if (!it->is_object()) {
        err = "Registry.Repos must map component to owner/repo";
        return false;
    }
    for (const auto& [component, repo] : it->items()) {
        if (!repo.is_string() || repo.get<std::string>().find('/') == std::string::npos) {
            err = "Registry.Repos." + component + " must be \"owner/repo\"";
            return false;
        }
        reg.repos[component] = repo.get<std::string>();
    }
    return true;
}

bool FillCatalog(const json& j, std::map<std::string, ReleaseMetadata>& out, std::string& err) {
    if (!j.is_object()) {
        err = "Catalog must map component to release";
        return false;
    }
    for (const auto& [component, entry] : j.items()) {
        if (!entry.is_object()) {
            err = "Catalog." + component + " must be an object";
            return false;
        }
        ReleaseMetadata rel;
        if (!detail::GetStringIfPresent(entry, "version", rel.version) || rel.version.empty()) {
            err = "Catalog." + component + " has no version";
            return false;
        }
        rel.tag = rel.version;
        detail::GetStringIfPresent(entry, "release_date", rel.release_date);
        detail::GetStringIfPresent(entry, "notes", rel.notes);
        detail::GetStringIfPresent(entry, "url", rel.html_url);

        if (auto assets = entry.find("assets"); assets != entry.end()) {
            if (!assets->is_array()) {
                err = "Catalog." + component + ".assets must be an array";
                return false;
            }
            for (const auto& a : *assets) {
                ReleaseAsset asset;
                if (!a.is_object() || !detail::GetStringIfPresent(a, "name", asset.name) ||
                    !detail::GetStringIfPresent(a, "url", asset.download_url)) {
                    err = "Catalog." + component + ".assets entries need name and url";
                    return false;
                }
                rel.assets.push_back(std::move(asset));
            }
        }
        out[component] = std::move(rel);
    }
    return true;
}

bool FillSeed(const json& j, SeedVersions& out, std::string& err) {
    if (!j.is_object()) {
        err = "Seed must map device to {component: version}";
        return false;
    }
    for (const auto& [device, components] : j.items()) {
        if (!components.is_object()) {
            err = "Seed." + device + " must map component to version";
            return false;
        }
        for (const auto& [component, version] : components.items()) {
            if (!version.is_string()) {
                err = "Seed." + device + "." + component + " must be a string";
                return false;
            }
            out[device][component] = version.get<std::string>();
        }
    }
    return true;
}

bool FillConfigFromJson(const json& j, FleetConfig& cfg, std::string& err) {
    detail::GetStringIfPresent(j, "Database", cfg.database);
    detail::GetStringIfPresent(j, "InstallRoot", cfg.install_root);

    detail::GetStringListIfPresent(j, "Devices", cfg.devices, err);
    if (!err.empty()) return false;
    detail::GetStringListIfPresent(j, "Components", cfg.components, err);
    if (!err.empty()) return false;

    if (cfg.devices.empty()) {
        err = "Devices must not be empty";
        return false;
    }
    if (cfg.components.empty()) {
        err = "Components must not be empty";
        return false;
    }

    if (auto it = j.find("Registry"); it != j.end()) {
        if (!FillRegistry(*it, cfg.registry, err)) return false;
    }
    if (auto it = j.find("Catalog"); it != j.end()) {
        std::map<std::string, ReleaseMetadata> catalog;
        if (!FillCatalog(*it, catalog, err)) return false;
        cfg.catalog = std::move(catalog);
    }
    if (auto it = j.find("Seed"); it != j.end()) {
        if (!FillSeed(*it, cfg.seed, err)) return false;
    }

    detail::GetBoolIfPresent(j, "RequireChecksum", cfg.require_checksum);
    detail::GetU64IfPresent(j, "DownloadTimeoutSeconds", cfg.download_timeout_seconds);

    {
        std::uint64_t v{};
        if (detail::GetU64IfPresent(j, "Workers", v)) {
            if (v == 0) {
                err = "Workers must be at least 1";
                return false;
            }
            cfg.workers = v;
        }
    }
    {
        std::string level;
        if (detail::GetStringIfPresent(j, "LogLevel", level)) {
            LogLevel parsed{};
            if (!ParseLogLevel(level, parsed)) {
                err = "unknown LogLevel: " + level;
                return false;
            }
            cfg.log_level = parsed;
        }
    }

    return true;
}

} // namespace

std::string FleetConfig::DefaultDatabasePath() {
    return (std::filesystem::path(HomeDir()) / ".fwfleet" / "firmware.db").string();
}

void FleetConfig::Reset() {
    database = DefaultDatabasePath();
    install_root = "/var/lib/fwfleet";
    devices = {"aria64", "alice", "blackroad-pi"};
    components = {"os", "kernel", "bootloader"};
    registry = RegistryConfig{};
    catalog.reset();
    require_checksum = true;
    download_timeout_seconds = 600;
    workers = 2;
    log_level.reset();
    seed.clear();
}

Result FleetConfig::LoadString(const std::string& text) {
    Reset();

    json j;
    std::string err;
    if (!detail::ParseJsonObject(text, j, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err);
    }
    if (!FillConfigFromJson(j, *this, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err);
    }
    return Result::Ok();
}

Result FleetConfig::LoadFile(const std::string& path) {
    Reset();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result::Fail(Errc::NotFound, "config not found: " + path);
    }

    json j;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, j, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err);
    }
    if (!FillConfigFromJson(j, *this, err)) {
        return Result::Fail(Errc::InvalidArgument, "config: " + err + " in " + path);
    }
    return Result::Ok();
}

} // namespace fwfleet::config
