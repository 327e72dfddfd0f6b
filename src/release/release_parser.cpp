#include "release/release_parser.hpp"

#include "util/time_utils.hpp"

#include <nlohmann/json.hpp>

namespace fwfleet {

using json = nlohmann::json;

namespace {

std::string StringOr(const json& j, const char* key, const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::expected<std::vector<ReleaseAsset>, std::string> ParseAssets(const json& arr) {
    if (!arr.is_array()) {
        return std::unexpected("'assets' must be an array");
    }

    std::vector<ReleaseAsset> out;
    out.reserve(arr.size());
    for (const auto& item : arr) {
        if (!item.is_object()) {
            return std::unexpected("asset entry must be an object");
        }
        ReleaseAsset a;
        a.name = StringOr(item, "name");
        a.download_url = StringOr(item, "browser_download_url", StringOr(item, "url"));
        if (a.name.empty() || a.download_url.empty()) continue;
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace

std::expected<ReleaseMetadata, std::string> ReleaseParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        ReleaseMetadata m;
        m.tag = StringOr(j, "tag_name");
        if (m.tag.empty()) {
            return std::unexpected("release has no tag_name");
        }
        m.version = VersionFromTag(m.tag);
        m.release_date = DatePart(StringOr(j, "published_at", StringOr(j, "created_at")));
        m.notes = StringOr(j, "body", StringOr(j, "name"));
        m.html_url = StringOr(j, "html_url");

        if (j.contains("assets")) {
            auto assets = ParseAssets(j["assets"]);
            if (!assets) return std::unexpected(assets.error());
            m.assets = std::move(*assets);
        }
        return m;
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}

} // namespace fwfleet
