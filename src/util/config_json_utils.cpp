#include "util/config_json_utils.hpp"

#include <fstream>

namespace fwfleet::config::detail {

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!(it->is_number_unsigned() || it->is_number_integer()))
        return false;
    auto v = it->get<long long>();
    if (v < 0)
        return false;
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_boolean())
        return false;
    out = it->get<bool>();
    return true;
}

bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::vector<std::string>& out,
                            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return false;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }

    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string() || v.get<std::string>().empty()) {
            err = std::string(key) + " must contain non-empty strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

} // namespace fwfleet::config::detail
