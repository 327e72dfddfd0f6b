#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace fwfleet::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);

// Return false when |key| is absent or has the wrong type; |out| is untouched then.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out);

// Array of strings; any non-string element is an error reported through |err|.
bool GetStringListIfPresent(const nlohmann::json& j,
                            const char* key,
                            std::vector<std::string>& out,
                            std::string& err);

} // namespace fwfleet::config::detail
