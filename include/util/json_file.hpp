#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace swi::json_file {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

// Return false when the key is absent; set `err` when it is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err);
bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err);

} // namespace swi::json_file
