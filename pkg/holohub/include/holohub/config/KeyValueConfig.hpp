// Repository: HoloHub-fleet
// Component: Key/Value Config Source
// Purpose: Reads KEY=VALUE files ('#' comments, keys upper-cased) and
//          overlays environment variables of the same names.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONFIG_KEY_VALUE_CONFIG_HPP_
#define HOLOHUB_CONFIG_KEY_VALUE_CONFIG_HPP_

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace holohub::config {

using KeyValues = std::map<std::string, std::string>;

// Environment lookup; injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup ProcessEnv();

// Parses file content. Malformed lines are reported in *problems and skipped.
KeyValues ParseKeyValueText(const std::string& text, std::vector<std::string>* problems);

// Missing file is reported as a problem; returns empty map.
KeyValues ReadKeyValueFile(const std::string& path, std::vector<std::string>* problems);

// For every key in `keys` that env defines, overwrites values[key].
void OverlayEnvironment(KeyValues& values, const std::vector<std::string>& keys,
                        const EnvLookup& env);

// Typed parses; on failure append "KEY: ..." to *problems and return false.
bool ParseIntValue(const std::string& key, const std::string& text, int* out,
                   std::vector<std::string>* problems);
bool ParseDoubleValue(const std::string& key, const std::string& text, double* out,
                      std::vector<std::string>* problems);
bool ParseBoolValue(const std::string& key, const std::string& text, bool* out,
                    std::vector<std::string>* problems);

}  // namespace holohub::config

#endif  // HOLOHUB_CONFIG_KEY_VALUE_CONFIG_HPP_
