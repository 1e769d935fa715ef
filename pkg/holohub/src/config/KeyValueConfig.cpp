// Repository: HoloHub-fleet
// Component: Key/Value Config Source
// Copyright (c) 2025 HoloHub

#include "holohub/config/KeyValueConfig.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace holohub::config {

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

std::string Upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::string Lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Strips one pair of matching surrounding quotes.
std::string Unquote(const std::string& v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

}  // namespace

EnvLookup ProcessEnv() {
  return [](const std::string& key) -> std::optional<std::string> {
    const char* v = std::getenv(key.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
  };
}

KeyValues ParseKeyValueText(const std::string& text, std::vector<std::string>* problems) {
  KeyValues values;
  std::istringstream in(text);
  std::string raw;
  int line_no = 0;
  while (std::getline(in, raw)) {
    ++line_no;
    const std::string line = Trim(raw);
    if (line.empty() || line[0] == '#') continue;
    const size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      if (problems) problems->push_back("line " + std::to_string(line_no) + ": expected KEY=VALUE");
      continue;
    }
    values[Upper(Trim(line.substr(0, eq)))] = Unquote(Trim(line.substr(eq + 1)));
  }
  return values;
}

KeyValues ReadKeyValueFile(const std::string& path, std::vector<std::string>* problems) {
  std::ifstream in(path);
  if (!in) {
    if (problems) problems->push_back("cannot read config file " + path);
    return {};
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return ParseKeyValueText(buf.str(), problems);
}

void OverlayEnvironment(KeyValues& values, const std::vector<std::string>& keys,
                        const EnvLookup& env) {
  if (!env) return;
  for (const auto& key : keys) {
    if (auto v = env(key)) values[key] = *v;
  }
}

bool ParseIntValue(const std::string& key, const std::string& text, int* out,
                   std::vector<std::string>* problems) {
  errno = 0;
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (text.empty() || errno != 0 || *end != '\0' || v < INT32_MIN || v > INT32_MAX) {
    if (problems) problems->push_back(key + ": invalid integer '" + text + "'");
    return false;
  }
  *out = static_cast<int>(v);
  return true;
}

bool ParseDoubleValue(const std::string& key, const std::string& text, double* out,
                      std::vector<std::string>* problems) {
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (text.empty() || errno != 0 || *end != '\0') {
    if (problems) problems->push_back(key + ": invalid number '" + text + "'");
    return false;
  }
  *out = v;
  return true;
}

bool ParseBoolValue(const std::string& key, const std::string& text, bool* out,
                    std::vector<std::string>* problems) {
  const std::string v = Lower(text);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    *out = false;
    return true;
  }
  if (problems) problems->push_back(key + ": invalid boolean '" + text + "'");
  return false;
}

}  // namespace holohub::config
