// Repository: HoloHub-fleet
// Component: Device Configuration
// Copyright (c) 2025 HoloHub

#include "holohub/config/DeviceConfig.hpp"

#include <cmath>

#include "holohub/registry/DeviceTypes.hpp"

namespace holohub::config {

const std::vector<std::string>& DeviceConfig::Keys() {
  static const std::vector<std::string> kKeys = {
      "API_BASE_URL",      "HOLOHUB_API_URL",  "API_TIMEOUT",       "DEVICE_HARDWARE_ID",
      "DEVICE_SECRET",     "DEVICE_NAME",      "HEARTBEAT_INTERVAL", "HEARTBEAT_TIMEOUT",
      "SYNC_INTERVAL",     "CONTENT_CACHE_DIR", "MAX_CACHE_SIZE_GB", "DISPLAY_TYPE",
      "DISPLAY_BACKEND",   "SIMULATION_MODE",  "DISPLAY_WIDTH",     "DISPLAY_HEIGHT",
      "QUILT_VIEWS",       "QUILT_DEPTH",      "BRIGHTNESS",        "FIRMWARE_VERSION",
      "CLIENT_VERSION",
  };
  return kKeys;
}

int64_t DeviceConfig::MaxCacheBytes() const {
  return static_cast<int64_t>(std::llround(max_cache_size_gb * 1024.0 * 1024.0 * 1024.0));
}

std::vector<std::string> DeviceConfig::Validate() const {
  std::vector<std::string> problems;
  if (hardware_id.empty()) {
    problems.push_back("DEVICE_HARDWARE_ID is required");
  } else if (!registry::NormalizeHardwareId(hardware_id)) {
    problems.push_back("DEVICE_HARDWARE_ID must be a MAC address or 64-char hex hash");
  }
  if (device_secret.empty()) {
    problems.push_back("DEVICE_SECRET is required");
  } else if (device_secret.size() < 16) {
    problems.push_back("DEVICE_SECRET must be at least 16 characters");
  }
  if (api_base_url.empty()) problems.push_back("API_BASE_URL is empty");
  if (api_timeout_sec <= 0) problems.push_back("API_TIMEOUT must be positive");
  if (heartbeat_interval_sec <= 0) problems.push_back("HEARTBEAT_INTERVAL must be positive");
  if (heartbeat_timeout_sec <= 0) problems.push_back("HEARTBEAT_TIMEOUT must be positive");
  if (sync_interval_sec <= 0) problems.push_back("SYNC_INTERVAL must be positive");
  if (content_cache_dir.empty()) problems.push_back("CONTENT_CACHE_DIR is empty");
  if (!(max_cache_size_gb > 0.0)) problems.push_back("MAX_CACHE_SIZE_GB must be positive");
  if (display.width <= 0 || display.height <= 0) {
    problems.push_back("DISPLAY_WIDTH/DISPLAY_HEIGHT must be positive");
  }
  if (display.brightness < 0 || display.brightness > 100) {
    problems.push_back("BRIGHTNESS must be within 0..100");
  }
  if (display.backend.empty()) problems.push_back("DISPLAY_BACKEND is empty");
  return problems;
}

void ApplyDeviceKeys(const KeyValues& values, DeviceConfig& config,
                     std::vector<std::string>* problems) {
  auto get = [&](const char* key) -> const std::string* {
    auto it = values.find(key);
    return it == values.end() ? nullptr : &it->second;
  };

  if (const std::string* v = get("DISPLAY_TYPE")) {
    config.display.display_type = *v;
    if (!config.display.ApplyPreset() && problems) {
      problems->push_back("DISPLAY_TYPE: unknown display type '" + *v + "'");
    }
  }

  if (const std::string* v = get("HOLOHUB_API_URL")) config.api_base_url = *v;
  if (const std::string* v = get("API_BASE_URL")) config.api_base_url = *v;
  if (const std::string* v = get("API_TIMEOUT"))
    ParseIntValue("API_TIMEOUT", *v, &config.api_timeout_sec, problems);
  if (const std::string* v = get("DEVICE_HARDWARE_ID")) config.hardware_id = *v;
  if (const std::string* v = get("DEVICE_SECRET")) config.device_secret = *v;
  if (const std::string* v = get("DEVICE_NAME")) config.device_name = *v;
  if (const std::string* v = get("HEARTBEAT_INTERVAL"))
    ParseIntValue("HEARTBEAT_INTERVAL", *v, &config.heartbeat_interval_sec, problems);
  if (const std::string* v = get("HEARTBEAT_TIMEOUT"))
    ParseIntValue("HEARTBEAT_TIMEOUT", *v, &config.heartbeat_timeout_sec, problems);
  if (const std::string* v = get("SYNC_INTERVAL"))
    ParseIntValue("SYNC_INTERVAL", *v, &config.sync_interval_sec, problems);
  if (const std::string* v = get("CONTENT_CACHE_DIR")) config.content_cache_dir = *v;
  if (const std::string* v = get("MAX_CACHE_SIZE_GB"))
    ParseDoubleValue("MAX_CACHE_SIZE_GB", *v, &config.max_cache_size_gb, problems);
  if (const std::string* v = get("DISPLAY_BACKEND")) config.display.backend = *v;
  if (const std::string* v = get("SIMULATION_MODE"))
    ParseBoolValue("SIMULATION_MODE", *v, &config.simulation_mode, problems);
  if (const std::string* v = get("DISPLAY_WIDTH"))
    ParseIntValue("DISPLAY_WIDTH", *v, &config.display.width, problems);
  if (const std::string* v = get("DISPLAY_HEIGHT"))
    ParseIntValue("DISPLAY_HEIGHT", *v, &config.display.height, problems);
  if (const std::string* v = get("QUILT_VIEWS"))
    ParseIntValue("QUILT_VIEWS", *v, &config.display.quilt_views, problems);
  if (const std::string* v = get("QUILT_DEPTH"))
    ParseIntValue("QUILT_DEPTH", *v, &config.display.quilt_depth, problems);
  if (const std::string* v = get("BRIGHTNESS"))
    ParseIntValue("BRIGHTNESS", *v, &config.display.brightness, problems);
  if (const std::string* v = get("FIRMWARE_VERSION")) config.firmware_version = *v;
  if (const std::string* v = get("CLIENT_VERSION")) config.client_version = *v;

  if (config.simulation_mode && !get("DISPLAY_BACKEND")) {
    config.display.backend = "simulation";
  }
}

DeviceConfig LoadDeviceConfig(const std::string& file_path, const EnvLookup& env,
                              std::vector<std::string>* problems) {
  KeyValues values;
  if (!file_path.empty()) values = ReadKeyValueFile(file_path, problems);
  OverlayEnvironment(values, DeviceConfig::Keys(), env);

  DeviceConfig config;
  ApplyDeviceKeys(values, config, problems);
  return config;
}

}  // namespace holohub::config
