// Repository: HoloHub-fleet
// Component: Device Configuration
// Purpose: Device agent settings. Defaults, then KEY=VALUE file, then
//          environment, then command-line overrides applied by main.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONFIG_DEVICE_CONFIG_HPP_
#define HOLOHUB_CONFIG_DEVICE_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "holohub/config/KeyValueConfig.hpp"
#include "holohub/display/DisplayConfig.hpp"

namespace holohub::config {

struct DeviceConfig {
  // Control plane
  std::string api_base_url = "localhost:50051";
  int api_timeout_sec = 30;

  // Credentials
  std::string hardware_id;
  std::string device_secret;
  std::string device_name = "HoloHub Display";

  // Timers
  int heartbeat_interval_sec = 30;
  int heartbeat_timeout_sec = 10;
  int sync_interval_sec = 60;

  // Content cache
  std::string content_cache_dir = "./cache/content";
  double max_cache_size_gb = 10.0;

  // Display
  display::DisplayConfig display;
  bool simulation_mode = true;

  std::string firmware_version = "1.0.0";
  std::string client_version = "1.0.0";

  bool production = false;

  int64_t MaxCacheBytes() const;

  // Problems that prevent startup; empty when valid.
  std::vector<std::string> Validate() const;

  static const std::vector<std::string>& Keys();
};

// Applies recognized keys onto config. DISPLAY_TYPE is applied first so
// explicit geometry keys override its preset. Parse errors go to *problems.
void ApplyDeviceKeys(const KeyValues& values, DeviceConfig& config,
                     std::vector<std::string>* problems);

// Defaults <- file (if path non-empty) <- environment.
DeviceConfig LoadDeviceConfig(const std::string& file_path, const EnvLookup& env,
                              std::vector<std::string>* problems);

}  // namespace holohub::config

#endif  // HOLOHUB_CONFIG_DEVICE_CONFIG_HPP_
