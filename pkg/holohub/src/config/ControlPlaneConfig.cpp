// Repository: HoloHub-fleet
// Component: Control Plane Configuration
// Copyright (c) 2025 HoloHub

#include "holohub/config/ControlPlaneConfig.hpp"

namespace holohub::config {

const std::vector<std::string>& ControlPlaneConfig::Keys() {
  static const std::vector<std::string> kKeys = {
      "LISTEN_ADDRESS",         "ASSET_ROOT",        "OFFLINE_FAILURE_THRESHOLD",
      "HEARTBEAT_INTERVAL",     "AUTO_DECOMMISSION_DAYS", "LIVENESS_SWEEP_INTERVAL",
      "DOWNLOAD_CHUNK_KIB",
  };
  return kKeys;
}

std::vector<std::string> ControlPlaneConfig::Validate() const {
  std::vector<std::string> problems;
  if (listen_address.empty()) problems.push_back("LISTEN_ADDRESS is empty");
  if (asset_root.empty()) problems.push_back("ASSET_ROOT is empty");
  if (offline_failure_threshold < 1) problems.push_back("OFFLINE_FAILURE_THRESHOLD must be >= 1");
  if (heartbeat_interval_sec <= 0) problems.push_back("HEARTBEAT_INTERVAL must be positive");
  if (auto_decommission_days < 0) problems.push_back("AUTO_DECOMMISSION_DAYS must be >= 0");
  if (liveness_sweep_interval_sec <= 0) {
    problems.push_back("LIVENESS_SWEEP_INTERVAL must be positive");
  }
  if (download_chunk_kib <= 0 || download_chunk_kib > 4096) {
    problems.push_back("DOWNLOAD_CHUNK_KIB must be within 1..4096");
  }
  return problems;
}

void ApplyControlPlaneKeys(const KeyValues& values, ControlPlaneConfig& config,
                           std::vector<std::string>* problems) {
  for (const auto& kv : values) {
    const std::string& key = kv.first;
    const std::string& v = kv.second;
    if (key == "LISTEN_ADDRESS") config.listen_address = v;
    else if (key == "ASSET_ROOT") config.asset_root = v;
    else if (key == "OFFLINE_FAILURE_THRESHOLD")
      ParseIntValue(key, v, &config.offline_failure_threshold, problems);
    else if (key == "HEARTBEAT_INTERVAL")
      ParseIntValue(key, v, &config.heartbeat_interval_sec, problems);
    else if (key == "AUTO_DECOMMISSION_DAYS")
      ParseIntValue(key, v, &config.auto_decommission_days, problems);
    else if (key == "LIVENESS_SWEEP_INTERVAL")
      ParseIntValue(key, v, &config.liveness_sweep_interval_sec, problems);
    else if (key == "DOWNLOAD_CHUNK_KIB")
      ParseIntValue(key, v, &config.download_chunk_kib, problems);
  }
}

ControlPlaneConfig LoadControlPlaneConfig(const std::string& file_path, const EnvLookup& env,
                                          std::vector<std::string>* problems) {
  KeyValues values;
  if (!file_path.empty()) values = ReadKeyValueFile(file_path, problems);
  OverlayEnvironment(values, ControlPlaneConfig::Keys(), env);

  ControlPlaneConfig config;
  ApplyControlPlaneKeys(values, config, problems);
  return config;
}

}  // namespace holohub::config
