// Repository: HoloHub-fleet
// Component: Control Plane Configuration
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONFIG_CONTROL_PLANE_CONFIG_HPP_
#define HOLOHUB_CONFIG_CONTROL_PLANE_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "holohub/config/KeyValueConfig.hpp"

namespace holohub::config {

struct ControlPlaneConfig {
  std::string listen_address = "0.0.0.0:50051";
  std::string asset_root = "./assets";
  int offline_failure_threshold = 3;
  int heartbeat_interval_sec = 30;
  int auto_decommission_days = 30;       // 0 disables
  int liveness_sweep_interval_sec = 30;
  int download_chunk_kib = 256;

  int64_t AutoDecommissionMs() const {
    return static_cast<int64_t>(auto_decommission_days) * 24 * 60 * 60 * 1000;
  }

  std::vector<std::string> Validate() const;

  static const std::vector<std::string>& Keys();
};

void ApplyControlPlaneKeys(const KeyValues& values, ControlPlaneConfig& config,
                           std::vector<std::string>* problems);

ControlPlaneConfig LoadControlPlaneConfig(const std::string& file_path, const EnvLookup& env,
                                          std::vector<std::string>* problems);

}  // namespace holohub::config

#endif  // HOLOHUB_CONFIG_CONTROL_PLANE_CONFIG_HPP_
