// Repository: HoloHub-fleet
// Component: Heartbeat Report
// Purpose: Structured liveness/health payload. Every metric is optional so
//          "not reported" is distinct from zero.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_MODEL_HEARTBEAT_HPP_
#define HOLOHUB_MODEL_HEARTBEAT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace holohub::model {

enum class PlaybackStatus : int32_t {
  kPlaying = 0,
  kPaused = 1,
  kStopped = 2,
  kError = 3,
};

const char* PlaybackStatusName(PlaybackStatus s);

struct HeartbeatReport {
  int64_t time_utc_ms = 0;
  PlaybackStatus playback_status = PlaybackStatus::kPlaying;

  // System health
  std::optional<double> cpu_percent;
  std::optional<double> memory_percent;
  std::optional<double> storage_used_gb;
  std::optional<int32_t> temperature_celsius;

  // Network
  std::optional<int32_t> bandwidth_mbps;
  std::optional<int32_t> latency_ms;
  std::optional<double> packet_loss_percent;

  // Playback state
  std::optional<std::string> current_playlist_id;
  std::optional<std::string> current_asset_id;
  std::optional<int64_t> playback_position_sec;

  // Versions
  std::optional<std::string> firmware_version;
  std::optional<std::string> client_version;

  // Errors since the previous delivered heartbeat
  std::optional<int32_t> error_count;
  std::optional<std::string> last_error;
  std::optional<int32_t> missed_heartbeats;
};

}  // namespace holohub::model

#endif  // HOLOHUB_MODEL_HEARTBEAT_HPP_
