// Repository: HoloHub-fleet
// Component: Heartbeat Report
// Copyright (c) 2025 HoloHub

#include "holohub/model/Heartbeat.hpp"

namespace holohub::model {

const char* PlaybackStatusName(PlaybackStatus s) {
  switch (s) {
    case PlaybackStatus::kPlaying: return "playing";
    case PlaybackStatus::kPaused:  return "paused";
    case PlaybackStatus::kStopped: return "stopped";
    case PlaybackStatus::kError:   return "error";
  }
  return "unknown";
}

}  // namespace holohub::model
