// Repository: HoloHub-fleet
// Component: Playback State Board
// Purpose: What is on screen right now, written by the render thread and
//          read by the heartbeat thread. Its lock is never held across a
//          display call.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_PLAYBACK_PLAYBACK_STATE_BOARD_HPP_
#define HOLOHUB_PLAYBACK_PLAYBACK_STATE_BOARD_HPP_

#include <cstdint>
#include <mutex>
#include <string>

#include "holohub/model/Heartbeat.hpp"

namespace holohub::playback {

struct PlaybackState {
  model::PlaybackStatus status = model::PlaybackStatus::kStopped;
  std::string playlist_id;
  std::string asset_id;
  int32_t item_index = -1;
  int64_t item_started_utc_ms = 0;
  int32_t error_count = 0;
  std::string last_error;
};

class PlaybackStateBoard {
 public:
  // Replaces the on-screen fields; error counters are kept.
  void SetShowing(model::PlaybackStatus status, std::string playlist_id,
                  std::string asset_id, int32_t item_index, int64_t started_utc_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.status = status;
    state_.playlist_id = std::move(playlist_id);
    state_.asset_id = std::move(asset_id);
    state_.item_index = item_index;
    state_.item_started_utc_ms = started_utc_ms;
  }

  void SetIdle(model::PlaybackStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.status = status;
    state_.asset_id.clear();
    state_.item_index = -1;
    if (status == model::PlaybackStatus::kStopped) state_.playlist_id.clear();
  }

  void RecordError(std::string what) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++state_.error_count;
    state_.last_error = std::move(what);
  }

  PlaybackState Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

 private:
  mutable std::mutex mutex_;
  PlaybackState state_;
};

}  // namespace holohub::playback

#endif  // HOLOHUB_PLAYBACK_PLAYBACK_STATE_BOARD_HPP_
