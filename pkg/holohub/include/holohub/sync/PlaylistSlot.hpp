// Repository: HoloHub-fleet
// Component: Playlist Slot
// Purpose: Single-writer / multi-reader handoff of the active playlist from
//          the sync thread to the render thread. Readers get an immutable
//          snapshot that stays valid while they hold it.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SYNC_PLAYLIST_SLOT_HPP_
#define HOLOHUB_SYNC_PLAYLIST_SLOT_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::sync {

class PlaylistSlot {
 public:
  using Snapshot = std::shared_ptr<const model::Playlist>;

  Snapshot Load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
  }

  // Publishes a new snapshot (nullptr clears) and bumps the generation.
  // The publish listener runs after the swap, outside the lock.
  void Publish(Snapshot next) {
    std::function<void()> listener;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      current_ = std::move(next);
      ++generation_;
      listener = listener_;
    }
    if (listener) listener();
  }

  uint64_t Generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
  }

  // Used by the playback loop to wake its wait strategy.
  void SetPublishListener(std::function<void()> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
  }

 private:
  mutable std::mutex mutex_;
  Snapshot current_;
  uint64_t generation_ = 0;
  std::function<void()> listener_;
};

}  // namespace holohub::sync

#endif  // HOLOHUB_SYNC_PLAYLIST_SLOT_HPP_
