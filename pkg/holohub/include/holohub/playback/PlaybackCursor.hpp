// Repository: HoloHub-fleet
// Component: Playback Cursor
// Purpose: Pure traversal over a playlist's items. Sequential order or a new
//          shuffled permutation per cycle; always wraps.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_PLAYBACK_PLAYBACK_CURSOR_HPP_
#define HOLOHUB_PLAYBACK_PLAYBACK_CURSOR_HPP_

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace holohub::playback {

class PlaybackCursor {
 public:
  PlaybackCursor() = default;
  PlaybackCursor(size_t item_count, bool shuffle, uint32_t seed);

  // Item index at the cursor. Undefined when Empty().
  size_t Current() const { return order_[position_]; }

  // Moves to the next item, starting a new cycle after the last one.
  // Returns the new current index.
  size_t Advance();

  bool Empty() const { return order_.empty(); }
  size_t Count() const { return order_.size(); }
  size_t Position() const { return position_; }
  uint64_t Cycle() const { return cycle_; }
  const std::vector<size_t>& Order() const { return order_; }

 private:
  // New permutation; when avoid_first is valid and count > 1 the
  // permutation does not start with it.
  void Reshuffle(size_t avoid_first);

  std::vector<size_t> order_;
  size_t position_ = 0;
  uint64_t cycle_ = 0;
  bool shuffle_ = false;
  std::mt19937 rng_;
};

}  // namespace holohub::playback

#endif  // HOLOHUB_PLAYBACK_PLAYBACK_CURSOR_HPP_
