// Repository: HoloHub-fleet
// Component: Playback Cursor
// Copyright (c) 2025 HoloHub

#include "holohub/playback/PlaybackCursor.hpp"

#include <limits>
#include <numeric>
#include <utility>

namespace holohub::playback {

namespace {
constexpr size_t kNoItem = std::numeric_limits<size_t>::max();
}  // namespace

PlaybackCursor::PlaybackCursor(size_t item_count, bool shuffle, uint32_t seed)
    : order_(item_count), shuffle_(shuffle), rng_(seed) {
  std::iota(order_.begin(), order_.end(), 0);
  if (shuffle_) Reshuffle(kNoItem);
}

size_t PlaybackCursor::Advance() {
  if (order_.empty()) return 0;
  if (++position_ >= order_.size()) {
    const size_t last = order_.back();
    position_ = 0;
    ++cycle_;
    if (shuffle_) Reshuffle(last);
  }
  return Current();
}

void PlaybackCursor::Reshuffle(size_t avoid_first) {
  const size_t n = order_.size();
  // Fisher-Yates
  for (size_t i = n; i > 1; --i) {
    std::uniform_int_distribution<size_t> pick(0, i - 1);
    std::swap(order_[i - 1], order_[pick(rng_)]);
  }
  if (n > 1 && order_[0] == avoid_first) {
    std::uniform_int_distribution<size_t> pick(1, n - 1);
    std::swap(order_[0], order_[pick(rng_)]);
  }
}

}  // namespace holohub::playback
