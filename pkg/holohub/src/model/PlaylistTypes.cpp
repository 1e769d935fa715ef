// Repository: HoloHub-fleet
// Component: Playlist Model Implementation
// Copyright (c) 2025 HoloHub

#include "holohub/model/PlaylistTypes.hpp"

#include <algorithm>

namespace holohub::model {

const char* TransitionTypeName(TransitionType t) {
  switch (t) {
    case TransitionType::kCut:        return "cut";
    case TransitionType::kFade:       return "fade";
    case TransitionType::kSlideLeft:  return "slide_left";
    case TransitionType::kSlideRight: return "slide_right";
    case TransitionType::kZoom:       return "zoom";
  }
  return "unknown";
}

std::optional<TransitionType> TransitionTypeFromString(const std::string& name) {
  if (name == "cut") return TransitionType::kCut;
  if (name == "fade") return TransitionType::kFade;
  if (name == "slide_left") return TransitionType::kSlideLeft;
  if (name == "slide_right") return TransitionType::kSlideRight;
  if (name == "zoom") return TransitionType::kZoom;
  return std::nullopt;
}

void Playlist::RecomputeDerived() {
  std::stable_sort(items.begin(), items.end(),
                   [](const PlaylistItem& a, const PlaylistItem& b) {
                     return a.position < b.position;
                   });
  int64_t total = 0;
  for (size_t i = 0; i < items.size(); ++i) {
    items[i].position = static_cast<int32_t>(i);
    total += items[i].duration_seconds;
  }
  item_count = static_cast<int32_t>(items.size());
  total_duration_sec = total;
}

TransitionType EffectiveTransition(const Playlist& playlist, const PlaylistItem& item) {
  return item.transition_override.value_or(playlist.transition_type);
}

}  // namespace holohub::model
