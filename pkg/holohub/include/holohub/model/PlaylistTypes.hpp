// Repository: HoloHub-fleet
// Component: Playlist Model
// Purpose: Playlist, item, schedule and content descriptor types shared by
//          the control plane and the device agent.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_MODEL_PLAYLIST_TYPES_HPP_
#define HOLOHUB_MODEL_PLAYLIST_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace holohub::model {

// =============================================================================
// Transition Type
// Applied between items. Wire names: cut, fade, slide_left, slide_right, zoom.
// =============================================================================

enum class TransitionType : int32_t {
  kCut = 0,
  kFade = 1,
  kSlideLeft = 2,
  kSlideRight = 3,
  kZoom = 4,
};

const char* TransitionTypeName(TransitionType t);
std::optional<TransitionType> TransitionTypeFromString(const std::string& name);

// =============================================================================
// Schedule
// Wire format keeps "HH:MM" strings and ISO weekday ints (Monday=1..Sunday=7).
// =============================================================================

struct TimeRange {
  std::string start = "00:00";
  std::string end = "23:59";
};

struct Recurrence {
  std::vector<int32_t> days_of_week;  // empty = every day
  std::vector<TimeRange> time_ranges; // empty = all day
};

struct Schedule {
  std::optional<int64_t> start_utc_ms;
  std::optional<int64_t> end_utc_ms;
  std::string timezone = "UTC";       // IANA name
  std::optional<Recurrence> recurrence;
  int32_t priority = 0;               // higher wins on overlap
};

// =============================================================================
// Content Descriptor
// Resolved by the control plane so the device can fetch without a metadata
// round trip.
// =============================================================================

struct ContentDescriptor {
  std::string content_id;
  std::string source_path;            // remote object key
  int64_t declared_size = 0;          // bytes; 0 = unknown
  std::string mime_type = "model/glb";
  std::string expected_sha256;        // optional, lowercase hex
};

// =============================================================================
// Playlist
// =============================================================================

struct PlaylistItem {
  std::string id;
  std::string asset_id;
  int32_t position = 0;
  int32_t duration_seconds = 10;      // 0 = unset: show until playlist changes
  std::optional<TransitionType> transition_override;
  std::map<std::string, std::string> custom_settings;  // e.g. brightness=90
  ContentDescriptor content;
};

struct Playlist {
  std::string id;
  std::string name;
  std::string description;

  bool loop_mode = true;
  bool shuffle = false;
  TransitionType transition_type = TransitionType::kFade;
  int32_t transition_duration_ms = 500;

  bool is_active = true;
  std::optional<Schedule> schedule;

  std::vector<PlaylistItem> items;

  // Derived; maintained by RecomputeDerived().
  int32_t item_count = 0;
  int64_t total_duration_sec = 0;

  std::optional<int64_t> deleted_utc_ms;  // soft delete

  // Sorts items by position, renumbers positions densely from 0 and
  // recomputes item_count / total_duration_sec.
  void RecomputeDerived();

  bool IsDeleted() const { return deleted_utc_ms.has_value(); }
};

// Effective transition for an item (override wins over playlist default).
TransitionType EffectiveTransition(const Playlist& playlist, const PlaylistItem& item);

}  // namespace holohub::model

#endif  // HOLOHUB_MODEL_PLAYLIST_TYPES_HPP_
