// Repository: HoloHub-fleet
// Component: Schedule Evaluator
// Purpose: Pure functions deciding whether a playlist is live at a UTC
//          instant, and which of several live assignments wins.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SCHEDULE_SCHEDULE_EVALUATOR_HPP_
#define HOLOHUB_SCHEDULE_SCHEDULE_EVALUATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::schedule {

// Rules, in order:
//   inactive -> not live; no schedule -> live;
//   start in the future / end in the past -> not live;
//   recurrence: day-of-week (ISO) then inclusive time-of-day ranges in the
//   schedule's time zone. Unknown zones and malformed ranges never match.
bool IsLive(bool is_active, const std::optional<model::Schedule>& schedule,
            int64_t now_utc_ms);

inline bool IsLive(const model::Playlist& playlist, int64_t now_utc_ms) {
  return IsLive(playlist.is_active, playlist.schedule, now_utc_ms);
}

bool MatchesRecurrence(const model::Recurrence& recurrence, const std::string& timezone,
                       int64_t now_utc_ms);

// ISO weekday (Monday=1..Sunday=7) and local minute-of-day of an instant.
// nullopt if the zone cannot be loaded.
struct LocalTime {
  int iso_weekday = 1;
  int minute_of_day = 0;
};
std::optional<LocalTime> ToLocalTime(const std::string& timezone, int64_t now_utc_ms);

// Problems found in a schedule; empty when valid.
std::vector<std::string> ValidateSchedule(const model::Schedule& schedule);

// Per-device override wins over the playlist's own schedule.
const std::optional<model::Schedule>& EffectiveSchedule(
    const std::optional<model::Schedule>& override_schedule,
    const model::Playlist& playlist);

struct AssignmentCandidate {
  bool is_active = true;
  std::optional<model::Schedule> schedule;   // effective schedule
  int64_t assigned_utc_ms = 0;
};

// Index of the winning live candidate: highest priority, then most recent
// assigned_utc_ms, then latest in input order. nullopt if none is live.
std::optional<size_t> SelectLiveAssignment(const std::vector<AssignmentCandidate>& candidates,
                                           int64_t now_utc_ms);

}  // namespace holohub::schedule

#endif  // HOLOHUB_SCHEDULE_SCHEDULE_EVALUATOR_HPP_
