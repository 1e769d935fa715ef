// Repository: HoloHub-fleet
// Component: Schedule Evaluator
// Copyright (c) 2025 HoloHub

#include "holohub/schedule/ScheduleEvaluator.hpp"

#include <algorithm>

#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "holohub/schedule/TimeOfDay.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::schedule {

using util::Logger;

namespace {

int IsoWeekday(absl::Weekday wd) {
  switch (wd) {
    case absl::Weekday::monday:    return 1;
    case absl::Weekday::tuesday:   return 2;
    case absl::Weekday::wednesday: return 3;
    case absl::Weekday::thursday:  return 4;
    case absl::Weekday::friday:    return 5;
    case absl::Weekday::saturday:  return 6;
    case absl::Weekday::sunday:    return 7;
  }
  return 1;
}

int32_t PriorityOf(const AssignmentCandidate& c) {
  return c.schedule ? c.schedule->priority : 0;
}

}  // namespace

std::optional<LocalTime> ToLocalTime(const std::string& timezone, int64_t now_utc_ms) {
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(timezone, &tz)) return std::nullopt;
  const absl::CivilSecond local = absl::ToCivilSecond(absl::FromUnixMillis(now_utc_ms), tz);
  LocalTime out;
  out.iso_weekday = IsoWeekday(absl::GetWeekday(absl::CivilDay(local)));
  out.minute_of_day = local.hour() * 60 + local.minute();
  return out;
}

bool MatchesRecurrence(const model::Recurrence& recurrence, const std::string& timezone,
                       int64_t now_utc_ms) {
  auto local = ToLocalTime(timezone, now_utc_ms);
  if (!local) {
    Logger::Warn("[ScheduleEvaluator] Unknown time zone '" + timezone + "'; not live");
    return false;
  }

  if (!recurrence.days_of_week.empty() &&
      std::find(recurrence.days_of_week.begin(), recurrence.days_of_week.end(),
                local->iso_weekday) == recurrence.days_of_week.end()) {
    return false;
  }

  if (recurrence.time_ranges.empty()) return true;
  for (const auto& range : recurrence.time_ranges) {
    auto start = TimeOfDay::Parse(range.start);
    auto end = TimeOfDay::Parse(range.end);
    if (!start || !end) continue;
    if (start->MinutesSinceMidnight() <= local->minute_of_day &&
        local->minute_of_day <= end->MinutesSinceMidnight()) {
      return true;
    }
  }
  return false;
}

bool IsLive(bool is_active, const std::optional<model::Schedule>& schedule,
            int64_t now_utc_ms) {
  if (!is_active) return false;
  if (!schedule) return true;
  if (schedule->start_utc_ms && *schedule->start_utc_ms > now_utc_ms) return false;
  if (schedule->end_utc_ms && *schedule->end_utc_ms < now_utc_ms) return false;
  if (schedule->recurrence) {
    return MatchesRecurrence(*schedule->recurrence, schedule->timezone, now_utc_ms);
  }
  return true;
}

std::vector<std::string> ValidateSchedule(const model::Schedule& schedule) {
  std::vector<std::string> problems;
  if (schedule.start_utc_ms && schedule.end_utc_ms &&
      *schedule.end_utc_ms < *schedule.start_utc_ms) {
    problems.push_back("end precedes start");
  }
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(schedule.timezone, &tz)) {
    problems.push_back("unknown time zone '" + schedule.timezone + "'");
  }
  if (schedule.recurrence) {
    for (int32_t day : schedule.recurrence->days_of_week) {
      if (day < 1 || day > 7) {
        problems.push_back("day_of_week " + std::to_string(day) + " outside 1..7");
      }
    }
    for (const auto& range : schedule.recurrence->time_ranges) {
      auto start = TimeOfDay::Parse(range.start);
      auto end = TimeOfDay::Parse(range.end);
      if (!start) problems.push_back("malformed range start '" + range.start + "'");
      if (!end) problems.push_back("malformed range end '" + range.end + "'");
      if (start && end && *end < *start) {
        problems.push_back("range " + range.start + "-" + range.end +
                           " wraps midnight and never matches");
      }
    }
  }
  return problems;
}

const std::optional<model::Schedule>& EffectiveSchedule(
    const std::optional<model::Schedule>& override_schedule,
    const model::Playlist& playlist) {
  return override_schedule ? override_schedule : playlist.schedule;
}

std::optional<size_t> SelectLiveAssignment(const std::vector<AssignmentCandidate>& candidates,
                                           int64_t now_utc_ms) {
  std::optional<size_t> best;
  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& c = candidates[i];
    if (!IsLive(c.is_active, c.schedule, now_utc_ms)) continue;
    if (!best) {
      best = i;
      continue;
    }
    const auto& b = candidates[*best];
    const int32_t pc = PriorityOf(c);
    const int32_t pb = PriorityOf(b);
    if (pc > pb || (pc == pb && c.assigned_utc_ms >= b.assigned_utc_ms)) {
      best = i;
    }
  }
  return best;
}

}  // namespace holohub::schedule
