// Repository: HoloHub-fleet
// Component: Time Of Day
// Purpose: Parsed "HH:MM" wall-clock value used by recurrence ranges.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SCHEDULE_TIME_OF_DAY_HPP_
#define HOLOHUB_SCHEDULE_TIME_OF_DAY_HPP_

#include <optional>
#include <string>

namespace holohub::schedule {

struct TimeOfDay {
  int hour = 0;
  int minute = 0;

  int MinutesSinceMidnight() const { return hour * 60 + minute; }

  // Accepts "H:MM" or "HH:MM", hour 0-23, minute 0-59.
  static std::optional<TimeOfDay> Parse(const std::string& text);

  std::string ToString() const;  // always "HH:MM"

  bool operator<(const TimeOfDay& o) const {
    return MinutesSinceMidnight() < o.MinutesSinceMidnight();
  }
  bool operator<=(const TimeOfDay& o) const { return !(o < *this); }
  bool operator==(const TimeOfDay& o) const {
    return hour == o.hour && minute == o.minute;
  }
};

}  // namespace holohub::schedule

#endif  // HOLOHUB_SCHEDULE_TIME_OF_DAY_HPP_
