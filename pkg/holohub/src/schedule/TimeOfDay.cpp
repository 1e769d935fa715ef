// Repository: HoloHub-fleet
// Component: Time Of Day
// Copyright (c) 2025 HoloHub

#include "holohub/schedule/TimeOfDay.hpp"

#include <cctype>
#include <cstdio>

namespace holohub::schedule {

std::optional<TimeOfDay> TimeOfDay::Parse(const std::string& text) {
  const size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0 || colon > 2) return std::nullopt;
  if (text.size() != colon + 3) return std::nullopt;
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == colon) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
  }
  TimeOfDay t;
  t.hour = std::stoi(text.substr(0, colon));
  t.minute = std::stoi(text.substr(colon + 1));
  if (t.hour > 23 || t.minute > 59) return std::nullopt;
  return t;
}

std::string TimeOfDay::ToString() const {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
  return buf;
}

}  // namespace holohub::schedule
