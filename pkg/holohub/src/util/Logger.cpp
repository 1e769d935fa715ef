// Repository: HoloHub-fleet
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the device agent and the
//          control plane.
// Copyright (c) 2025 HoloHub

#include "holohub/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace holohub::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;
bool Logger::timestamps_ = true;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetTimestamps(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  timestamps_ = enabled;
}

bool Logger::DebugEnabled() {
  return std::getenv("HOLOHUB_DEBUG") != nullptr;
}

std::string Logger::Format(const char* level, const std::string& line, int64_t utc_ms) {
  const std::time_t secs = static_cast<std::time_t>(utc_ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char stamp[40];
  std::snprintf(stamp, sizeof(stamp), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<int>(utc_ms % 1000));
  return std::string(stamp) + " " + level + " " + line;
}

// Caller holds mutex_.
void Logger::Emit(std::ostream& out, const char* level, const std::string& line,
                  const std::function<void(const std::string&)>& sink) {
  if (sink) {
    sink(line);
  }
  if (timestamps_) {
    const int64_t now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
    out << Format(level, line, now_ms) << '\n';
  } else {
    out << line << '\n';
  }
  out.flush();
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, "INFO", line, info_sink_);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, "DEBUG", line, nullptr);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, "WARN", line, warn_sink_);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, "ERROR", line, error_sink_);
}

}  // namespace holohub::util
