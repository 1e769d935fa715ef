// Repository: HoloHub-fleet
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the device agent and the
//          control plane.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_UTIL_LOGGER_HPP_
#define HOLOHUB_UTIL_LOGGER_HPP_

#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>

namespace holohub::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Sync poller, render loop, heartbeat timer and gRPC handlers all
// log through here, so lines never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when HOLOHUB_DEBUG env is set
// Warn  → stderr (degraded but recoverable: skipped items, missed heartbeats)
// Error → stderr (integrity failures, fatal auth, faults)
//
// Test-only: SetErrorSink / SetWarnSink / SetInfoSink install a callback
// invoked for every line of that level (in addition to the stream).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Call with nullptr to clear. Sinks receive the bare line.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

  static bool DebugEnabled();

  // Stream lines are prefixed "<UTC ISO-8601> <LEVEL> " unless disabled.
  static void SetTimestamps(bool enabled);

  // "2025-01-01T00:00:00.000Z <level> <line>"
  static std::string Format(const char* level, const std::string& line, int64_t utc_ms);

 private:
  static void Emit(std::ostream& out, const char* level, const std::string& line,
                   const std::function<void(const std::string&)>& sink);

  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
  static bool timestamps_;
};

}  // namespace holohub::util

#endif  // HOLOHUB_UTIL_LOGGER_HPP_
