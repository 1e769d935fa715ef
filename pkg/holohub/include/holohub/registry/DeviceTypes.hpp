// Repository: HoloHub-fleet
// Component: Device Types
// Purpose: Device entity, lifecycle status, transition table and registry
//          error taxonomy.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_REGISTRY_DEVICE_TYPES_HPP_
#define HOLOHUB_REGISTRY_DEVICE_TYPES_HPP_

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "holohub/model/DeviceCommand.hpp"
#include "holohub/model/Heartbeat.hpp"

namespace holohub::registry {

// =============================================================================
// Device Status
//
//   PENDING ──hb──► ACTIVE ◄──hb── OFFLINE
//                     │ ──N misses──► │
//   ACTIVE/OFFLINE ──admin──► MAINTENANCE ──admin──► ACTIVE
//   any non-terminal ──admin──► DECOMMISSIONED (terminal)
// =============================================================================

enum class DeviceStatus : int32_t {
  kPending = 0,
  kActive = 1,
  kOffline = 2,
  kMaintenance = 3,
  kDecommissioned = 4,
};

// Wire names: pending, active, offline, maintenance, decommissioned.
const char* DeviceStatusName(DeviceStatus s);
std::optional<DeviceStatus> DeviceStatusFromString(const std::string& name);

// The single transition table. Self-transitions are not legal.
bool IsLegalTransition(DeviceStatus from, DeviceStatus to);

// =============================================================================
// Errors
// =============================================================================

enum class RegistryError {
  kNone = 0,
  kInvalidDeviceId,       // not a canonical UUID
  kDeviceNotFound,
  kStaleHeartbeat,        // timestamp older than last accepted
  kDeviceDecommissioned,
  kDuplicateHardwareId,
  kInvalidHardwareId,
  kInvalidCredential,     // secret too short
  kInvalidName,
  kAuthFailure,
  kIllegalTransition,
  kInvalidCommand,
};

const char* RegistryErrorToString(RegistryError error);

template <typename T>
struct RegistryResult {
  RegistryError error = RegistryError::kNone;
  T value{};

  bool ok() const { return error == RegistryError::kNone; }

  static RegistryResult Ok(T v) {
    RegistryResult r;
    r.value = std::move(v);
    return r;
  }
  static RegistryResult Fail(RegistryError e) {
    RegistryResult r;
    r.error = e;
    return r;
  }
};

// =============================================================================
// Device
// =============================================================================

struct Device {
  std::string id;                  // UUID v4
  std::string hardware_id;         // normalized upper case, immutable
  std::string credential_hash;     // hex SHA-256 of the device secret
  std::string name;
  std::string hardware_type;

  DeviceStatus status = DeviceStatus::kPending;
  int64_t registered_utc_ms = 0;
  int64_t status_changed_utc_ms = 0;
  std::optional<int64_t> last_heartbeat_utc_ms;
  int32_t consecutive_failures = 0;
  std::optional<int64_t> decommissioned_utc_ms;

  // Assignment binding, maintained by AssignmentService.
  std::optional<std::string> assigned_playlist_id;

  // Last merged heartbeat values; absent fields keep what was stored.
  model::HeartbeatReport telemetry;

  std::deque<model::DeviceCommand> pending_commands;
};

// MAC (XX:XX:XX:XX:XX:XX) or 64-hex TPM hash, returned upper case.
std::optional<std::string> NormalizeHardwareId(const std::string& raw);

}  // namespace holohub::registry

#endif  // HOLOHUB_REGISTRY_DEVICE_TYPES_HPP_
