// Repository: HoloHub-fleet
// Component: Device Types
// Copyright (c) 2025 HoloHub

#include "holohub/registry/DeviceTypes.hpp"

#include <cctype>

namespace holohub::registry {

namespace {

constexpr DeviceStatus kAllStatuses[] = {
    DeviceStatus::kPending, DeviceStatus::kActive, DeviceStatus::kOffline,
    DeviceStatus::kMaintenance, DeviceStatus::kDecommissioned,
};

bool IsHex(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

}  // namespace

const char* DeviceStatusName(DeviceStatus s) {
  switch (s) {
    case DeviceStatus::kPending:        return "pending";
    case DeviceStatus::kActive:         return "active";
    case DeviceStatus::kOffline:        return "offline";
    case DeviceStatus::kMaintenance:    return "maintenance";
    case DeviceStatus::kDecommissioned: return "decommissioned";
  }
  return "unknown";
}

std::optional<DeviceStatus> DeviceStatusFromString(const std::string& name) {
  for (DeviceStatus s : kAllStatuses) {
    if (name == DeviceStatusName(s)) return s;
  }
  return std::nullopt;
}

bool IsLegalTransition(DeviceStatus from, DeviceStatus to) {
  using S = DeviceStatus;
  switch (from) {
    case S::kPending:
      return to == S::kActive || to == S::kDecommissioned;
    case S::kActive:
      return to == S::kOffline || to == S::kMaintenance || to == S::kDecommissioned;
    case S::kOffline:
      return to == S::kActive || to == S::kMaintenance || to == S::kDecommissioned;
    case S::kMaintenance:
      return to == S::kActive || to == S::kDecommissioned;
    case S::kDecommissioned:
      return false;
  }
  return false;
}

const char* RegistryErrorToString(RegistryError error) {
  switch (error) {
    case RegistryError::kNone:                 return "NONE";
    case RegistryError::kInvalidDeviceId:      return "INVALID_DEVICE_ID";
    case RegistryError::kDeviceNotFound:       return "DEVICE_NOT_FOUND";
    case RegistryError::kStaleHeartbeat:       return "STALE_HEARTBEAT";
    case RegistryError::kDeviceDecommissioned: return "DEVICE_DECOMMISSIONED";
    case RegistryError::kDuplicateHardwareId:  return "DUPLICATE_HARDWARE_ID";
    case RegistryError::kInvalidHardwareId:    return "INVALID_HARDWARE_ID";
    case RegistryError::kInvalidCredential:    return "INVALID_CREDENTIAL";
    case RegistryError::kInvalidName:          return "INVALID_NAME";
    case RegistryError::kAuthFailure:          return "AUTH_FAILURE";
    case RegistryError::kIllegalTransition:    return "ILLEGAL_TRANSITION";
    case RegistryError::kInvalidCommand:       return "INVALID_COMMAND";
  }
  return "UNKNOWN_ERROR";
}

std::optional<std::string> NormalizeHardwareId(const std::string& raw) {
  std::string upper;
  upper.reserve(raw.size());
  for (char c : raw) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  if (upper.size() == 17) {
    for (size_t i = 0; i < upper.size(); ++i) {
      const bool colon_slot = (i % 3) == 2;
      if (colon_slot ? upper[i] != ':' : !IsHex(upper[i])) return std::nullopt;
    }
    return upper;
  }
  if (upper.size() == 64) {
    for (char c : upper) {
      if (!IsHex(c)) return std::nullopt;
    }
    return upper;
  }
  return std::nullopt;
}

}  // namespace holohub::registry
