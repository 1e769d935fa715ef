// Repository: HoloHub-fleet
// Component: Device Command
// Purpose: Fire-and-forget operator commands queued on the control plane and
//          delivered to the device with the heartbeat acknowledgement.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_MODEL_DEVICE_COMMAND_HPP_
#define HOLOHUB_MODEL_DEVICE_COMMAND_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace holohub::model {

enum class CommandType : int32_t {
  kPlay = 0,
  kPause = 1,
  kStop = 2,
  kReboot = 3,
  kClearCache = 4,
  kUpdateFirmware = 5,
  kScreenshot = 6,
};

// Wire names: play, pause, stop, reboot, clear_cache, update_firmware, screenshot.
const char* CommandTypeName(CommandType type);
std::optional<CommandType> CommandTypeFromString(const std::string& name);

struct DeviceCommand {
  std::string command_id;
  CommandType type = CommandType::kPlay;
  std::map<std::string, std::string> params;
  int64_t issued_utc_ms = 0;
};

}  // namespace holohub::model

#endif  // HOLOHUB_MODEL_DEVICE_COMMAND_HPP_
