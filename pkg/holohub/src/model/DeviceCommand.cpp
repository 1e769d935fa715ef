// Repository: HoloHub-fleet
// Component: Device Command
// Copyright (c) 2025 HoloHub

#include "holohub/model/DeviceCommand.hpp"

namespace holohub::model {

namespace {

constexpr CommandType kAllCommands[] = {
    CommandType::kPlay,   CommandType::kPause,      CommandType::kStop,
    CommandType::kReboot, CommandType::kClearCache, CommandType::kUpdateFirmware,
    CommandType::kScreenshot,
};

}  // namespace

const char* CommandTypeName(CommandType type) {
  switch (type) {
    case CommandType::kPlay:           return "play";
    case CommandType::kPause:          return "pause";
    case CommandType::kStop:           return "stop";
    case CommandType::kReboot:         return "reboot";
    case CommandType::kClearCache:     return "clear_cache";
    case CommandType::kUpdateFirmware: return "update_firmware";
    case CommandType::kScreenshot:     return "screenshot";
  }
  return "unknown";
}

std::optional<CommandType> CommandTypeFromString(const std::string& name) {
  for (CommandType t : kAllCommands) {
    if (name == CommandTypeName(t)) return t;
  }
  return std::nullopt;
}

}  // namespace holohub::model
