// Repository: HoloHub-fleet
// Component: Proto conversion
// Purpose: Maps domain records to and from holohub.device.v1 messages.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_RPC_PROTO_CONVERT_HPP_
#define HOLOHUB_RPC_PROTO_CONVERT_HPP_

#include <optional>
#include <string>

#include "holohub/model/DeviceCommand.hpp"
#include "holohub/model/Heartbeat.hpp"
#include "holohub/model/PlaylistTypes.hpp"
#include "holohub_device_v1.pb.h"

namespace holohub::rpc {

namespace proto = holohub::device::v1;

proto::HeartbeatRequest ToProto(const model::HeartbeatReport& report);
model::HeartbeatReport FromProto(const proto::HeartbeatRequest& msg);

proto::DeviceCommand ToProto(const model::DeviceCommand& command);
// nullopt for unknown command types.
std::optional<model::DeviceCommand> FromProto(const proto::DeviceCommand& msg);

proto::Schedule ToProto(const model::Schedule& schedule);
model::Schedule FromProto(const proto::Schedule& msg);

proto::Playlist ToProto(const model::Playlist& playlist);
// Unknown transition names fall back to the default transition.
model::Playlist FromProto(const proto::Playlist& msg);

}  // namespace holohub::rpc

#endif  // HOLOHUB_RPC_PROTO_CONVERT_HPP_
