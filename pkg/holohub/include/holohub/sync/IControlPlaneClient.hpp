// Repository: HoloHub-fleet
// Component: Control Plane Client Interface
// Purpose: Device-side view of the control plane: authentication, heartbeat
//          submission and assignment fetch. The gRPC client implements it in
//          production; tests use FakeControlPlaneClient.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SYNC_ICONTROL_PLANE_CLIENT_HPP_
#define HOLOHUB_SYNC_ICONTROL_PLANE_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "holohub/model/DeviceCommand.hpp"
#include "holohub/model/Heartbeat.hpp"
#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::sync {

enum class ClientStatus {
  kOk = 0,
  kNotFound,         // no assignment / unknown device
  kNetworkTimeout,   // deadline exceeded or control plane unreachable
  kAuthFailure,      // token or credential rejected
  kProtocolError,    // malformed response
};

const char* ClientStatusToString(ClientStatus status);

template <typename T>
struct ClientResult {
  ClientStatus status = ClientStatus::kOk;
  std::string detail;
  T value{};

  bool ok() const { return status == ClientStatus::kOk; }

  static ClientResult Ok(T v) {
    ClientResult r;
    r.value = std::move(v);
    return r;
  }
  static ClientResult Fail(ClientStatus s, std::string why) {
    ClientResult r;
    r.status = s;
    r.detail = std::move(why);
    return r;
  }
};

struct AuthToken {
  std::string device_id;
  std::string token;
  int64_t expires_utc_ms = 0;
};

struct HeartbeatAck {
  std::vector<model::DeviceCommand> commands;
};

class IControlPlaneClient {
 public:
  virtual ~IControlPlaneClient() = default;

  // Exchanges the device credential for a bearer token and device id.
  virtual ClientResult<AuthToken> Authenticate() = 0;

  // Submits one report. Must return within deadline.
  virtual ClientResult<HeartbeatAck> SubmitHeartbeat(
      const model::HeartbeatReport& report, std::chrono::milliseconds deadline) = 0;

  // Current live assignment for device_id; value is nullopt if none.
  virtual ClientResult<std::optional<model::Playlist>> FetchAssignment(
      const std::string& device_id) = 0;
};

}  // namespace holohub::sync

#endif  // HOLOHUB_SYNC_ICONTROL_PLANE_CLIENT_HPP_
