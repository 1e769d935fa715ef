// Repository: HoloHub-fleet
// Component: Control Plane Client Interface
// Copyright (c) 2025 HoloHub

#include "holohub/sync/IControlPlaneClient.hpp"

namespace holohub::sync {

const char* ClientStatusToString(ClientStatus status) {
  switch (status) {
    case ClientStatus::kOk:             return "OK";
    case ClientStatus::kNotFound:       return "NOT_FOUND";
    case ClientStatus::kNetworkTimeout: return "NETWORK_TIMEOUT";
    case ClientStatus::kAuthFailure:    return "AUTH_FAILURE";
    case ClientStatus::kProtocolError:  return "PROTOCOL_ERROR";
  }
  return "UNKNOWN";
}

}  // namespace holohub::sync
