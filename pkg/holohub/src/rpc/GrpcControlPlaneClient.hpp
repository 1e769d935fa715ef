// Repository: HoloHub-fleet
// Component: Device-side control plane gRPC client
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_RPC_GRPC_CONTROL_PLANE_CLIENT_HPP_
#define HOLOHUB_RPC_GRPC_CONTROL_PLANE_CLIENT_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "holohub/content/IContentSource.hpp"
#include "holohub/sync/IControlPlaneClient.hpp"
#include "holohub_device_v1.grpc.pb.h"

namespace holohub::rpc {

sync::ClientStatus FromGrpcStatus(const grpc::Status& status);

struct ControlPlaneClientOptions {
  std::string target_address;
  std::string hardware_id;
  std::string device_secret;
  std::chrono::milliseconds call_timeout{std::chrono::seconds(30)};
};

// Talks to DeviceControlService. Every call carries its own deadline.
// The bearer token from the last Authenticate() is attached to each call;
// a call made before authentication is rejected as kAuthFailure.
class GrpcControlPlaneClient : public sync::IControlPlaneClient,
                               public content::IContentSource {
 public:
  explicit GrpcControlPlaneClient(ControlPlaneClientOptions options);
  ~GrpcControlPlaneClient() override = default;

  GrpcControlPlaneClient(const GrpcControlPlaneClient&) = delete;
  GrpcControlPlaneClient& operator=(const GrpcControlPlaneClient&) = delete;

  sync::ClientResult<sync::AuthToken> Authenticate() override;

  sync::ClientResult<sync::HeartbeatAck> SubmitHeartbeat(
      const model::HeartbeatReport& report, std::chrono::milliseconds deadline) override;

  sync::ClientResult<std::optional<model::Playlist>> FetchAssignment(
      const std::string& device_id) override;

  content::ContentError Fetch(const model::ContentDescriptor& descriptor,
                              const content::ChunkSink& sink,
                              std::chrono::milliseconds deadline) override;

 private:
  // Sets deadline and authorization metadata. False if not authenticated.
  bool Prepare(grpc::ClientContext& context, std::chrono::milliseconds deadline,
               std::string* device_id);

  ControlPlaneClientOptions options_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<holohub::device::v1::DeviceControlService::Stub> stub_;

  std::mutex token_mutex_;
  std::string token_;
  std::string device_id_;
};

}  // namespace holohub::rpc

#endif  // HOLOHUB_RPC_GRPC_CONTROL_PLANE_CLIENT_HPP_
