// Repository: HoloHub-fleet
// Component: DeviceControlService gRPC Implementation
// Purpose: Thin adapter from holohub.device.v1 RPCs onto DeviceRegistry,
//          PlaylistCatalog, AssignmentService and the asset directory.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_RPC_DEVICE_CONTROL_SERVICE_HPP_
#define HOLOHUB_RPC_DEVICE_CONTROL_SERVICE_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <grpcpp/grpcpp.h>

#include "holohub/assignment/AssignmentService.hpp"
#include "holohub/assignment/AssignmentTypes.hpp"
#include "holohub/assignment/PlaylistCatalog.hpp"
#include "holohub/registry/DeviceRegistry.hpp"
#include "holohub/timing/ITimeSource.hpp"
#include "holohub_device_v1.grpc.pb.h"

namespace holohub::rpc {

grpc::Status ToGrpcStatus(registry::RegistryError error);
grpc::Status ToGrpcStatus(assignment::AssignmentError error, const std::string& detail);

struct DeviceControlServiceOptions {
  std::string asset_root;
  size_t chunk_bytes = 256 * 1024;
  int64_t token_ttl_ms = 24LL * 60 * 60 * 1000;
};

class DeviceControlServiceImpl final : public holohub::device::v1::DeviceControlService::Service {
 public:
  DeviceControlServiceImpl(std::shared_ptr<registry::DeviceRegistry> registry,
                           std::shared_ptr<assignment::AssignmentService> assignments,
                           std::shared_ptr<assignment::PlaylistCatalog> catalog,
                           std::shared_ptr<timing::ITimeSource> clock,
                           DeviceControlServiceOptions options);
  ~DeviceControlServiceImpl() override = default;

  DeviceControlServiceImpl(const DeviceControlServiceImpl&) = delete;
  DeviceControlServiceImpl& operator=(const DeviceControlServiceImpl&) = delete;

  grpc::Status Authenticate(grpc::ServerContext* context,
                            const holohub::device::v1::AuthenticateRequest* request,
                            holohub::device::v1::AuthenticateResponse* response) override;

  grpc::Status SubmitHeartbeat(grpc::ServerContext* context,
                               const holohub::device::v1::HeartbeatRequest* request,
                               holohub::device::v1::HeartbeatResponse* response) override;

  grpc::Status GetAssignment(grpc::ServerContext* context,
                             const holohub::device::v1::GetAssignmentRequest* request,
                             holohub::device::v1::GetAssignmentResponse* response) override;

  grpc::Status DownloadContent(grpc::ServerContext* context,
                               const holohub::device::v1::DownloadContentRequest* request,
                               grpc::ServerWriter<holohub::device::v1::ContentChunk>* writer) override;

  grpc::Status RegisterDevice(grpc::ServerContext* context,
                              const holohub::device::v1::RegisterDeviceRequest* request,
                              holohub::device::v1::RegisterDeviceResponse* response) override;

  grpc::Status SendCommand(grpc::ServerContext* context,
                           const holohub::device::v1::SendCommandRequest* request,
                           holohub::device::v1::SendCommandResponse* response) override;

  grpc::Status CreatePlaylist(grpc::ServerContext* context,
                              const holohub::device::v1::CreatePlaylistRequest* request,
                              holohub::device::v1::CreatePlaylistResponse* response) override;

  grpc::Status AssignPlaylist(grpc::ServerContext* context,
                              const holohub::device::v1::AssignPlaylistRequest* request,
                              holohub::device::v1::AssignPlaylistResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const holohub::device::v1::ApiVersionRequest* request,
                          holohub::device::v1::ApiVersion* response) override;

 private:
  struct TokenRecord {
    std::string device_id;
    int64_t expires_utc_ms = 0;
  };

  // Resolves the bearer token in the call metadata to a device id.
  std::optional<std::string> Authorize(const grpc::ServerContext* context);

  // Maps source_path under asset_root; nullopt when it escapes the root.
  std::optional<std::string> ResolveAssetPath(const std::string& source_path) const;

  std::shared_ptr<registry::DeviceRegistry> registry_;
  std::shared_ptr<assignment::AssignmentService> assignments_;
  std::shared_ptr<assignment::PlaylistCatalog> catalog_;
  std::shared_ptr<timing::ITimeSource> clock_;
  DeviceControlServiceOptions options_;

  std::mutex tokens_mutex_;
  std::unordered_map<std::string, TokenRecord> tokens_;  // token -> device
};

}  // namespace holohub::rpc

#endif  // HOLOHUB_RPC_DEVICE_CONTROL_SERVICE_HPP_
