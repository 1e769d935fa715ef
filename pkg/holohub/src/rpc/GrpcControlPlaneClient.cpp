// Repository: HoloHub-fleet
// Component: Device-side control plane gRPC client
// Copyright (c) 2025 HoloHub

#include "rpc/GrpcControlPlaneClient.hpp"

#include "holohub/util/Logger.hpp"
#include "rpc/ProtoConvert.hpp"

namespace holohub::rpc {

using sync::ClientResult;
using sync::ClientStatus;
using util::Logger;

sync::ClientStatus FromGrpcStatus(const grpc::Status& status) {
  switch (status.error_code()) {
    case grpc::StatusCode::OK:
      return ClientStatus::kOk;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::CANCELLED:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return ClientStatus::kNetworkTimeout;
    case grpc::StatusCode::UNAUTHENTICATED:
    case grpc::StatusCode::PERMISSION_DENIED:
      return ClientStatus::kAuthFailure;
    case grpc::StatusCode::NOT_FOUND:
      return ClientStatus::kNotFound;
    default:
      return ClientStatus::kProtocolError;
  }
}

GrpcControlPlaneClient::GrpcControlPlaneClient(ControlPlaneClientOptions options)
    : options_(std::move(options)),
      grpc_channel_(grpc::CreateChannel(options_.target_address,
                                        grpc::InsecureChannelCredentials())),
      stub_(holohub::device::v1::DeviceControlService::NewStub(grpc_channel_)) {}

bool GrpcControlPlaneClient::Prepare(grpc::ClientContext& context,
                                     std::chrono::milliseconds deadline,
                                     std::string* device_id) {
  context.set_deadline(std::chrono::system_clock::now() + deadline);
  std::lock_guard<std::mutex> lock(token_mutex_);
  if (token_.empty()) return false;
  context.AddMetadata("authorization", "Bearer " + token_);
  if (device_id) *device_id = device_id_;
  return true;
}

ClientResult<sync::AuthToken> GrpcControlPlaneClient::Authenticate() {
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.call_timeout);

  holohub::device::v1::AuthenticateRequest request;
  request.set_hardware_id(options_.hardware_id);
  request.set_device_secret(options_.device_secret);
  holohub::device::v1::AuthenticateResponse response;

  const grpc::Status status = stub_->Authenticate(&context, request, &response);
  if (!status.ok()) {
    Logger::Warn("[ControlPlaneClient] Authenticate failed: " + status.error_message());
    return ClientResult<sync::AuthToken>::Fail(FromGrpcStatus(status), status.error_message());
  }
  if (response.token().empty() || response.device_id().empty()) {
    return ClientResult<sync::AuthToken>::Fail(ClientStatus::kProtocolError,
                                               "empty token in response");
  }

  {
    std::lock_guard<std::mutex> lock(token_mutex_);
    token_ = response.token();
    device_id_ = response.device_id();
  }
  sync::AuthToken token;
  token.device_id = response.device_id();
  token.token = response.token();
  token.expires_utc_ms = response.expires_utc_ms();
  return ClientResult<sync::AuthToken>::Ok(std::move(token));
}

ClientResult<sync::HeartbeatAck> GrpcControlPlaneClient::SubmitHeartbeat(
    const model::HeartbeatReport& report, std::chrono::milliseconds deadline) {
  grpc::ClientContext context;
  std::string device_id;
  if (!Prepare(context, deadline, &device_id)) {
    return ClientResult<sync::HeartbeatAck>::Fail(ClientStatus::kAuthFailure, "not authenticated");
  }

  holohub::device::v1::HeartbeatRequest request = ToProto(report);
  request.set_device_id(device_id);
  holohub::device::v1::HeartbeatResponse response;

  const grpc::Status status = stub_->SubmitHeartbeat(&context, request, &response);
  if (!status.ok()) {
    return ClientResult<sync::HeartbeatAck>::Fail(FromGrpcStatus(status), status.error_message());
  }

  sync::HeartbeatAck ack;
  for (const auto& c : response.commands()) {
    auto command = FromProto(c);
    if (!command) {
      Logger::Warn("[ControlPlaneClient] Ignoring unknown command type '" + c.type() + "'");
      continue;
    }
    ack.commands.push_back(std::move(*command));
  }
  return ClientResult<sync::HeartbeatAck>::Ok(std::move(ack));
}

ClientResult<std::optional<model::Playlist>> GrpcControlPlaneClient::FetchAssignment(
    const std::string& device_id) {
  using Result = ClientResult<std::optional<model::Playlist>>;
  grpc::ClientContext context;
  if (!Prepare(context, options_.call_timeout, nullptr)) {
    return Result::Fail(ClientStatus::kAuthFailure, "not authenticated");
  }

  holohub::device::v1::GetAssignmentRequest request;
  request.set_device_id(device_id);
  holohub::device::v1::GetAssignmentResponse response;

  const grpc::Status status = stub_->GetAssignment(&context, request, &response);
  if (!status.ok()) return Result::Fail(FromGrpcStatus(status), status.error_message());
  if (!response.has_playlist()) return Result::Ok(std::nullopt);
  return Result::Ok(FromProto(response.playlist()));
}

content::ContentError GrpcControlPlaneClient::Fetch(const model::ContentDescriptor& descriptor,
                                                    const content::ChunkSink& sink,
                                                    std::chrono::milliseconds deadline) {
  grpc::ClientContext context;
  if (!Prepare(context, deadline, nullptr)) return content::ContentError::kAuthFailure;

  holohub::device::v1::DownloadContentRequest request;
  request.set_content_id(descriptor.content_id);
  request.set_source_path(descriptor.source_path);

  auto reader = stub_->DownloadContent(&context, request);
  holohub::device::v1::ContentChunk chunk;
  bool aborted = false;
  while (reader->Read(&chunk)) {
    const std::string& data = chunk.data();
    if (!sink(reinterpret_cast<const uint8_t*>(data.data()), data.size())) {
      aborted = true;
      context.TryCancel();
      break;
    }
  }
  const grpc::Status status = reader->Finish();
  if (aborted) return content::ContentError::kCancelled;
  if (status.ok()) return content::ContentError::kNone;

  switch (FromGrpcStatus(status)) {
    case ClientStatus::kNotFound: return content::ContentError::kNotFound;
    case ClientStatus::kAuthFailure: return content::ContentError::kAuthFailure;
    case ClientStatus::kNetworkTimeout: return content::ContentError::kNetworkTimeout;
    default:
      Logger::Warn("[ControlPlaneClient] Download of " + descriptor.content_id +
                   " failed: " + status.error_message());
      return content::ContentError::kNetworkTimeout;
  }
}

}  // namespace holohub::rpc
