// Repository: HoloHub-fleet
// Component: DeviceControlService gRPC Implementation
// Copyright (c) 2025 HoloHub

#include "rpc/DeviceControlService.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

#include "holohub/util/Crypto.hpp"
#include "holohub/util/Logger.hpp"
#include "rpc/ProtoConvert.hpp"

namespace holohub::rpc {

namespace fs = std::filesystem;
using util::Logger;

namespace {
constexpr char kApiVersion[] = "1.0.0";
constexpr char kBearerPrefix[] = "Bearer ";
constexpr size_t kTokenBytes = 32;
}  // namespace

grpc::Status ToGrpcStatus(registry::RegistryError error) {
  const std::string msg = registry::RegistryErrorToString(error);
  switch (error) {
    case registry::RegistryError::kNone:
      return grpc::Status::OK;
    case registry::RegistryError::kInvalidDeviceId:
    case registry::RegistryError::kInvalidHardwareId:
    case registry::RegistryError::kInvalidCredential:
    case registry::RegistryError::kInvalidName:
    case registry::RegistryError::kInvalidCommand:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, msg);
    case registry::RegistryError::kDeviceNotFound:
      return grpc::Status(grpc::StatusCode::NOT_FOUND, msg);
    case registry::RegistryError::kAuthFailure:
      return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, msg);
    case registry::RegistryError::kStaleHeartbeat:
    case registry::RegistryError::kIllegalTransition:
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, msg);
    case registry::RegistryError::kDeviceDecommissioned:
      return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, msg);
    case registry::RegistryError::kDuplicateHardwareId:
      return grpc::Status(grpc::StatusCode::ALREADY_EXISTS, msg);
  }
  return grpc::Status(grpc::StatusCode::UNAVAILABLE, msg);
}

grpc::Status ToGrpcStatus(assignment::AssignmentError error, const std::string& detail) {
  std::string msg = assignment::AssignmentErrorToString(error);
  if (!detail.empty()) msg += ": " + detail;
  switch (error) {
    case assignment::AssignmentError::kNone:
      return grpc::Status::OK;
    case assignment::AssignmentError::kInvalidDeviceId:
    case assignment::AssignmentError::kInvalidItem:
    case assignment::AssignmentError::kInvalidOrder:
    case assignment::AssignmentError::kInvalidSchedule:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, msg);
    case assignment::AssignmentError::kPlaylistNotFound:
    case assignment::AssignmentError::kPlaylistDeleted:
    case assignment::AssignmentError::kItemNotFound:
    case assignment::AssignmentError::kDeviceNotFound:
    case assignment::AssignmentError::kAssignmentNotFound:
      return grpc::Status(grpc::StatusCode::NOT_FOUND, msg);
    case assignment::AssignmentError::kDeviceDecommissioned:
      return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, msg);
  }
  return grpc::Status(grpc::StatusCode::UNAVAILABLE, msg);
}

DeviceControlServiceImpl::DeviceControlServiceImpl(
    std::shared_ptr<registry::DeviceRegistry> registry,
    std::shared_ptr<assignment::AssignmentService> assignments,
    std::shared_ptr<assignment::PlaylistCatalog> catalog,
    std::shared_ptr<timing::ITimeSource> clock,
    DeviceControlServiceOptions options)
    : registry_(std::move(registry)),
      assignments_(std::move(assignments)),
      catalog_(std::move(catalog)),
      clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()),
      options_(std::move(options)) {}

std::optional<std::string> DeviceControlServiceImpl::Authorize(
    const grpc::ServerContext* context) {
  const auto& metadata = context->client_metadata();
  auto it = metadata.find("authorization");
  if (it == metadata.end()) return std::nullopt;
  const std::string header(it->second.data(), it->second.size());
  const std::string prefix = kBearerPrefix;
  if (header.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  const std::string token = header.substr(prefix.size());

  std::lock_guard<std::mutex> lock(tokens_mutex_);
  auto t = tokens_.find(token);
  if (t == tokens_.end()) return std::nullopt;
  if (t->second.expires_utc_ms <= clock_->NowUtcMs()) {
    tokens_.erase(t);
    return std::nullopt;
  }
  return t->second.device_id;
}

std::optional<std::string> DeviceControlServiceImpl::ResolveAssetPath(
    const std::string& source_path) const {
  if (source_path.empty() || options_.asset_root.empty()) return std::nullopt;
  const fs::path rel(source_path);
  if (rel.is_absolute()) return std::nullopt;
  for (const auto& part : rel) {
    if (part == "..") return std::nullopt;
  }
  return (fs::path(options_.asset_root) / rel).string();
}

grpc::Status DeviceControlServiceImpl::Authenticate(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::AuthenticateRequest* request,
    holohub::device::v1::AuthenticateResponse* response) {
  auto verified = registry_->VerifyCredential(request->hardware_id(), request->device_secret());
  if (!verified.ok()) {
    Logger::Warn(std::string("[Authenticate] Rejected hardware_id=") + request->hardware_id() +
                 ": " + registry::RegistryErrorToString(verified.error));
    if (verified.error == registry::RegistryError::kDeviceNotFound ||
        verified.error == registry::RegistryError::kDeviceDecommissioned) {
      return grpc::Status(grpc::StatusCode::UNAUTHENTICATED,
                          registry::RegistryErrorToString(verified.error));
    }
    return ToGrpcStatus(verified.error);
  }

  const std::string token = util::RandomHexToken(kTokenBytes);
  if (token.empty()) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "token generation failed");
  }
  const int64_t expires = clock_->NowUtcMs() + options_.token_ttl_ms;
  {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    for (auto it = tokens_.begin(); it != tokens_.end();) {
      if (it->second.device_id == verified.value) {
        it = tokens_.erase(it);
      } else {
        ++it;
      }
    }
    tokens_[token] = TokenRecord{verified.value, expires};
  }

  response->set_device_id(verified.value);
  response->set_token(token);
  response->set_expires_utc_ms(expires);
  Logger::Info("[Authenticate] Device " + verified.value + " authenticated");
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::SubmitHeartbeat(
    grpc::ServerContext* context,
    const holohub::device::v1::HeartbeatRequest* request,
    holohub::device::v1::HeartbeatResponse* response) {
  auto device_id = Authorize(context);
  if (!device_id) return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid token");
  if (!request->device_id().empty() && request->device_id() != *device_id) {
    return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "token does not match device");
  }

  const registry::RegistryError err = registry_->IngestHeartbeat(*device_id, FromProto(*request));
  if (err != registry::RegistryError::kNone) {
    Logger::Warn("[SubmitHeartbeat] Device " + *device_id + ": " +
                 registry::RegistryErrorToString(err));
    return ToGrpcStatus(err);
  }

  for (const auto& command : registry_->DrainCommands(*device_id)) {
    *response->add_commands() = ToProto(command);
  }
  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[SubmitHeartbeat] Device " << *device_id << " ok, commands="
        << response->commands_size();
    Logger::Debug(oss.str());
  }
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::GetAssignment(
    grpc::ServerContext* context,
    const holohub::device::v1::GetAssignmentRequest* request,
    holohub::device::v1::GetAssignmentResponse* response) {
  auto device_id = Authorize(context);
  if (!device_id) return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid token");
  if (!request->device_id().empty() && request->device_id() != *device_id) {
    return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "token does not match device");
  }

  auto result = assignments_->GetAssignedPlaylist(*device_id, clock_->NowUtcMs());
  if (!result.ok()) return ToGrpcStatus(result.error, result.detail);
  if (!result.value) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "no live assignment");
  }
  *response->mutable_playlist() = ToProto(*result.value);
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::DownloadContent(
    grpc::ServerContext* context,
    const holohub::device::v1::DownloadContentRequest* request,
    grpc::ServerWriter<holohub::device::v1::ContentChunk>* writer) {
  auto device_id = Authorize(context);
  if (!device_id) return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid token");

  const std::string& key =
      request->source_path().empty() ? request->content_id() : request->source_path();
  auto path = ResolveAssetPath(key);
  if (!path) return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "invalid source path");

  std::error_code ec;
  const auto total = fs::file_size(*path, ec);
  if (ec) return grpc::Status(grpc::StatusCode::NOT_FOUND, "content not found: " + key);

  std::ifstream in(*path, std::ios::binary);
  if (!in) return grpc::Status(grpc::StatusCode::UNAVAILABLE, "cannot open " + key);

  std::vector<char> buf(options_.chunk_bytes);
  int64_t offset = 0;
  while (in) {
    if (context->IsCancelled()) {
      return grpc::Status(grpc::StatusCode::CANCELLED, "client cancelled");
    }
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize n = in.gcount();
    if (n <= 0) break;
    holohub::device::v1::ContentChunk chunk;
    chunk.set_data(buf.data(), static_cast<size_t>(n));
    chunk.set_offset(offset);
    chunk.set_total_size(static_cast<int64_t>(total));
    if (!writer->Write(chunk)) {
      return grpc::Status(grpc::StatusCode::CANCELLED, "stream closed");
    }
    offset += n;
  }
  if (in.bad()) return grpc::Status(grpc::StatusCode::UNAVAILABLE, "read failed: " + key);

  std::ostringstream oss;
  oss << "[DownloadContent] Device " << *device_id << " pulled " << key << " ("
      << offset << " bytes)";
  Logger::Info(oss.str());
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::RegisterDevice(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::RegisterDeviceRequest* request,
    holohub::device::v1::RegisterDeviceResponse* response) {
  auto result = registry_->Register(request->hardware_id(), request->device_secret(),
                                    request->name(), request->hardware_type());
  if (!result.ok()) return ToGrpcStatus(result.error);
  response->set_device_id(result.value);
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::SendCommand(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::SendCommandRequest* request,
    holohub::device::v1::SendCommandResponse* response) {
  std::map<std::string, std::string> params(request->params().begin(), request->params().end());
  auto result = registry_->SendCommand(request->device_id(), request->type(), params);
  if (!result.ok()) return ToGrpcStatus(result.error);
  response->set_command_id(result.value);
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::CreatePlaylist(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::CreatePlaylistRequest* request,
    holohub::device::v1::CreatePlaylistResponse* response) {
  if (!request->has_playlist()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "playlist required");
  }
  auto result = catalog_->Create(FromProto(request->playlist()));
  if (!result.ok()) return ToGrpcStatus(result.error, result.detail);
  response->set_playlist_id(result.value);
  Logger::Info("[CreatePlaylist] Created playlist " + result.value);
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::AssignPlaylist(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::AssignPlaylistRequest* request,
    holohub::device::v1::AssignPlaylistResponse* response) {
  std::optional<model::Schedule> override_schedule;
  if (request->has_schedule_override()) {
    override_schedule = FromProto(request->schedule_override());
  }
  std::optional<std::string> assigned_by;
  if (!request->assigned_by().empty()) assigned_by = request->assigned_by();

  auto result = assignments_->Assign(request->device_id(), request->playlist_id(),
                                     std::move(override_schedule), std::move(assigned_by));
  if (!result.ok()) return ToGrpcStatus(result.error, result.detail);
  response->set_assignment_id(result.value);
  Logger::Info("[AssignPlaylist] Playlist " + request->playlist_id() + " -> device " +
               request->device_id());
  return grpc::Status::OK;
}

grpc::Status DeviceControlServiceImpl::GetVersion(
    grpc::ServerContext* /*context*/,
    const holohub::device::v1::ApiVersionRequest* /*request*/,
    holohub::device::v1::ApiVersion* response) {
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace holohub::rpc
