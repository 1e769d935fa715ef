// Repository: HoloHub-fleet
// Component: Device Agent
// Copyright (c) 2025 HoloHub

#include "holohub/agent/DeviceAgent.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "holohub/util/Logger.hpp"

namespace holohub::agent {

using util::Logger;

const char* AgentErrorToString(AgentError e) {
  switch (e) {
    case AgentError::kNone: return "NONE";
    case AgentError::kAlreadyStarted: return "ALREADY_STARTED";
    case AgentError::kAuthFailure: return "AUTH_FAILURE";
    case AgentError::kBackendUnavailable: return "BACKEND_UNAVAILABLE";
    case AgentError::kBackendInitFailed: return "BACKEND_INIT_FAILED";
    case AgentError::kCacheUnavailable: return "CACHE_UNAVAILABLE";
  }
  return "UNKNOWN";
}

DeviceAgent::DeviceAgent(config::DeviceConfig config, AgentDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {
  if (!deps_.client || !deps_.content_source) {
    throw std::invalid_argument("DeviceAgent requires a control plane client and content source");
  }
  if (!deps_.clock) deps_.clock = std::make_shared<timing::SystemTimeSource>();
  if (!deps_.metrics) {
    playback::MetricsSources sources;
    sources.storage_path = config_.content_cache_dir;
    deps_.metrics = std::make_shared<playback::MetricsCollector>(sources);
  }
  if (!deps_.backends) deps_.backends = std::make_shared<display::DisplayBackendRegistry>();
  slot_ = std::make_shared<sync::PlaylistSlot>();
  board_ = std::make_shared<playback::PlaybackStateBoard>();
}

DeviceAgent::~DeviceAgent() { Stop(); }

std::string DeviceAgent::FatalReason() const {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  return fatal_reason_;
}

void DeviceAgent::MarkFatal(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (fatal_reason_.empty()) fatal_reason_ = reason;
  }
  fatal_.store(true, std::memory_order_release);
  Logger::Error("[DeviceAgent] Fatal: " + reason);
}

AgentStartResult DeviceAgent::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    return AgentStartResult::Failure(AgentError::kAlreadyStarted, "agent already started");
  }

  auto auth = deps_.client->Authenticate();
  if (!auth.ok()) {
    return AgentStartResult::Failure(
        AgentError::kAuthFailure,
        std::string(sync::ClientStatusToString(auth.status)) + ": " + auth.detail);
  }
  device_id_ = auth.value.device_id;
  Logger::Info("[DeviceAgent] Authenticated as device " + device_id_);

  content::ContentStoreConfig store_config;
  store_config.root_dir = config_.content_cache_dir;
  store_config.max_bytes = config_.MaxCacheBytes();
  try {
    store_ = std::make_shared<content::ContentStore>(store_config, deps_.content_source,
                                                     deps_.clock);
  } catch (const std::exception& e) {
    return AgentStartResult::Failure(AgentError::kCacheUnavailable, e.what());
  }

  const std::string backend_name =
      config_.simulation_mode ? std::string("simulation") : config_.display.backend;
  std::unique_ptr<display::IDisplayBackend> backend =
      deps_.backends->Create(backend_name, config_.display);
  if (!backend) {
    return AgentStartResult::Failure(AgentError::kBackendUnavailable,
                                     "no display backend named '" + backend_name + "'");
  }
  backend_ = std::move(backend);
  if (!backend_->Initialize()) {
    backend_.reset();
    return AgentStartResult::Failure(AgentError::kBackendInitFailed,
                                     "display backend '" + backend_name + "' failed to initialize");
  }
  backend_->SetBrightness(config_.display.brightness);
  backend_shut_down_ = false;

  sync::PlaylistSyncConfig sync_config;
  sync_config.poll_interval = std::chrono::seconds(config_.sync_interval_sec);
  sync_ = std::make_unique<sync::PlaylistSync>(deps_.client, store_, slot_,
                                               std::make_shared<timing::RealtimeWaitStrategy>(),
                                               sync_config);
  sync_->SetFatalCallback([this](const std::string& why) { MarkFatal(why); });

  playback_ = std::make_unique<playback::PlaybackLoop>(
      slot_, store_, backend_, board_, std::make_shared<timing::RealtimeWaitStrategy>(),
      deps_.clock);

  playback::HeartbeatEmitterConfig hb_config;
  hb_config.interval = std::chrono::seconds(config_.heartbeat_interval_sec);
  hb_config.timeout = std::chrono::seconds(config_.heartbeat_timeout_sec);
  hb_config.firmware_version = config_.firmware_version;
  hb_config.client_version = config_.client_version;
  heartbeat_ = std::make_unique<playback::HeartbeatEmitter>(
      deps_.client, deps_.metrics, board_, deps_.clock,
      std::make_shared<timing::RealtimeWaitStrategy>(), hb_config);
  heartbeat_->SetCommandHandler([this](const model::DeviceCommand& c) { HandleCommand(c); });

  // First pass inline so playback starts with whatever is already assigned.
  const sync::SyncReport first = sync_->SyncOnce(device_id_);
  {
    std::ostringstream oss;
    oss << "[DeviceAgent] Initial sync: " << sync::SyncOutcomeToString(first.outcome)
        << " fetches=" << first.fetches;
    Logger::Info(oss.str());
  }

  playback_->Start();
  heartbeat_->Start();
  sync_->Start(device_id_);

  started_ = true;
  running_.store(true, std::memory_order_release);
  Logger::Info(std::string("[DeviceAgent] Running (backend=") + backend_->Name() + ")");
  return AgentStartResult::Success();
}

void DeviceAgent::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (!started_) return;
  started_ = false;
  running_.store(false, std::memory_order_release);

  Logger::Info("[DeviceAgent] Stopping");
  if (sync_) sync_->Stop();
  if (store_) store_->DrainDownloads();
  if (heartbeat_) heartbeat_->Stop();
  if (playback_) playback_->Stop();
  if (store_ && !store_->FlushIndex()) {
    Logger::Warn("[DeviceAgent] Cache index flush failed on stop");
  }
  if (backend_ && !backend_shut_down_) {
    backend_->Shutdown();
    backend_shut_down_ = true;
  }
  Logger::Info("[DeviceAgent] Stopped");
}

void DeviceAgent::HandleCommand(const model::DeviceCommand& command) {
  std::ostringstream oss;
  oss << "[DeviceAgent] Command " << model::CommandTypeName(command.type)
      << " id=" << command.command_id;
  Logger::Info(oss.str());

  switch (command.type) {
    case model::CommandType::kPlay:
      if (playback_) playback_->SetRunState(playback::PlaybackLoop::RunState::kPlaying);
      break;
    case model::CommandType::kPause:
      if (playback_) playback_->SetRunState(playback::PlaybackLoop::RunState::kPaused);
      break;
    case model::CommandType::kStop:
      if (playback_) playback_->SetRunState(playback::PlaybackLoop::RunState::kStopped);
      break;
    case model::CommandType::kClearCache:
      if (store_) {
        const size_t removed = store_->PurgeUnpinned();
        Logger::Info("[DeviceAgent] clear_cache removed " + std::to_string(removed) +
                     " unpinned entries");
      }
      break;
    case model::CommandType::kReboot:
    case model::CommandType::kUpdateFirmware:
    case model::CommandType::kScreenshot:
      Logger::Warn(std::string("[DeviceAgent] Command ") +
                   model::CommandTypeName(command.type) + " not supported on this device");
      break;
  }
}

}  // namespace holohub::agent
