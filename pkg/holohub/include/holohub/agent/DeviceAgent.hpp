// Repository: HoloHub-fleet
// Component: Device Agent
// Purpose: Wires content store, display backend, playlist sync, playback and
//          heartbeats into one device process and owns their lifecycle.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_AGENT_DEVICE_AGENT_HPP_
#define HOLOHUB_AGENT_DEVICE_AGENT_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "holohub/config/DeviceConfig.hpp"
#include "holohub/content/ContentStore.hpp"
#include "holohub/content/IContentSource.hpp"
#include "holohub/display/DisplayBackendRegistry.hpp"
#include "holohub/display/IDisplayBackend.hpp"
#include "holohub/model/DeviceCommand.hpp"
#include "holohub/playback/HeartbeatEmitter.hpp"
#include "holohub/playback/MetricsCollector.hpp"
#include "holohub/playback/PlaybackLoop.hpp"
#include "holohub/playback/PlaybackStateBoard.hpp"
#include "holohub/sync/IControlPlaneClient.hpp"
#include "holohub/sync/PlaylistSlot.hpp"
#include "holohub/sync/PlaylistSync.hpp"
#include "holohub/timing/ITimeSource.hpp"

namespace holohub::agent {

enum class AgentError {
  kNone = 0,
  kAlreadyStarted,
  kAuthFailure,
  kBackendUnavailable,
  kBackendInitFailed,
  kCacheUnavailable,
};

const char* AgentErrorToString(AgentError e);

struct AgentStartResult {
  bool success = false;
  AgentError error = AgentError::kNone;
  std::string detail;

  static AgentStartResult Success() {
    AgentStartResult r;
    r.success = true;
    return r;
  }
  static AgentStartResult Failure(AgentError e, std::string why) {
    AgentStartResult r;
    r.error = e;
    r.detail = std::move(why);
    return r;
  }
};

// Collaborators the agent does not build itself. Null members get defaults
// (system clock, /proc metrics, built-in backend registry).
struct AgentDependencies {
  std::shared_ptr<sync::IControlPlaneClient> client;
  std::shared_ptr<content::IContentSource> content_source;
  std::shared_ptr<timing::ITimeSource> clock;
  std::shared_ptr<playback::MetricsCollector> metrics;
  std::shared_ptr<display::DisplayBackendRegistry> backends;
};

class DeviceAgent {
 public:
  DeviceAgent(config::DeviceConfig config, AgentDependencies deps);
  ~DeviceAgent();

  DeviceAgent(const DeviceAgent&) = delete;
  DeviceAgent& operator=(const DeviceAgent&) = delete;

  // Authenticates, opens the cache, initializes the backend, runs a first
  // sync pass and starts the sync, playback and heartbeat threads.
  AgentStartResult Start();

  // Stops in order: sync polling, in-flight downloads, heartbeats, playback,
  // then the display backend. Safe to call more than once.
  void Stop();

  // Set once re-authentication has failed; the process should exit.
  bool FatalError() const { return fatal_.load(std::memory_order_acquire); }
  std::string FatalReason() const;

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  const std::string& DeviceId() const { return device_id_; }

  // Applies one operator command. Called on the heartbeat thread.
  void HandleCommand(const model::DeviceCommand& command);

  std::shared_ptr<content::ContentStore> Store() const { return store_; }
  std::shared_ptr<sync::PlaylistSlot> Slot() const { return slot_; }
  std::shared_ptr<playback::PlaybackStateBoard> Board() const { return board_; }
  std::shared_ptr<display::IDisplayBackend> Backend() const { return backend_; }
  playback::PlaybackLoop* Playback() const { return playback_.get(); }
  playback::HeartbeatEmitter* Heartbeats() const { return heartbeat_.get(); }
  sync::PlaylistSync* Sync() const { return sync_.get(); }

 private:
  void MarkFatal(const std::string& reason);

  config::DeviceConfig config_;
  AgentDependencies deps_;

  std::string device_id_;
  std::shared_ptr<content::ContentStore> store_;
  std::shared_ptr<display::IDisplayBackend> backend_;
  std::shared_ptr<sync::PlaylistSlot> slot_;
  std::shared_ptr<playback::PlaybackStateBoard> board_;
  std::unique_ptr<sync::PlaylistSync> sync_;
  std::unique_ptr<playback::PlaybackLoop> playback_;
  std::unique_ptr<playback::HeartbeatEmitter> heartbeat_;

  std::mutex lifecycle_mutex_;
  bool started_ = false;
  bool backend_shut_down_ = false;
  std::atomic<bool> running_{false};
  std::atomic<bool> fatal_{false};

  mutable std::mutex fatal_mutex_;
  std::string fatal_reason_;
};

}  // namespace holohub::agent

#endif  // HOLOHUB_AGENT_DEVICE_AGENT_HPP_
