// Repository: HoloHub-fleet
// Component: Heartbeat Emitter
// Purpose: Timer thread that reports health and playback state to the
//          control plane. Delivery failures are counted, never escalated.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_PLAYBACK_HEARTBEAT_EMITTER_HPP_
#define HOLOHUB_PLAYBACK_HEARTBEAT_EMITTER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "holohub/model/DeviceCommand.hpp"
#include "holohub/model/Heartbeat.hpp"
#include "holohub/playback/MetricsCollector.hpp"
#include "holohub/playback/PlaybackStateBoard.hpp"
#include "holohub/sync/IControlPlaneClient.hpp"
#include "holohub/timing/ITimeSource.hpp"
#include "holohub/timing/IWaitStrategy.hpp"

namespace holohub::playback {

struct HeartbeatEmitterConfig {
  std::chrono::milliseconds interval{std::chrono::seconds(30)};
  std::chrono::milliseconds timeout{std::chrono::seconds(10)};
  std::string firmware_version;
  std::string client_version;
};

class HeartbeatEmitter {
 public:
  using CommandHandler = std::function<void(const model::DeviceCommand&)>;

  HeartbeatEmitter(std::shared_ptr<sync::IControlPlaneClient> client,
                   std::shared_ptr<MetricsCollector> metrics,
                   std::shared_ptr<PlaybackStateBoard> board,
                   std::shared_ptr<timing::ITimeSource> clock,
                   std::shared_ptr<timing::IWaitStrategy> wait,
                   HeartbeatEmitterConfig config = {});
  ~HeartbeatEmitter();

  HeartbeatEmitter(const HeartbeatEmitter&) = delete;
  HeartbeatEmitter& operator=(const HeartbeatEmitter&) = delete;

  model::HeartbeatReport BuildReport();

  // Builds and submits one report. Returns true if the control plane
  // acknowledged it.
  bool EmitOnce();

  void Start();
  void Stop();

  // Commands carried by acknowledgements are passed here (on the
  // heartbeat thread).
  void SetCommandHandler(CommandHandler handler);

  int32_t MissedHeartbeats() const;
  std::string LastError() const;

  // Round trip of the last delivered heartbeat, reported on the next one.
  // Cleared by a failed delivery.
  std::optional<int32_t> LastLatencyMs() const;
  uint64_t Delivered() const { return delivered_.load(std::memory_order_relaxed); }

 private:
  void Run();

  std::shared_ptr<sync::IControlPlaneClient> client_;
  std::shared_ptr<MetricsCollector> metrics_;
  std::shared_ptr<PlaybackStateBoard> board_;
  std::shared_ptr<timing::ITimeSource> clock_;
  std::shared_ptr<timing::IWaitStrategy> wait_;
  HeartbeatEmitterConfig config_;

  mutable std::mutex mutex_;
  int32_t missed_ = 0;
  std::string last_error_;
  std::optional<int32_t> last_latency_ms_;
  CommandHandler on_command_;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<bool> stop_requested_{false};
  std::thread thread_;
};

}  // namespace holohub::playback

#endif  // HOLOHUB_PLAYBACK_HEARTBEAT_EMITTER_HPP_
