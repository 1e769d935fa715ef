// Repository: HoloHub-fleet
// Component: Heartbeat Emitter
// Copyright (c) 2025 HoloHub

#include "holohub/playback/HeartbeatEmitter.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

#include "holohub/util/Logger.hpp"

namespace holohub::playback {

using util::Logger;

HeartbeatEmitter::HeartbeatEmitter(std::shared_ptr<sync::IControlPlaneClient> client,
                                   std::shared_ptr<MetricsCollector> metrics,
                                   std::shared_ptr<PlaybackStateBoard> board,
                                   std::shared_ptr<timing::ITimeSource> clock,
                                   std::shared_ptr<timing::IWaitStrategy> wait,
                                   HeartbeatEmitterConfig config)
    : client_(std::move(client)),
      metrics_(std::move(metrics)),
      board_(std::move(board)),
      clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()),
      wait_(wait ? std::move(wait) : std::make_shared<timing::RealtimeWaitStrategy>()),
      config_(std::move(config)) {}

HeartbeatEmitter::~HeartbeatEmitter() { Stop(); }

void HeartbeatEmitter::SetCommandHandler(CommandHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_command_ = std::move(handler);
}

int32_t HeartbeatEmitter::MissedHeartbeats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return missed_;
}

std::string HeartbeatEmitter::LastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::optional<int32_t> HeartbeatEmitter::LastLatencyMs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_latency_ms_;
}

model::HeartbeatReport HeartbeatEmitter::BuildReport() {
  model::HeartbeatReport report;
  report.time_utc_ms = clock_->NowUtcMs();

  if (metrics_) {
    const SystemMetrics m = metrics_->Collect();
    report.cpu_percent = m.cpu_percent;
    report.memory_percent = m.memory_percent;
    report.storage_used_gb = m.storage_used_gb;
    report.temperature_celsius = m.temperature_celsius;
  }

  if (board_) {
    const PlaybackState s = board_->Snapshot();
    report.playback_status = s.status;
    if (!s.playlist_id.empty()) report.current_playlist_id = s.playlist_id;
    if (!s.asset_id.empty()) {
      report.current_asset_id = s.asset_id;
      report.playback_position_sec =
          std::max<int64_t>(0, (report.time_utc_ms - s.item_started_utc_ms) / 1000);
    }
    report.error_count = s.error_count;
    if (!s.last_error.empty()) report.last_error = s.last_error;
  } else {
    report.playback_status = model::PlaybackStatus::kStopped;
  }

  if (!config_.firmware_version.empty()) report.firmware_version = config_.firmware_version;
  if (!config_.client_version.empty()) report.client_version = config_.client_version;

  std::lock_guard<std::mutex> lock(mutex_);
  report.latency_ms = last_latency_ms_;
  if (missed_ > 0) {
    report.missed_heartbeats = missed_;
    if (!last_error_.empty()) report.last_error = last_error_;
  }
  return report;
}

bool HeartbeatEmitter::EmitOnce() {
  const model::HeartbeatReport report = BuildReport();
  const int64_t sent_ms = clock_->NowUtcMs();
  auto result = client_->SubmitHeartbeat(report, config_.timeout);
  const int64_t round_trip_ms = std::max<int64_t>(0, clock_->NowUtcMs() - sent_ms);

  if (!result.ok()) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++missed_;
    last_latency_ms_.reset();
    last_error_ = std::string("heartbeat ") + sync::ClientStatusToString(result.status);
    if (!result.detail.empty()) last_error_ += ": " + result.detail;
    std::ostringstream oss;
    oss << "[HeartbeatEmitter] Missed heartbeat #" << missed_ << " (" << last_error_ << ")";
    Logger::Warn(oss.str());
    return false;
  }

  CommandHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (missed_ > 0) {
      Logger::Info("[HeartbeatEmitter] Delivered after " + std::to_string(missed_) +
                   " missed");
    }
    missed_ = 0;
    last_error_.clear();
    last_latency_ms_ = static_cast<int32_t>(
        std::min<int64_t>(round_trip_ms, std::numeric_limits<int32_t>::max()));
    handler = on_command_;
  }
  delivered_.fetch_add(1, std::memory_order_relaxed);
  Logger::Debug("[HeartbeatEmitter] Heartbeat delivered at " +
                std::to_string(report.time_utc_ms));

  for (const auto& cmd : result.value.commands) {
    Logger::Info(std::string("[HeartbeatEmitter] Command ") +
                 model::CommandTypeName(cmd.type) + " id=" + cmd.command_id);
    if (handler) handler(cmd);
  }
  return true;
}

void HeartbeatEmitter::Start() {
  if (thread_.joinable()) return;
  stop_requested_.store(false, std::memory_order_release);
  thread_ = std::thread(&HeartbeatEmitter::Run, this);
}

void HeartbeatEmitter::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  wait_->Wake();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void HeartbeatEmitter::Run() {
  Logger::Info("[HeartbeatEmitter] Interval " + std::to_string(config_.interval.count()) +
               "ms, timeout " + std::to_string(config_.timeout.count()) + "ms");
  while (!stop_requested_.load(std::memory_order_acquire)) {
    EmitOnce();
    if (stop_requested_.load(std::memory_order_acquire)) break;
    wait_->WaitFor(config_.interval);
  }
}

}  // namespace holohub::playback
