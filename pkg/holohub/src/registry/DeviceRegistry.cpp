// Repository: HoloHub-fleet
// Component: Device Registry
// Copyright (c) 2025 HoloHub

#include "holohub/registry/DeviceRegistry.hpp"

#include <sstream>

#include "holohub/util/Crypto.hpp"
#include "holohub/util/Logger.hpp"
#include "holohub/util/Uuid.hpp"

namespace holohub::registry {

using util::Logger;

namespace {

template <typename T>
void MergeIfPresent(std::optional<T>& into, const std::optional<T>& from) {
  if (from.has_value()) into = from;
}

void MergeTelemetry(model::HeartbeatReport& into, const model::HeartbeatReport& from) {
  into.time_utc_ms = from.time_utc_ms;
  into.playback_status = from.playback_status;
  MergeIfPresent(into.cpu_percent, from.cpu_percent);
  MergeIfPresent(into.memory_percent, from.memory_percent);
  MergeIfPresent(into.storage_used_gb, from.storage_used_gb);
  MergeIfPresent(into.temperature_celsius, from.temperature_celsius);
  MergeIfPresent(into.bandwidth_mbps, from.bandwidth_mbps);
  MergeIfPresent(into.latency_ms, from.latency_ms);
  MergeIfPresent(into.packet_loss_percent, from.packet_loss_percent);
  MergeIfPresent(into.current_playlist_id, from.current_playlist_id);
  MergeIfPresent(into.current_asset_id, from.current_asset_id);
  MergeIfPresent(into.playback_position_sec, from.playback_position_sec);
  MergeIfPresent(into.firmware_version, from.firmware_version);
  MergeIfPresent(into.client_version, from.client_version);
  MergeIfPresent(into.error_count, from.error_count);
  MergeIfPresent(into.last_error, from.last_error);
  MergeIfPresent(into.missed_heartbeats, from.missed_heartbeats);
}

}  // namespace

DeviceRegistry::DeviceRegistry(std::shared_ptr<timing::ITimeSource> clock,
                               RegistryConfig config)
    : clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()),
      config_(config) {
  if (config_.offline_failure_threshold < 1) config_.offline_failure_threshold = 1;
}

// =============================================================================
// Registration / credentials
// =============================================================================

RegistryResult<std::string> DeviceRegistry::Register(const std::string& hardware_id,
                                                     const std::string& secret,
                                                     const std::string& name,
                                                     const std::string& hardware_type) {
  auto normalized = NormalizeHardwareId(hardware_id);
  if (!normalized) return RegistryResult<std::string>::Fail(RegistryError::kInvalidHardwareId);
  if (secret.size() < config_.min_secret_length) {
    return RegistryResult<std::string>::Fail(RegistryError::kInvalidCredential);
  }
  if (name.empty() || name.size() > 255) {
    return RegistryResult<std::string>::Fail(RegistryError::kInvalidName);
  }

  auto slot = std::make_shared<Slot>();
  Device& d = slot->device;
  d.id = util::GenerateUuidV4();
  d.hardware_id = *normalized;
  d.credential_hash = util::Sha256::HexOf(secret);
  d.name = name;
  d.hardware_type = hardware_type;
  d.status = DeviceStatus::kPending;
  d.registered_utc_ms = clock_->NowUtcMs();
  d.status_changed_utc_ms = d.registered_utc_ms;

  {
    std::unique_lock<std::shared_mutex> lock(map_mutex_);
    if (by_hardware_id_.count(d.hardware_id) > 0) {
      return RegistryResult<std::string>::Fail(RegistryError::kDuplicateHardwareId);
    }
    by_hardware_id_[d.hardware_id] = d.id;
    devices_[d.id] = slot;
  }

  Logger::Info("[DeviceRegistry] Registered " + d.id + " hw=" + d.hardware_id +
               " type=" + d.hardware_type);
  return RegistryResult<std::string>::Ok(d.id);
}

RegistryResult<std::string> DeviceRegistry::VerifyCredential(const std::string& hardware_id,
                                                             const std::string& secret) const {
  auto normalized = NormalizeHardwareId(hardware_id);
  if (!normalized) return RegistryResult<std::string>::Fail(RegistryError::kAuthFailure);

  std::shared_ptr<Slot> slot;
  {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    auto id = by_hardware_id_.find(*normalized);
    if (id == by_hardware_id_.end()) {
      return RegistryResult<std::string>::Fail(RegistryError::kAuthFailure);
    }
    slot = devices_.at(id->second);
  }

  std::lock_guard<std::mutex> lock(slot->mutex);
  const Device& d = slot->device;
  if (d.status == DeviceStatus::kDecommissioned ||
      !util::ConstantTimeEquals(d.credential_hash, util::Sha256::HexOf(secret))) {
    Logger::Warn("[DeviceRegistry] Credential rejected for hw=" + *normalized);
    return RegistryResult<std::string>::Fail(RegistryError::kAuthFailure);
  }
  return RegistryResult<std::string>::Ok(d.id);
}

// =============================================================================
// Lookup / transitions
// =============================================================================

RegistryError DeviceRegistry::Lookup(const std::string& device_id,
                                     std::shared_ptr<Slot>* out) const {
  if (!util::IsCanonicalUuid(device_id)) return RegistryError::kInvalidDeviceId;
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return RegistryError::kDeviceNotFound;
  *out = it->second;
  return RegistryError::kNone;
}

bool DeviceRegistry::Transition(Device& device, DeviceStatus to, const char* cause) {
  const DeviceStatus from = device.status;
  if (!IsLegalTransition(from, to)) {
    illegal_transition_total_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn(std::string("[DeviceRegistry] Illegal transition ") + DeviceStatusName(from) +
                 " -> " + DeviceStatusName(to) + " for " + device.id + " (" + cause + ")");
    return false;
  }
  device.status = to;
  device.status_changed_utc_ms = clock_->NowUtcMs();
  if (to == DeviceStatus::kDecommissioned) {
    device.decommissioned_utc_ms = device.status_changed_utc_ms;
  }
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++transitions_[{from, to}];
  }
  Logger::Info(std::string("[DeviceRegistry] ") + device.id + " " + DeviceStatusName(from) +
               " -> " + DeviceStatusName(to) + " (" + cause + ")");
  return true;
}

// =============================================================================
// Heartbeats / liveness
// =============================================================================

RegistryError DeviceRegistry::IngestHeartbeat(const std::string& device_id,
                                              const model::HeartbeatReport& report) {
  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) {
    heartbeats_rejected_.fetch_add(1, std::memory_order_relaxed);
    return err;
  }

  std::lock_guard<std::mutex> lock(slot->mutex);
  Device& d = slot->device;
  if (d.status == DeviceStatus::kDecommissioned) {
    heartbeats_rejected_.fetch_add(1, std::memory_order_relaxed);
    return RegistryError::kDeviceDecommissioned;
  }
  if (d.last_heartbeat_utc_ms && report.time_utc_ms < *d.last_heartbeat_utc_ms) {
    heartbeats_rejected_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream oss;
    oss << "[DeviceRegistry] Stale heartbeat for " << device_id << ": " << report.time_utc_ms
        << " < " << *d.last_heartbeat_utc_ms;
    Logger::Debug(oss.str());
    return RegistryError::kStaleHeartbeat;
  }

  d.consecutive_failures = 0;
  d.last_heartbeat_utc_ms = report.time_utc_ms;
  MergeTelemetry(d.telemetry, report);
  if (d.status == DeviceStatus::kPending || d.status == DeviceStatus::kOffline) {
    Transition(d, DeviceStatus::kActive, "heartbeat");
  }
  heartbeats_accepted_.fetch_add(1, std::memory_order_relaxed);
  return RegistryError::kNone;
}

RegistryError DeviceRegistry::RecordLivenessFailure(const std::string& device_id) {
  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) return err;

  std::lock_guard<std::mutex> lock(slot->mutex);
  Device& d = slot->device;
  if (d.status != DeviceStatus::kActive && d.status != DeviceStatus::kOffline) {
    return RegistryError::kNone;
  }
  ++d.consecutive_failures;
  if (d.status == DeviceStatus::kActive &&
      d.consecutive_failures >= config_.offline_failure_threshold) {
    Transition(d, DeviceStatus::kOffline, "liveness");
  }
  return RegistryError::kNone;
}

size_t DeviceRegistry::SweepLiveness(int64_t now_utc_ms, int64_t heartbeat_interval_ms) {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    slots.reserve(devices_.size());
    for (const auto& kv : devices_) slots.push_back(kv.second);
  }

  size_t failures = 0;
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    Device& d = slot->device;
    if (d.status != DeviceStatus::kActive && d.status != DeviceStatus::kOffline) continue;
    const int64_t last = d.last_heartbeat_utc_ms.value_or(d.registered_utc_ms);
    if (now_utc_ms - last <= heartbeat_interval_ms) continue;
    ++d.consecutive_failures;
    ++failures;
    if (d.status == DeviceStatus::kActive &&
        d.consecutive_failures >= config_.offline_failure_threshold) {
      Transition(d, DeviceStatus::kOffline, "liveness sweep");
    }
  }
  return failures;
}

std::vector<std::string> DeviceRegistry::SweepAutoDecommission(int64_t now_utc_ms,
                                                               int64_t max_offline_ms) {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    for (const auto& kv : devices_) slots.push_back(kv.second);
  }

  std::vector<std::string> retired;
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    Device& d = slot->device;
    if (d.status != DeviceStatus::kOffline) continue;
    if (now_utc_ms - d.status_changed_utc_ms <= max_offline_ms) continue;
    if (Transition(d, DeviceStatus::kDecommissioned, "auto-decommission")) {
      retired.push_back(d.id);
    }
  }
  return retired;
}

// =============================================================================
// Operator actions
// =============================================================================

RegistryError DeviceRegistry::OperatorTransition(const std::string& device_id, DeviceStatus to) {
  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) return err;

  std::lock_guard<std::mutex> lock(slot->mutex);
  Device& d = slot->device;
  if (d.status == DeviceStatus::kDecommissioned && to != DeviceStatus::kDecommissioned) {
    illegal_transition_total_.fetch_add(1, std::memory_order_relaxed);
    return RegistryError::kDeviceDecommissioned;
  }
  if (!Transition(d, to, "operator")) return RegistryError::kIllegalTransition;
  return RegistryError::kNone;
}

RegistryError DeviceRegistry::SetMaintenance(const std::string& device_id) {
  return OperatorTransition(device_id, DeviceStatus::kMaintenance);
}

RegistryError DeviceRegistry::ReturnToService(const std::string& device_id) {
  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) return err;

  std::lock_guard<std::mutex> lock(slot->mutex);
  Device& d = slot->device;
  // Only MAINTENANCE returns to service; OFFLINE recovers by heartbeat.
  if (d.status != DeviceStatus::kMaintenance) {
    illegal_transition_total_.fetch_add(1, std::memory_order_relaxed);
    return d.status == DeviceStatus::kDecommissioned ? RegistryError::kDeviceDecommissioned
                                                     : RegistryError::kIllegalTransition;
  }
  Transition(d, DeviceStatus::kActive, "return to service");
  d.consecutive_failures = 0;
  return RegistryError::kNone;
}

RegistryError DeviceRegistry::Decommission(const std::string& device_id) {
  return OperatorTransition(device_id, DeviceStatus::kDecommissioned);
}

// =============================================================================
// Commands
// =============================================================================

RegistryResult<std::string> DeviceRegistry::SendCommand(
    const std::string& device_id, const std::string& command,
    const std::map<std::string, std::string>& params) {
  auto type = model::CommandTypeFromString(command);
  if (!type) return RegistryResult<std::string>::Fail(RegistryError::kInvalidCommand);

  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) return RegistryResult<std::string>::Fail(err);

  std::lock_guard<std::mutex> lock(slot->mutex);
  Device& d = slot->device;
  if (d.status == DeviceStatus::kDecommissioned) {
    return RegistryResult<std::string>::Fail(RegistryError::kDeviceDecommissioned);
  }

  model::DeviceCommand cmd;
  cmd.command_id = util::GenerateUuidV4();
  cmd.type = *type;
  cmd.params = params;
  cmd.issued_utc_ms = clock_->NowUtcMs();
  d.pending_commands.push_back(cmd);
  if (d.pending_commands.size() > config_.max_pending_commands) {
    Logger::Warn("[DeviceRegistry] Command queue full for " + device_id +
                 "; dropping oldest " +
                 model::CommandTypeName(d.pending_commands.front().type));
    d.pending_commands.pop_front();
  }
  Logger::Info(std::string("[DeviceRegistry] Queued ") + model::CommandTypeName(cmd.type) +
               " for " + device_id);
  return RegistryResult<std::string>::Ok(cmd.command_id);
}

std::vector<model::DeviceCommand> DeviceRegistry::DrainCommands(const std::string& device_id) {
  std::vector<model::DeviceCommand> out;
  std::shared_ptr<Slot> slot;
  if (Lookup(device_id, &slot) != RegistryError::kNone) return out;
  std::lock_guard<std::mutex> lock(slot->mutex);
  out.assign(slot->device.pending_commands.begin(), slot->device.pending_commands.end());
  slot->device.pending_commands.clear();
  return out;
}

RegistryError DeviceRegistry::SetAssignedPlaylist(const std::string& device_id,
                                                  std::optional<std::string> playlist_id) {
  std::shared_ptr<Slot> slot;
  RegistryError err = Lookup(device_id, &slot);
  if (err != RegistryError::kNone) return err;
  std::lock_guard<std::mutex> lock(slot->mutex);
  slot->device.assigned_playlist_id = std::move(playlist_id);
  return RegistryError::kNone;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Device> DeviceRegistry::Get(const std::string& device_id) const {
  std::shared_ptr<Slot> slot;
  if (Lookup(device_id, &slot) != RegistryError::kNone) return std::nullopt;
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->device;
}

std::vector<std::string> DeviceRegistry::DeviceIds() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  std::vector<std::string> ids;
  ids.reserve(devices_.size());
  for (const auto& kv : devices_) ids.push_back(kv.first);
  return ids;
}

RegistrySnapshot DeviceRegistry::Snapshot() const {
  RegistrySnapshot snap;
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::shared_lock<std::shared_mutex> lock(map_mutex_);
    for (const auto& kv : devices_) slots.push_back(kv.second);
  }
  snap.device_count = slots.size();
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    ++snap.by_status[slot->device.status];
  }
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    snap.transitions = transitions_;
  }
  snap.illegal_transition_total = illegal_transition_total_.load(std::memory_order_relaxed);
  snap.heartbeats_accepted = heartbeats_accepted_.load(std::memory_order_relaxed);
  snap.heartbeats_rejected = heartbeats_rejected_.load(std::memory_order_relaxed);
  return snap;
}

}  // namespace holohub::registry
