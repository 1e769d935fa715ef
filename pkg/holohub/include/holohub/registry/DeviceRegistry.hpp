// Repository: HoloHub-fleet
// Component: Device Registry
// Purpose: Control-plane device entities and their lifecycle. Status moves
//          only through heartbeat ingestion, liveness failures or explicit
//          operator actions; every move goes through IsLegalTransition.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_REGISTRY_DEVICE_REGISTRY_HPP_
#define HOLOHUB_REGISTRY_DEVICE_REGISTRY_HPP_

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "holohub/model/DeviceCommand.hpp"
#include "holohub/model/Heartbeat.hpp"
#include "holohub/registry/DeviceTypes.hpp"
#include "holohub/timing/ITimeSource.hpp"

namespace holohub::registry {

struct RegistryConfig {
  int32_t offline_failure_threshold = 3;
  size_t min_secret_length = 16;
  size_t max_pending_commands = 64;
};

struct RegistrySnapshot {
  size_t device_count = 0;
  std::map<DeviceStatus, size_t> by_status;
  std::map<std::pair<DeviceStatus, DeviceStatus>, uint64_t> transitions;
  uint64_t illegal_transition_total = 0;
  uint64_t heartbeats_accepted = 0;
  uint64_t heartbeats_rejected = 0;
};

class DeviceRegistry {
 public:
  explicit DeviceRegistry(std::shared_ptr<timing::ITimeSource> clock,
                          RegistryConfig config = {});

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Creates a PENDING device. Returns its id.
  RegistryResult<std::string> Register(const std::string& hardware_id,
                                       const std::string& secret,
                                       const std::string& name,
                                       const std::string& hardware_type);

  // Returns the device id for a valid, non-decommissioned credential.
  RegistryResult<std::string> VerifyCredential(const std::string& hardware_id,
                                               const std::string& secret) const;

  RegistryError IngestHeartbeat(const std::string& device_id,
                                const model::HeartbeatReport& report);

  // One missed liveness check. ACTIVE devices go OFFLINE at the threshold.
  // No effect on PENDING, MAINTENANCE or DECOMMISSIONED devices.
  RegistryError RecordLivenessFailure(const std::string& device_id);

  // Operator actions.
  RegistryError SetMaintenance(const std::string& device_id);
  RegistryError ReturnToService(const std::string& device_id);
  RegistryError Decommission(const std::string& device_id);

  // Records a failure for every ACTIVE/OFFLINE device silent for longer
  // than heartbeat_interval_ms. Returns the number of failures recorded.
  size_t SweepLiveness(int64_t now_utc_ms, int64_t heartbeat_interval_ms);

  // Decommissions devices OFFLINE for longer than max_offline_ms.
  std::vector<std::string> SweepAutoDecommission(int64_t now_utc_ms, int64_t max_offline_ms);

  // Queues a command; returns its id. Status is unchanged.
  RegistryResult<std::string> SendCommand(const std::string& device_id,
                                          const std::string& command,
                                          const std::map<std::string, std::string>& params);

  // Hands the queued commands to the transport, oldest first.
  std::vector<model::DeviceCommand> DrainCommands(const std::string& device_id);

  RegistryError SetAssignedPlaylist(const std::string& device_id,
                                    std::optional<std::string> playlist_id);

  std::optional<Device> Get(const std::string& device_id) const;
  std::vector<std::string> DeviceIds() const;
  RegistrySnapshot Snapshot() const;

 private:
  struct Slot {
    std::mutex mutex;
    Device device;
  };

  // Resolves a device id (validated) to its slot under the shared lock.
  RegistryError Lookup(const std::string& device_id, std::shared_ptr<Slot>* out) const;

  // Applies a move if legal; counts it either way. Caller holds slot mutex.
  bool Transition(Device& device, DeviceStatus to, const char* cause);

  RegistryError OperatorTransition(const std::string& device_id, DeviceStatus to);

  std::shared_ptr<timing::ITimeSource> clock_;
  RegistryConfig config_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> devices_;
  std::unordered_map<std::string, std::string> by_hardware_id_;

  mutable std::mutex stats_mutex_;
  std::map<std::pair<DeviceStatus, DeviceStatus>, uint64_t> transitions_;
  std::atomic<uint64_t> illegal_transition_total_{0};
  std::atomic<uint64_t> heartbeats_accepted_{0};
  std::atomic<uint64_t> heartbeats_rejected_{0};
};

}  // namespace holohub::registry

#endif  // HOLOHUB_REGISTRY_DEVICE_REGISTRY_HPP_
