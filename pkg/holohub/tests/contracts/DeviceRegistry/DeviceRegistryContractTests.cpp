// Repository: HoloHub-fleet
// Component: Device Registry Contract Tests
// Purpose: Lifecycle transitions, heartbeat ordering, liveness threshold,
//          credentials and command queueing.
// Copyright (c) 2025 HoloHub

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "holohub/registry/DeviceRegistry.hpp"
#include "holohub/util/Uuid.hpp"
#include "DeterministicTimeSource.hpp"

namespace holohub::registry::testing {
namespace {

using holohub::testing::DeterministicTimeSource;

constexpr const char* kMac = "aa:bb:cc:dd:ee:01";
constexpr const char* kSecret = "0123456789abcdef-secret";

class DeviceRegistryContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<DeterministicTimeSource>();
    RegistryConfig config;
    config.offline_failure_threshold = 3;
    config.max_pending_commands = 4;
    registry_ = std::make_unique<DeviceRegistry>(clock_, config);
  }

  std::string RegisterDevice(const std::string& hw = kMac) {
    auto r = registry_->Register(hw, kSecret, "Lobby Display", "looking_glass_portrait");
    EXPECT_TRUE(r.ok()) << RegistryErrorToString(r.error);
    return r.value;
  }

  model::HeartbeatReport Beat(int64_t at_ms) {
    model::HeartbeatReport hb;
    hb.time_utc_ms = at_ms;
    return hb;
  }

  std::string ActiveDevice() {
    std::string id = RegisterDevice();
    EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(clock_->NowUtcMs())), RegistryError::kNone);
    return id;
  }

  DeviceStatus StatusOf(const std::string& id) { return registry_->Get(id)->status; }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::unique_ptr<DeviceRegistry> registry_;
};

// -----------------------------------------------------------------------------
// Transition table
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, TransitionTableMatchesLifecycle) {
  using S = DeviceStatus;
  EXPECT_TRUE(IsLegalTransition(S::kPending, S::kActive));
  EXPECT_TRUE(IsLegalTransition(S::kPending, S::kDecommissioned));
  EXPECT_FALSE(IsLegalTransition(S::kPending, S::kOffline));
  EXPECT_FALSE(IsLegalTransition(S::kPending, S::kMaintenance));

  EXPECT_TRUE(IsLegalTransition(S::kActive, S::kOffline));
  EXPECT_TRUE(IsLegalTransition(S::kActive, S::kMaintenance));
  EXPECT_TRUE(IsLegalTransition(S::kOffline, S::kActive));
  EXPECT_TRUE(IsLegalTransition(S::kOffline, S::kMaintenance));
  EXPECT_TRUE(IsLegalTransition(S::kMaintenance, S::kActive));
  EXPECT_FALSE(IsLegalTransition(S::kMaintenance, S::kOffline));

  for (S to : {S::kPending, S::kActive, S::kOffline, S::kMaintenance, S::kDecommissioned}) {
    EXPECT_FALSE(IsLegalTransition(S::kDecommissioned, to));
    EXPECT_FALSE(IsLegalTransition(to, to));
  }
}

TEST_F(DeviceRegistryContractTests, StatusNamesRoundTrip) {
  for (DeviceStatus s : {DeviceStatus::kPending, DeviceStatus::kActive, DeviceStatus::kOffline,
                         DeviceStatus::kMaintenance, DeviceStatus::kDecommissioned}) {
    EXPECT_EQ(DeviceStatusFromString(DeviceStatusName(s)), s);
  }
  EXPECT_FALSE(DeviceStatusFromString("retired").has_value());
}

// -----------------------------------------------------------------------------
// Registration and credentials
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, RegisterCreatesPendingDevice) {
  std::string id = RegisterDevice();
  EXPECT_TRUE(util::IsCanonicalUuid(id));

  auto d = registry_->Get(id);
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->status, DeviceStatus::kPending);
  EXPECT_EQ(d->hardware_id, "AA:BB:CC:DD:EE:01");
  EXPECT_NE(d->credential_hash, kSecret);
  EXPECT_FALSE(d->last_heartbeat_utc_ms.has_value());
  EXPECT_EQ(d->registered_utc_ms, clock_->NowUtcMs());
}

TEST_F(DeviceRegistryContractTests, RegisterRejectsBadInput) {
  EXPECT_EQ(registry_->Register("not-a-mac", kSecret, "x", "t").error,
            RegistryError::kInvalidHardwareId);
  EXPECT_EQ(registry_->Register(kMac, "short", "x", "t").error,
            RegistryError::kInvalidCredential);
  EXPECT_EQ(registry_->Register(kMac, kSecret, "", "t").error, RegistryError::kInvalidName);

  RegisterDevice();
  EXPECT_EQ(registry_->Register("AA:BB:CC:DD:EE:01", kSecret, "dup", "t").error,
            RegistryError::kDuplicateHardwareId);
}

TEST_F(DeviceRegistryContractTests, HardwareIdNormalization) {
  EXPECT_EQ(NormalizeHardwareId("aa:bb:cc:dd:ee:ff"), std::string("AA:BB:CC:DD:EE:FF"));
  EXPECT_EQ(NormalizeHardwareId(std::string(64, 'a')), std::string(64, 'A'));
  EXPECT_FALSE(NormalizeHardwareId("aa-bb-cc-dd-ee-ff").has_value());
  EXPECT_FALSE(NormalizeHardwareId(std::string(63, 'a')).has_value());
  EXPECT_FALSE(NormalizeHardwareId("gg:bb:cc:dd:ee:ff").has_value());
}

TEST_F(DeviceRegistryContractTests, CredentialVerification) {
  std::string id = RegisterDevice();

  auto ok = registry_->VerifyCredential("AA:BB:CC:DD:EE:01", kSecret);
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(ok.value, id);

  EXPECT_EQ(registry_->VerifyCredential(kMac, "wrong-secret-value").error,
            RegistryError::kAuthFailure);
  EXPECT_EQ(registry_->VerifyCredential("aa:bb:cc:dd:ee:02", kSecret).error,
            RegistryError::kAuthFailure);

  ASSERT_EQ(registry_->Decommission(id), RegistryError::kNone);
  EXPECT_EQ(registry_->VerifyCredential(kMac, kSecret).error, RegistryError::kAuthFailure);
}

// -----------------------------------------------------------------------------
// Heartbeats
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, FirstHeartbeatActivatesPendingDevice) {
  std::string id = RegisterDevice();
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(1000)), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kActive);
  EXPECT_EQ(registry_->Get(id)->last_heartbeat_utc_ms, 1000);
}

TEST_F(DeviceRegistryContractTests, LastHeartbeatIsMonotonic) {
  std::string id = RegisterDevice();
  ASSERT_EQ(registry_->IngestHeartbeat(id, Beat(2000)), RegistryError::kNone);

  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(1999)), RegistryError::kStaleHeartbeat);
  EXPECT_EQ(registry_->Get(id)->last_heartbeat_utc_ms, 2000);

  // Equal timestamps are not stale.
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(2000)), RegistryError::kNone);
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(2500)), RegistryError::kNone);
  EXPECT_EQ(registry_->Get(id)->last_heartbeat_utc_ms, 2500);

  auto snap = registry_->Snapshot();
  EXPECT_EQ(snap.heartbeats_accepted, 3u);
  EXPECT_EQ(snap.heartbeats_rejected, 1u);
}

TEST_F(DeviceRegistryContractTests, AbsentTelemetryKeepsStoredValue) {
  std::string id = RegisterDevice();
  model::HeartbeatReport first = Beat(100);
  first.cpu_percent = 42.5;
  first.current_asset_id = "asset-a";
  ASSERT_EQ(registry_->IngestHeartbeat(id, first), RegistryError::kNone);

  model::HeartbeatReport second = Beat(200);
  second.memory_percent = 10.0;
  ASSERT_EQ(registry_->IngestHeartbeat(id, second), RegistryError::kNone);

  const auto& t = registry_->Get(id)->telemetry;
  EXPECT_EQ(t.cpu_percent, 42.5);
  EXPECT_EQ(t.memory_percent, 10.0);
  EXPECT_EQ(t.current_asset_id, std::string("asset-a"));
  EXPECT_EQ(t.time_utc_ms, 200);
}

TEST_F(DeviceRegistryContractTests, HeartbeatForUnknownOrMalformedId) {
  EXPECT_EQ(registry_->IngestHeartbeat("not-a-uuid", Beat(1)), RegistryError::kInvalidDeviceId);
  EXPECT_EQ(registry_->IngestHeartbeat("6f1c2d3e-4a5b-4c6d-8e7f-0123456789ab", Beat(1)),
            RegistryError::kDeviceNotFound);
}

TEST_F(DeviceRegistryContractTests, DecommissionedDeviceRejectsHeartbeats) {
  std::string id = ActiveDevice();
  ASSERT_EQ(registry_->Decommission(id), RegistryError::kNone);
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(clock_->NowUtcMs() + 1)),
            RegistryError::kDeviceDecommissioned);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kDecommissioned);
  EXPECT_TRUE(registry_->Get(id)->decommissioned_utc_ms.has_value());
}

// -----------------------------------------------------------------------------
// Liveness
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, OfflineExactlyAtFailureThreshold) {
  std::string id = ActiveDevice();

  EXPECT_EQ(registry_->RecordLivenessFailure(id), RegistryError::kNone);
  EXPECT_EQ(registry_->RecordLivenessFailure(id), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kActive);
  EXPECT_EQ(registry_->Get(id)->consecutive_failures, 2);

  EXPECT_EQ(registry_->RecordLivenessFailure(id), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kOffline);
  EXPECT_EQ(registry_->Get(id)->consecutive_failures, 3);
}

TEST_F(DeviceRegistryContractTests, HeartbeatResetsFailuresAndRecoversOffline) {
  std::string id = ActiveDevice();
  for (int i = 0; i < 3; ++i) registry_->RecordLivenessFailure(id);
  ASSERT_EQ(StatusOf(id), DeviceStatus::kOffline);

  clock_->AdvanceMs(5000);
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(clock_->NowUtcMs())), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kActive);
  EXPECT_EQ(registry_->Get(id)->consecutive_failures, 0);
}

TEST_F(DeviceRegistryContractTests, LivenessFailuresIgnoredOutsideActiveAndOffline) {
  std::string pending = RegisterDevice("aa:bb:cc:dd:ee:10");
  std::string maint = ActiveDevice();
  ASSERT_EQ(registry_->SetMaintenance(maint), RegistryError::kNone);

  for (int i = 0; i < 5; ++i) {
    registry_->RecordLivenessFailure(pending);
    registry_->RecordLivenessFailure(maint);
  }
  EXPECT_EQ(StatusOf(pending), DeviceStatus::kPending);
  EXPECT_EQ(StatusOf(maint), DeviceStatus::kMaintenance);
  EXPECT_EQ(registry_->Get(pending)->consecutive_failures, 0);
}

TEST_F(DeviceRegistryContractTests, SweepCountsOnlySilentDevices) {
  std::string quiet = ActiveDevice();
  std::string chatty = RegisterDevice("aa:bb:cc:dd:ee:20");

  const int64_t interval = 30'000;
  for (int round = 0; round < 3; ++round) {
    clock_->AdvanceMs(interval + 1);
    ASSERT_EQ(registry_->IngestHeartbeat(chatty, Beat(clock_->NowUtcMs())), RegistryError::kNone);
    EXPECT_EQ(registry_->SweepLiveness(clock_->NowUtcMs(), interval), 1u);
  }
  EXPECT_EQ(StatusOf(quiet), DeviceStatus::kOffline);
  EXPECT_EQ(StatusOf(chatty), DeviceStatus::kActive);
}

TEST_F(DeviceRegistryContractTests, AutoDecommissionAfterLongOutage) {
  std::string id = ActiveDevice();
  for (int i = 0; i < 3; ++i) registry_->RecordLivenessFailure(id);
  ASSERT_EQ(StatusOf(id), DeviceStatus::kOffline);

  const int64_t max_offline = 30LL * 24 * 3600 * 1000;
  clock_->AdvanceMs(max_offline);
  EXPECT_TRUE(registry_->SweepAutoDecommission(clock_->NowUtcMs(), max_offline).empty());

  clock_->AdvanceMs(1);
  auto retired = registry_->SweepAutoDecommission(clock_->NowUtcMs(), max_offline);
  EXPECT_EQ(retired, (std::vector<std::string>{id}));
  EXPECT_EQ(StatusOf(id), DeviceStatus::kDecommissioned);
}

// -----------------------------------------------------------------------------
// Operator actions
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, MaintenanceRoundTrip) {
  std::string id = ActiveDevice();
  EXPECT_EQ(registry_->SetMaintenance(id), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kMaintenance);

  // Heartbeats during maintenance are accepted without leaving maintenance.
  clock_->AdvanceMs(10);
  EXPECT_EQ(registry_->IngestHeartbeat(id, Beat(clock_->NowUtcMs())), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kMaintenance);

  EXPECT_EQ(registry_->ReturnToService(id), RegistryError::kNone);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kActive);
}

TEST_F(DeviceRegistryContractTests, IllegalOperatorMovesAreRejectedAndCounted) {
  std::string pending = RegisterDevice();
  EXPECT_EQ(registry_->SetMaintenance(pending), RegistryError::kIllegalTransition);
  EXPECT_EQ(registry_->ReturnToService(pending), RegistryError::kIllegalTransition);
  EXPECT_EQ(StatusOf(pending), DeviceStatus::kPending);

  ASSERT_EQ(registry_->Decommission(pending), RegistryError::kNone);
  EXPECT_EQ(registry_->SetMaintenance(pending), RegistryError::kDeviceDecommissioned);
  EXPECT_EQ(registry_->ReturnToService(pending), RegistryError::kDeviceDecommissioned);
  EXPECT_EQ(registry_->Decommission(pending), RegistryError::kIllegalTransition);

  auto snap = registry_->Snapshot();
  EXPECT_EQ(snap.illegal_transition_total, 5u);
  EXPECT_EQ((snap.transitions[{DeviceStatus::kPending, DeviceStatus::kDecommissioned}]), 1u);
  EXPECT_EQ(snap.by_status[DeviceStatus::kDecommissioned], 1u);
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, CommandsQueueAndDrainInOrder) {
  std::string id = ActiveDevice();
  auto a = registry_->SendCommand(id, "pause", {});
  auto b = registry_->SendCommand(id, "play", {{"reason", "resume"}});
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  EXPECT_NE(a.value, b.value);
  EXPECT_EQ(StatusOf(id), DeviceStatus::kActive);

  auto drained = registry_->DrainCommands(id);
  ASSERT_EQ(drained.size(), 2u);
  EXPECT_EQ(drained[0].type, model::CommandType::kPause);
  EXPECT_EQ(drained[1].type, model::CommandType::kPlay);
  EXPECT_EQ(drained[1].params.at("reason"), "resume");
  EXPECT_TRUE(registry_->DrainCommands(id).empty());
}

TEST_F(DeviceRegistryContractTests, CommandValidation) {
  std::string id = ActiveDevice();
  EXPECT_EQ(registry_->SendCommand(id, "self_destruct", {}).error, RegistryError::kInvalidCommand);
  EXPECT_EQ(registry_->SendCommand("bogus", "play", {}).error, RegistryError::kInvalidDeviceId);
  ASSERT_EQ(registry_->Decommission(id), RegistryError::kNone);
  EXPECT_EQ(registry_->SendCommand(id, "play", {}).error, RegistryError::kDeviceDecommissioned);
}

TEST_F(DeviceRegistryContractTests, CommandQueueDropsOldestWhenFull) {
  std::string id = ActiveDevice();
  const char* sequence[] = {"play", "pause", "stop", "screenshot", "clear_cache"};
  for (const char* c : sequence) ASSERT_TRUE(registry_->SendCommand(id, c, {}).ok());

  auto drained = registry_->DrainCommands(id);
  ASSERT_EQ(drained.size(), 4u);
  EXPECT_EQ(drained.front().type, model::CommandType::kPause);
  EXPECT_EQ(drained.back().type, model::CommandType::kClearCache);
}

// -----------------------------------------------------------------------------
// Concurrency
// -----------------------------------------------------------------------------
TEST_F(DeviceRegistryContractTests, ConcurrentHeartbeatsKeepNewestTimestamp) {
  const std::string id = ActiveDevice();
  const int64_t base = clock_->NowUtcMs() + 1;
  constexpr int kThreads = 8;
  constexpr int kBeatsPerThread = 200;

  std::atomic<int> accepted{0};
  std::atomic<int> stale{0};
  std::atomic<int> unexpected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kBeatsPerThread; ++i) {
        const RegistryError e = registry_->IngestHeartbeat(id, Beat(base + t + kThreads * i));
        if (e == RegistryError::kNone) {
          accepted.fetch_add(1);
        } else if (e == RegistryError::kStaleHeartbeat) {
          stale.fetch_add(1);
        } else {
          unexpected.fetch_add(1);
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(accepted.load() + stale.load(), kThreads * kBeatsPerThread);
  const int64_t newest = base + (kThreads - 1) + kThreads * (kBeatsPerThread - 1);
  EXPECT_EQ(registry_->Get(id)->last_heartbeat_utc_ms, newest);

  const RegistrySnapshot snap = registry_->Snapshot();
  EXPECT_EQ(snap.heartbeats_accepted, static_cast<uint64_t>(accepted.load() + 1));
  EXPECT_EQ(snap.heartbeats_rejected, static_cast<uint64_t>(stale.load()));
}

TEST_F(DeviceRegistryContractTests, ConcurrentLivenessFailuresAreAllCounted) {
  const std::string id = ActiveDevice();
  constexpr int kThreads = 8;
  constexpr int kFailuresPerThread = 100;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kFailuresPerThread; ++i) {
        EXPECT_EQ(registry_->RecordLivenessFailure(id), RegistryError::kNone);
      }
    });
  }
  for (auto& th : threads) th.join();

  const auto d = registry_->Get(id);
  EXPECT_EQ(d->consecutive_failures, kThreads * kFailuresPerThread);
  EXPECT_EQ(d->status, DeviceStatus::kOffline);
}

TEST_F(DeviceRegistryContractTests, ParallelDevicesDoNotInterfere) {
  constexpr int kDevices = 6;
  constexpr int kRounds = 300;
  std::vector<std::string> ids;
  for (int k = 0; k < kDevices; ++k) {
    ids.push_back(RegisterDevice("aa:bb:cc:dd:ee:1" + std::to_string(k)));
  }
  const int64_t base = clock_->NowUtcMs();

  std::vector<std::thread> threads;
  for (int k = 0; k < kDevices; ++k) {
    threads.emplace_back([&, k] {
      for (int i = 1; i <= kRounds; ++i) {
        EXPECT_EQ(registry_->IngestHeartbeat(ids[k], Beat(base + i)), RegistryError::kNone);
        EXPECT_EQ(registry_->RecordLivenessFailure(ids[k]), RegistryError::kNone);
      }
    });
  }
  for (auto& th : threads) th.join();

  for (const auto& id : ids) {
    const auto d = registry_->Get(id);
    EXPECT_EQ(d->status, DeviceStatus::kActive);
    EXPECT_EQ(d->last_heartbeat_utc_ms, base + kRounds);
    EXPECT_EQ(d->consecutive_failures, 1);
  }
  EXPECT_EQ(registry_->Snapshot().heartbeats_accepted,
            static_cast<uint64_t>(kDevices * kRounds));
}

}  // namespace
}  // namespace holohub::registry::testing
