// Repository: HoloHub-fleet
// Component: Device Agent Contract Tests
// Purpose: Startup wiring, failure modes, command handling and shutdown order.
// Copyright (c) 2025 HoloHub

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "holohub/agent/DeviceAgent.hpp"
#include "FakeContentSource.hpp"
#include "FakeControlPlaneClient.hpp"
#include "PlaylistBuilders.hpp"
#include "RecordingDisplayBackend.hpp"
#include "TempDir.hpp"

namespace holohub::agent::testing {
namespace {

using holohub::testing::FakeContentSource;
using holohub::testing::FakeControlPlaneClient;
using holohub::testing::MakePlaylist;
using holohub::testing::RecordingDisplayBackend;
using holohub::testing::TempDir;
using sync::ClientResult;
using sync::ClientStatus;

bool WaitUntil(const std::function<bool()>& pred) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class DeviceAgentContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDir>("agent");
    client_ = std::make_shared<FakeControlPlaneClient>();
    source_ = std::make_shared<FakeContentSource>();
    backends_ = std::make_shared<display::DisplayBackendRegistry>();
    backends_->Register("recording", [this](const display::DisplayConfig&) {
      auto backend = std::make_unique<RecordingDisplayBackend>();
      backend->SetInitResult(init_result_);
      backend_ = backend.get();
      return std::unique_ptr<display::IDisplayBackend>(std::move(backend));
    });

    config_.content_cache_dir = dir_->Join("cache");
    config_.max_cache_size_gb = 0.001;
    config_.simulation_mode = false;
    config_.display.backend = "recording";
    config_.display.brightness = 55;
  }

  std::unique_ptr<DeviceAgent> MakeAgent() {
    AgentDependencies deps;
    deps.client = client_;
    deps.content_source = source_;
    deps.backends = backends_;
    return std::make_unique<DeviceAgent>(config_, deps);
  }

  model::Playlist AssignedPlaylist() {
    source_->Put("a", "hologram-a");
    source_->Put("b", "hologram-b");
    model::Playlist p = MakePlaylist("pl-1", {{"a", 30}, {"b", 30}});
    p.items[0].content = source_->Describe("a");
    p.items[1].content = source_->Describe("b");
    return p;
  }

  std::unique_ptr<TempDir> dir_;
  std::shared_ptr<FakeControlPlaneClient> client_;
  std::shared_ptr<FakeContentSource> source_;
  std::shared_ptr<display::DisplayBackendRegistry> backends_;
  config::DeviceConfig config_;
  RecordingDisplayBackend* backend_ = nullptr;
  bool init_result_ = true;
};

// -----------------------------------------------------------------------------
// Startup
// -----------------------------------------------------------------------------
TEST_F(DeviceAgentContractTests, StartSyncsAndPlaysAssignedContent) {
  client_->SetAssignment(AssignedPlaylist());
  auto agent = MakeAgent();

  AgentStartResult r = agent->Start();
  ASSERT_TRUE(r.success) << r.detail;
  EXPECT_TRUE(agent->IsRunning());
  EXPECT_EQ(agent->DeviceId(), FakeControlPlaneClient::kDeviceId);
  ASSERT_NE(backend_, nullptr);
  EXPECT_EQ(backend_->InitCalls(), 1);
  EXPECT_EQ(backend_->BrightnessCalls().front(), 55);

  // The first sync runs inline, so content is cached before Start returns.
  EXPECT_TRUE(agent->Store()->IsCached("a"));
  EXPECT_TRUE(agent->Store()->IsCached("b"));
  ASSERT_TRUE(agent->Slot()->Load());
  EXPECT_EQ(agent->Slot()->Load()->id, "pl-1");

  ASSERT_TRUE(WaitUntil([&] { return !backend_->ShownAssets().empty(); }));
  EXPECT_EQ(backend_->ShownAssets().front(), "a");

  agent->Stop();
  EXPECT_FALSE(agent->IsRunning());
}

TEST_F(DeviceAgentContractTests, StartWithoutAssignmentStillRuns) {
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  EXPECT_FALSE(agent->Slot()->Load());
  EXPECT_TRUE(backend_->ShownAssets().empty());
}

TEST_F(DeviceAgentContractTests, SecondStartIsRejected) {
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  AgentStartResult again = agent->Start();
  EXPECT_FALSE(again.success);
  EXPECT_EQ(again.error, AgentError::kAlreadyStarted);
  EXPECT_EQ(backend_->InitCalls(), 1);
}

TEST_F(DeviceAgentContractTests, AuthFailureAbortsStart) {
  client_->QueueAuth(ClientStatus::kAuthFailure);
  auto agent = MakeAgent();
  AgentStartResult r = agent->Start();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, AgentError::kAuthFailure);
  EXPECT_NE(r.detail.find("AUTH_FAILURE"), std::string::npos);
  EXPECT_EQ(backend_, nullptr);
  EXPECT_FALSE(agent->IsRunning());
}

TEST_F(DeviceAgentContractTests, UnknownBackendAbortsStart) {
  config_.display.backend = "looking_glass_sdk";
  auto agent = MakeAgent();
  AgentStartResult r = agent->Start();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, AgentError::kBackendUnavailable);
  EXPECT_STREQ(AgentErrorToString(r.error), "BACKEND_UNAVAILABLE");
}

TEST_F(DeviceAgentContractTests, BackendInitFailureAbortsStart) {
  init_result_ = false;
  auto agent = MakeAgent();
  AgentStartResult r = agent->Start();
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, AgentError::kBackendInitFailed);
  EXPECT_EQ(agent->Backend(), nullptr);
}

TEST_F(DeviceAgentContractTests, SimulationModeUsesSimulationBackend) {
  config_.simulation_mode = true;
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  EXPECT_EQ(backend_, nullptr);
  EXPECT_STREQ(agent->Backend()->Name(), "simulation");
}

TEST_F(DeviceAgentContractTests, MissingCollaboratorsThrow) {
  AgentDependencies deps;
  deps.client = client_;
  EXPECT_THROW({ DeviceAgent agent(config_, deps); }, std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Runtime
// -----------------------------------------------------------------------------
TEST_F(DeviceAgentContractTests, RejectedCredentialMarksAgentFatal) {
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kAuthFailure, "token expired"));
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  EXPECT_TRUE(agent->FatalError());
  EXPECT_FALSE(agent->FatalReason().empty());
}

TEST_F(DeviceAgentContractTests, HeartbeatAckCommandsReachPlayback) {
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  ASSERT_TRUE(WaitUntil([&] { return !client_->Reports().empty(); }));

  sync::HeartbeatAck ack;
  model::DeviceCommand pause;
  pause.command_id = "cmd-1";
  pause.type = model::CommandType::kPause;
  ack.commands.push_back(pause);
  client_->QueueHeartbeat(ClientResult<sync::HeartbeatAck>::Ok(ack));

  ASSERT_TRUE(agent->Heartbeats()->EmitOnce());
  EXPECT_EQ(agent->Playback()->GetRunState(), playback::PlaybackLoop::RunState::kPaused);

  model::DeviceCommand play;
  play.command_id = "cmd-2";
  play.type = model::CommandType::kPlay;
  agent->HandleCommand(play);
  EXPECT_EQ(agent->Playback()->GetRunState(), playback::PlaybackLoop::RunState::kPlaying);
}

TEST_F(DeviceAgentContractTests, ClearCacheKeepsOnScreenContent) {
  client_->SetAssignment(AssignedPlaylist());
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  ASSERT_TRUE(WaitUntil([&] { return agent->Store()->PinCount("a") > 0; }));

  model::DeviceCommand clear;
  clear.command_id = "cmd-3";
  clear.type = model::CommandType::kClearCache;
  agent->HandleCommand(clear);

  EXPECT_TRUE(agent->Store()->IsCached("a"));
  EXPECT_FALSE(agent->Store()->IsCached("b"));
}

TEST_F(DeviceAgentContractTests, UnsupportedCommandsAreIgnored) {
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  model::DeviceCommand reboot;
  reboot.command_id = "cmd-4";
  reboot.type = model::CommandType::kReboot;
  agent->HandleCommand(reboot);
  EXPECT_TRUE(agent->IsRunning());
  EXPECT_EQ(agent->Playback()->GetRunState(), playback::PlaybackLoop::RunState::kPlaying);
}

// -----------------------------------------------------------------------------
// Shutdown
// -----------------------------------------------------------------------------
TEST_F(DeviceAgentContractTests, StopShutsBackendDownOnce) {
  auto agent = MakeAgent();
  ASSERT_TRUE(agent->Start().success);
  agent->Stop();
  agent->Stop();
  EXPECT_EQ(backend_->Shutdowns(), 1);
  agent.reset();
}

TEST_F(DeviceAgentContractTests, StopWithoutStartIsHarmless) {
  auto agent = MakeAgent();
  agent->Stop();
  EXPECT_FALSE(agent->IsRunning());
}

}  // namespace
}  // namespace holohub::agent::testing
