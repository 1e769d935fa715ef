// Repository: HoloHub-fleet
// Component: Assignment Service Contract Tests
// Purpose: Playlist resolution per device, supersession, overrides and
//          history retention.
// Copyright (c) 2025 HoloHub

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "holohub/assignment/AssignmentService.hpp"
#include "DeterministicTimeSource.hpp"
#include "PlaylistBuilders.hpp"

namespace holohub::assignment::testing {
namespace {

using holohub::testing::DeterministicTimeSource;
using holohub::testing::MakePlaylist;

class AssignmentServiceContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    // 2024-01-02T10:00:00Z, a Tuesday.
    clock_ = std::make_shared<DeterministicTimeSource>(1'704'189'600'000);
    registry_ = std::make_shared<registry::DeviceRegistry>(clock_);
    catalog_ = std::make_shared<PlaylistCatalog>(clock_);
    service_ = std::make_unique<AssignmentService>(registry_, catalog_, clock_);

    auto reg = registry_->Register("aa:bb:cc:00:00:01", "0123456789abcdef", "Atrium",
                                   "looking_glass_go");
    ASSERT_TRUE(reg.ok());
    device_ = reg.value;
    ASSERT_TRUE(catalog_->Create(MakePlaylist("morning", {{"a", 5}})).ok());
    ASSERT_TRUE(catalog_->Create(MakePlaylist("evening", {{"b", 5}})).ok());
  }

  std::optional<std::string> Resolved() {
    auto r = service_->GetAssignedPlaylist(device_, clock_->NowUtcMs());
    EXPECT_TRUE(r.ok()) << AssignmentErrorToString(r.error);
    if (!r.value) return std::nullopt;
    return r.value->id;
  }

  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<registry::DeviceRegistry> registry_;
  std::shared_ptr<PlaylistCatalog> catalog_;
  std::unique_ptr<AssignmentService> service_;
  std::string device_;
};

TEST_F(AssignmentServiceContractTests, NothingAssignedResolvesToNothing) {
  EXPECT_EQ(Resolved(), std::nullopt);
}

TEST_F(AssignmentServiceContractTests, SingleAssignmentResolvesAndBinds) {
  auto r = service_->Assign(device_, "morning", std::nullopt, std::string("ops@example.com"));
  ASSERT_TRUE(r.ok());

  EXPECT_EQ(Resolved(), std::string("morning"));
  EXPECT_EQ(registry_->Get(device_)->assigned_playlist_id, std::string("morning"));

  auto active = service_->ActiveAssignments(device_);
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].id, r.value);
  EXPECT_TRUE(active[0].is_current);
  EXPECT_EQ(active[0].assigned_by, std::string("ops@example.com"));
}

TEST_F(AssignmentServiceContractTests, ResolvedPlaylistCarriesItems) {
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());
  auto r = service_->GetAssignedPlaylist(device_, clock_->NowUtcMs());
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(r.value.has_value());
  ASSERT_EQ(r.value->items.size(), 1u);
  EXPECT_EQ(r.value->items[0].asset_id, "a");
}

TEST_F(AssignmentServiceContractTests, MostRecentAssignmentWinsAtEqualPriority) {
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());
  clock_->AdvanceMs(1000);
  ASSERT_TRUE(service_->Assign(device_, "evening").ok());

  EXPECT_EQ(Resolved(), std::string("evening"));
  auto active = service_->ActiveAssignments(device_);
  ASSERT_EQ(active.size(), 2u);
  EXPECT_FALSE(active[0].is_current);
  EXPECT_TRUE(active[1].is_current);
}

TEST_F(AssignmentServiceContractTests, OverridePriorityBeatsRecency) {
  model::Schedule high;
  high.priority = 10;
  ASSERT_TRUE(service_->Assign(device_, "morning", high).ok());
  clock_->AdvanceMs(1000);
  ASSERT_TRUE(service_->Assign(device_, "evening").ok());

  EXPECT_EQ(Resolved(), std::string("morning"));
}

TEST_F(AssignmentServiceContractTests, OverrideScheduleControlsLiveness) {
  model::Schedule weekend;
  weekend.priority = 10;
  weekend.recurrence = model::Recurrence{{6, 7}, {}};
  ASSERT_TRUE(service_->Assign(device_, "morning", weekend).ok());
  ASSERT_TRUE(service_->Assign(device_, "evening").ok());

  EXPECT_EQ(Resolved(), std::string("evening"));
  clock_->AdvanceMs(4LL * 86'400'000);   // Saturday
  EXPECT_EQ(Resolved(), std::string("morning"));
}

TEST_F(AssignmentServiceContractTests, ReassignSupersedesAndKeepsHistory) {
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());
  clock_->AdvanceMs(500);
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());

  auto history = service_->History(device_);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_FALSE(history[0].active);
  EXPECT_EQ(history[0].ended_utc_ms, clock_->NowUtcMs());
  EXPECT_TRUE(history[1].active);
  EXPECT_EQ(service_->ActiveAssignments(device_).size(), 1u);
}

TEST_F(AssignmentServiceContractTests, UnassignClearsBindingAndEndsRecord) {
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());
  ASSERT_EQ(Resolved(), std::string("morning"));

  EXPECT_EQ(service_->Unassign(device_, "morning"), AssignmentError::kNone);
  EXPECT_FALSE(registry_->Get(device_)->assigned_playlist_id.has_value());
  EXPECT_EQ(Resolved(), std::nullopt);
  EXPECT_EQ(service_->History(device_).size(), 1u);

  EXPECT_EQ(service_->Unassign(device_, "morning"), AssignmentError::kAssignmentNotFound);
}

TEST_F(AssignmentServiceContractTests, DeletedOrInactivePlaylistsAreSkipped) {
  ASSERT_TRUE(service_->Assign(device_, "morning").ok());
  clock_->AdvanceMs(10);
  ASSERT_TRUE(service_->Assign(device_, "evening").ok());

  ASSERT_EQ(catalog_->SetActive("evening", false), AssignmentError::kNone);
  EXPECT_EQ(Resolved(), std::string("morning"));

  ASSERT_EQ(catalog_->SoftDelete("morning"), AssignmentError::kNone);
  EXPECT_EQ(Resolved(), std::nullopt);
  EXPECT_EQ(service_->Assign(device_, "morning").error, AssignmentError::kPlaylistDeleted);
}

TEST_F(AssignmentServiceContractTests, AssignValidatesTargets) {
  EXPECT_EQ(service_->Assign("nope", "morning").error, AssignmentError::kInvalidDeviceId);
  EXPECT_EQ(service_->Assign("6f1c2d3e-4a5b-4c6d-8e7f-0123456789ab", "morning").error,
            AssignmentError::kDeviceNotFound);
  EXPECT_EQ(service_->Assign(device_, "missing").error, AssignmentError::kPlaylistNotFound);

  model::Schedule broken;
  broken.timezone = "Atlantis/Capital";
  EXPECT_EQ(service_->Assign(device_, "morning", broken).error, AssignmentError::kInvalidSchedule);

  ASSERT_EQ(registry_->Decommission(device_), registry::RegistryError::kNone);
  EXPECT_EQ(service_->Assign(device_, "morning").error, AssignmentError::kDeviceDecommissioned);
  EXPECT_EQ(service_->GetAssignedPlaylist(device_, clock_->NowUtcMs()).error,
            AssignmentError::kDeviceDecommissioned);
}

}  // namespace
}  // namespace holohub::assignment::testing
