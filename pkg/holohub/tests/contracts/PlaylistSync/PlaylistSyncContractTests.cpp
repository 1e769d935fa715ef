// Repository: HoloHub-fleet
// Component: Playlist Sync Contract Tests
// Purpose: Publish only after content is local, change detection, auth
//          recovery and integrity retries.
// Copyright (c) 2025 HoloHub

#include <gtest/gtest.h>

#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "holohub/content/ContentStore.hpp"
#include "holohub/sync/PlaylistDiff.hpp"
#include "holohub/sync/PlaylistSlot.hpp"
#include "holohub/sync/PlaylistSync.hpp"
#include "DeterministicTimeSource.hpp"
#include "DeterministicWaitStrategy.hpp"
#include "FakeContentSource.hpp"
#include "FakeControlPlaneClient.hpp"
#include "PlaylistBuilders.hpp"
#include "TempDir.hpp"

namespace holohub::sync::testing {
namespace {

using namespace std::chrono_literals;
using holohub::testing::DeterministicTimeSource;
using holohub::testing::DeterministicWaitStrategy;
using holohub::testing::FakeContentSource;
using holohub::testing::FakeControlPlaneClient;
using holohub::testing::MakePlaylist;
using holohub::testing::TempDir;

constexpr const char* kDevice = FakeControlPlaneClient::kDeviceId;

class PlaylistSyncContractTests : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDir>("sync");
    clock_ = std::make_shared<DeterministicTimeSource>();
    source_ = std::make_shared<FakeContentSource>();
    client_ = std::make_shared<FakeControlPlaneClient>();
    slot_ = std::make_shared<PlaylistSlot>();
    wait_ = std::make_shared<DeterministicWaitStrategy>(clock_);
    for (const char* id : {"a", "b", "c", "d"}) source_->Put(id, std::string("data-") + id);
    Build(1 << 20);
  }

  void Build(int64_t max_bytes) {
    sync_.reset();
    store_.reset();
    content::ContentStoreConfig config;
    config.root_dir = dir_->Path();
    config.max_bytes = max_bytes;
    store_ = std::make_shared<content::ContentStore>(config, source_, clock_);
    sync_ = std::make_unique<PlaylistSync>(client_, store_, slot_, wait_);
  }

  // Playlist whose items carry full descriptors (size and checksum).
  model::Playlist Described(const std::string& id,
                            const std::vector<std::pair<std::string, int32_t>>& items) {
    model::Playlist p = MakePlaylist(id, items);
    for (auto& item : p.items) item.content = source_->Describe(item.asset_id);
    return p;
  }

  std::string PublishedId() const {
    auto snap = slot_->Load();
    return snap ? snap->id : std::string();
  }

  std::unique_ptr<TempDir> dir_;
  std::shared_ptr<DeterministicTimeSource> clock_;
  std::shared_ptr<FakeContentSource> source_;
  std::shared_ptr<FakeControlPlaneClient> client_;
  std::shared_ptr<PlaylistSlot> slot_;
  std::shared_ptr<DeterministicWaitStrategy> wait_;
  std::shared_ptr<content::ContentStore> store_;
  std::unique_ptr<PlaylistSync> sync_;
};

// -----------------------------------------------------------------------------
// Publish and change detection
// -----------------------------------------------------------------------------
TEST_F(PlaylistSyncContractTests, FirstSyncDownloadsThenPublishes) {
  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 5}, {"a", 3}}));

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.change, PlaylistChange::kFirstSync);
  EXPECT_EQ(r.fetches, 2u);
  EXPECT_EQ(PublishedId(), "pl");
  EXPECT_EQ(slot_->Generation(), 1u);
  EXPECT_TRUE(store_->IsCached("a"));
  EXPECT_TRUE(store_->IsCached("b"));
  EXPECT_EQ(sync_->TotalFetches(), 2u);
}

TEST_F(PlaylistSyncContractTests, IdenticalAssignmentIsANoOp) {
  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kUnchanged);
  EXPECT_EQ(r.fetches, 0u);
  EXPECT_EQ(slot_->Generation(), 1u);
  EXPECT_EQ(source_->TotalFetches(), 2);
}

TEST_F(PlaylistSyncContractTests, ServerOnlyFieldsDoNotTriggerResync) {
  model::Playlist p = Described("pl", {{"a", 5}});
  client_->SetAssignment(p);
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  p.name = "Renamed";
  p.description = "new blurb";
  p.items[0].custom_settings["brightness"] = "40";
  client_->SetAssignment(p);
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kUnchanged);
}

TEST_F(PlaylistSyncContractTests, DurationChangeRepublishesWithoutFetching) {
  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 9}}));
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.change, PlaylistChange::kItemSequence);
  EXPECT_EQ(r.fetches, 0u);
  EXPECT_EQ(slot_->Load()->items[1].duration_seconds, 9);
}

TEST_F(PlaylistSyncContractTests, ChangedContentIsFetchedOnce) {
  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  client_->SetAssignment(Described("pl", {{"a", 5}, {"c", 5}}));
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.fetches, 1u);
  EXPECT_EQ(source_->FetchCount("c"), 1);
  EXPECT_EQ(source_->FetchCount("a"), 1);
}

TEST_F(PlaylistSyncContractTests, RepointedItemFetchesNewContent) {
  model::Playlist p = MakePlaylist("pl", {{"asset1", 5}});
  p.items[0].content = source_->Describe("a");
  client_->SetAssignment(p);
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  p.items[0].content = source_->Describe("c");
  client_->SetAssignment(p);
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.change, PlaylistChange::kItemSequence);
  EXPECT_EQ(r.fetches, 1u);
  EXPECT_TRUE(store_->IsCached("c"));
  EXPECT_EQ(slot_->Load()->items[0].content.content_id, "c");
}

TEST_F(PlaylistSyncContractTests, ReplacedBytesUnderSameIdAreRefetched) {
  client_->SetAssignment(Described("pl", {{"a", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);
  const std::string old_sha = store_->GetEntry("a")->sha256;

  source_->Put("a", "data-a-revised");
  client_->SetAssignment(Described("pl", {{"a", 5}}));
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.change, PlaylistChange::kItemSequence);
  EXPECT_EQ(r.fetches, 1u);
  EXPECT_EQ(source_->FetchCount("a"), 2);
  EXPECT_NE(store_->GetEntry("a")->sha256, old_sha);
}

TEST_F(PlaylistSyncContractTests, ChecksumCaseDoesNotTriggerResync) {
  model::Playlist p = Described("pl", {{"a", 5}});
  client_->SetAssignment(p);
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  for (auto& c : p.items[0].content.expected_sha256) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  client_->SetAssignment(p);
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kUnchanged);
}

TEST_F(PlaylistSyncContractTests, DiffReportsAddedAndRemovedContent) {
  model::Playlist before = MakePlaylist("pl", {{"a", 5}, {"b", 5}});
  model::Playlist after = MakePlaylist("pl", {{"b", 5}, {"c", 5}, {"d", 5}});
  PlaylistDiff d = DiffPlaylists(&before, after);
  EXPECT_EQ(d.change, PlaylistChange::kItemCount);
  EXPECT_EQ(d.added_content_ids, (std::vector<std::string>{"c", "d"}));
  EXPECT_EQ(d.removed_content_ids, (std::vector<std::string>{"a"}));

  model::Playlist other = MakePlaylist("pl-2", {{"a", 5}, {"b", 5}});
  EXPECT_EQ(DiffPlaylists(&before, other).change, PlaylistChange::kIdentity);
  EXPECT_FALSE(DiffPlaylists(&before, before).Changed());
}

// -----------------------------------------------------------------------------
// Failures keep the previous playlist
// -----------------------------------------------------------------------------
TEST_F(PlaylistSyncContractTests, FailedDownloadKeepsPreviousPlaylist) {
  client_->SetAssignment(Described("old", {{"a", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  model::Playlist next = Described("new", {{"b", 5}, {"missing", 5}});
  client_->SetAssignment(next);
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kDownloadFailed);
  EXPECT_NE(r.detail.find("missing"), std::string::npos);
  EXPECT_EQ(PublishedId(), "old");
  EXPECT_EQ(slot_->Generation(), 1u);

  // Once the object exists the next pass publishes.
  source_->Put("missing", "now-here");
  for (auto& item : next.items) item.content = source_->Describe(item.asset_id);
  client_->SetAssignment(next);
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);
  EXPECT_EQ(PublishedId(), "new");
}

TEST_F(PlaylistSyncContractTests, FetchFailureKeepsPreviousPlaylist) {
  client_->SetAssignment(Described("pl", {{"a", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kNetworkTimeout, "deadline"));
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kNetworkTimeout, "deadline"));
  // Drop the original success at the head of the queue.
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kUnchanged);

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kFetchFailed);
  EXPECT_EQ(PublishedId(), "pl");
  EXPECT_FALSE(sync_->Sync(kDevice).has_value());
}

TEST_F(PlaylistSyncContractTests, NoAssignmentLeavesSlotEmpty) {
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kNoAssignment);
  EXPECT_EQ(slot_->Load(), nullptr);

  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Ok(std::nullopt));
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kNoAssignment);
}

TEST_F(PlaylistSyncContractTests, UnassignedDeviceKeepsLastPlaylist) {
  client_->SetAssignment(Described("pl", {{"a", 5}}));
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Ok(std::nullopt));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kNoAssignment);
  EXPECT_EQ(PublishedId(), "pl");
  EXPECT_EQ(slot_->Generation(), 1u);
  EXPECT_TRUE(store_->IsCached("a"));
}

TEST_F(PlaylistSyncContractTests, SyncReturnsActivePlaylist) {
  client_->SetAssignment(Described("pl", {{"a", 5}, {"b", 7}}));
  auto p = sync_->Sync(kDevice);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->id, "pl");
  EXPECT_EQ(p->total_duration_sec, 12);

  auto again = sync_->Sync(kDevice);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->id, "pl");
}

// -----------------------------------------------------------------------------
// Authentication
// -----------------------------------------------------------------------------
TEST_F(PlaylistSyncContractTests, ExpiredTokenReauthenticatesOnce) {
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kAuthFailure, "token expired"));
  client_->QueueAssignment(
      ClientResult<std::optional<model::Playlist>>::Ok(Described("pl", {{"a", 5}})));

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(client_->AuthCalls(), 1);
  EXPECT_EQ(client_->FetchCalls(), 2);
  EXPECT_FALSE(sync_->AuthFatal());
}

TEST_F(PlaylistSyncContractTests, RejectedCredentialIsFatal) {
  client_->SetAssignment(Described("pl", {{"a", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);

  int fatal_calls = 0;
  std::string fatal_reason;
  sync_->SetFatalCallback([&](const std::string& why) {
    ++fatal_calls;
    fatal_reason = why;
  });
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kAuthFailure, "token expired"));
  // Remove the previous success so the auth failure is served next.
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kUnchanged);
  client_->QueueAuth(ClientStatus::kAuthFailure);

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kAuthFatal);
  EXPECT_TRUE(sync_->AuthFatal());
  EXPECT_EQ(fatal_calls, 1);
  EXPECT_NE(fatal_reason.find("credential rejected"), std::string::npos);
  EXPECT_EQ(PublishedId(), "pl");

  const int fetches = client_->FetchCalls();
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kAuthFatal);
  EXPECT_EQ(client_->FetchCalls(), fetches);
  EXPECT_EQ(fatal_calls, 1);
}

TEST_F(PlaylistSyncContractTests, RejectionAfterFreshTokenIsFatal) {
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kAuthFailure, "token expired"));
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kAuthFatal);
  EXPECT_EQ(client_->AuthCalls(), 1);
}

TEST_F(PlaylistSyncContractTests, UnreachableDuringReauthIsNotFatal) {
  client_->QueueAssignment(ClientResult<std::optional<model::Playlist>>::Fail(
      ClientStatus::kAuthFailure, "token expired"));
  client_->QueueAuth(ClientStatus::kNetworkTimeout);
  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kFetchFailed);
  EXPECT_FALSE(sync_->AuthFatal());
}

// -----------------------------------------------------------------------------
// Integrity retries
// -----------------------------------------------------------------------------
TEST_F(PlaylistSyncContractTests, IntegrityMismatchRetriesWithBackoff) {
  source_->Mutable("a").corrupt_attempts = 2;
  client_->SetAssignment(Described("pl", {{"a", 5}}));

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(source_->FetchCount("a"), 3);
  EXPECT_EQ(wait_->Waits(), (std::vector<std::chrono::milliseconds>{500ms, 1000ms}));
}

TEST_F(PlaylistSyncContractTests, PersistentCorruptionGivesUp) {
  source_->Mutable("a").corrupt_attempts = 10;
  client_->SetAssignment(Described("pl", {{"a", 5}}));

  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kDownloadFailed);
  EXPECT_EQ(source_->FetchCount("a"), 3);
  EXPECT_EQ(wait_->Waits().size(), 2u);
  EXPECT_FALSE(store_->IsCached("a"));
  EXPECT_EQ(slot_->Load(), nullptr);
}

TEST_F(PlaylistSyncContractTests, TransportErrorsAreNotRetried) {
  source_->Mutable("a").error = content::ContentError::kNetworkTimeout;
  client_->SetAssignment(Described("pl", {{"a", 5}}));

  EXPECT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kDownloadFailed);
  EXPECT_EQ(source_->FetchCount("a"), 1);
  EXPECT_TRUE(wait_->Waits().empty());
}

// -----------------------------------------------------------------------------
// Cache trimming
// -----------------------------------------------------------------------------
TEST_F(PlaylistSyncContractTests, PublishTrimsCacheButKeepsNewContent) {
  // Each object is 6 bytes ("data-x"); budget fits two.
  Build(12);
  client_->SetAssignment(Described("first", {{"a", 5}, {"b", 5}}));
  ASSERT_EQ(sync_->SyncOnce(kDevice).outcome, SyncOutcome::kPublished);
  clock_->AdvanceMs(1000);

  client_->SetAssignment(Described("second", {{"c", 5}}));
  SyncReport r = sync_->SyncOnce(kDevice);
  EXPECT_EQ(r.outcome, SyncOutcome::kPublished);
  EXPECT_EQ(r.evicted, (std::vector<std::string>{"a"}));
  EXPECT_TRUE(store_->IsCached("c"));
  EXPECT_LE(store_->TotalBytes(), 12);
  EXPECT_EQ(store_->PinCount("c"), 0);
}

}  // namespace
}  // namespace holohub::sync::testing
