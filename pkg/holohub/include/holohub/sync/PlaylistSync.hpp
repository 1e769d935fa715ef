// Repository: HoloHub-fleet
// Component: Playlist Sync
// Purpose: Polls the control plane for the device's assignment, downloads any
//          content the new playlist needs and only then publishes it to the
//          PlaylistSlot. Failures leave the previous playlist playing.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_SYNC_PLAYLIST_SYNC_HPP_
#define HOLOHUB_SYNC_PLAYLIST_SYNC_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "holohub/content/ContentStore.hpp"
#include "holohub/model/PlaylistTypes.hpp"
#include "holohub/sync/IControlPlaneClient.hpp"
#include "holohub/sync/PlaylistDiff.hpp"
#include "holohub/sync/PlaylistSlot.hpp"
#include "holohub/timing/IWaitStrategy.hpp"

namespace holohub::sync {

struct PlaylistSyncConfig {
  std::chrono::milliseconds poll_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds integrity_backoff_initial{500};
  int integrity_backoff_factor = 2;
  int max_integrity_attempts = 3;
};

enum class SyncOutcome {
  kUnchanged = 0,
  kPublished,
  kNoAssignment,
  kFetchFailed,
  kDownloadFailed,
  kAuthFatal,
};

const char* SyncOutcomeToString(SyncOutcome outcome);

struct SyncReport {
  SyncOutcome outcome = SyncOutcome::kUnchanged;
  PlaylistChange change = PlaylistChange::kNone;
  size_t fetches = 0;                  // objects actually pulled from remote
  std::vector<std::string> evicted;
  std::string detail;
};

class PlaylistSync {
 public:
  // Invoked once when re-authentication fails; the run must end.
  using FatalCallback = std::function<void(const std::string&)>;

  PlaylistSync(std::shared_ptr<IControlPlaneClient> client,
               std::shared_ptr<content::ContentStore> store,
               std::shared_ptr<PlaylistSlot> slot,
               std::shared_ptr<timing::IWaitStrategy> wait,
               PlaylistSyncConfig config = {});
  ~PlaylistSync();

  PlaylistSync(const PlaylistSync&) = delete;
  PlaylistSync& operator=(const PlaylistSync&) = delete;

  // One synchronization pass. Returns the playlist now active (new or
  // unchanged), or nullopt when there is no assignment or the fetch failed.
  std::optional<model::Playlist> Sync(const std::string& device_id);

  // Same pass with the full outcome.
  SyncReport SyncOnce(const std::string& device_id);

  // Polls on config.poll_interval until Stop() or a fatal auth failure.
  void Start(std::string device_id);
  void Stop();

  void SetFatalCallback(FatalCallback cb);
  bool AuthFatal() const { return auth_fatal_.load(std::memory_order_acquire); }
  uint64_t TotalFetches() const { return total_fetches_.load(std::memory_order_relaxed); }

 private:
  void PollLoop(std::string device_id);

  ClientResult<std::optional<model::Playlist>> FetchWithReauth(
      const std::string& device_id, bool* fatal);

  // Ensures every item's content is cached. Returns false on first failure.
  bool EnsureContent(const model::Playlist& playlist, SyncReport& report);
  content::DownloadResult DownloadWithRetry(const model::ContentDescriptor& descriptor);

  std::shared_ptr<IControlPlaneClient> client_;
  std::shared_ptr<content::ContentStore> store_;
  std::shared_ptr<PlaylistSlot> slot_;
  std::shared_ptr<timing::IWaitStrategy> wait_;
  PlaylistSyncConfig config_;

  std::mutex sync_mutex_;    // serializes passes
  std::shared_ptr<const model::Playlist> last_synced_;

  std::mutex fatal_mutex_;
  FatalCallback on_fatal_;

  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> auth_fatal_{false};
  std::atomic<uint64_t> total_fetches_{0};
  std::thread thread_;
};

}  // namespace holohub::sync

#endif  // HOLOHUB_SYNC_PLAYLIST_SYNC_HPP_
