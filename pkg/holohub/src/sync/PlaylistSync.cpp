// Repository: HoloHub-fleet
// Component: Playlist Sync
// Copyright (c) 2025 HoloHub

#include "holohub/sync/PlaylistSync.hpp"

#include <set>
#include <sstream>

#include "holohub/util/Logger.hpp"

namespace holohub::sync {

using util::Logger;

const char* SyncOutcomeToString(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::kUnchanged:      return "UNCHANGED";
    case SyncOutcome::kPublished:      return "PUBLISHED";
    case SyncOutcome::kNoAssignment:   return "NO_ASSIGNMENT";
    case SyncOutcome::kFetchFailed:    return "FETCH_FAILED";
    case SyncOutcome::kDownloadFailed: return "DOWNLOAD_FAILED";
    case SyncOutcome::kAuthFatal:      return "AUTH_FATAL";
  }
  return "UNKNOWN";
}

PlaylistSync::PlaylistSync(std::shared_ptr<IControlPlaneClient> client,
                           std::shared_ptr<content::ContentStore> store,
                           std::shared_ptr<PlaylistSlot> slot,
                           std::shared_ptr<timing::IWaitStrategy> wait,
                           PlaylistSyncConfig config)
    : client_(std::move(client)),
      store_(std::move(store)),
      slot_(std::move(slot)),
      wait_(wait ? std::move(wait) : std::make_shared<timing::RealtimeWaitStrategy>()),
      config_(config) {
  if (config_.max_integrity_attempts < 1) config_.max_integrity_attempts = 1;
  if (config_.integrity_backoff_factor < 1) config_.integrity_backoff_factor = 1;
}

PlaylistSync::~PlaylistSync() { Stop(); }

void PlaylistSync::SetFatalCallback(FatalCallback cb) {
  std::lock_guard<std::mutex> lock(fatal_mutex_);
  on_fatal_ = std::move(cb);
}

std::optional<model::Playlist> PlaylistSync::Sync(const std::string& device_id) {
  const SyncReport report = SyncOnce(device_id);
  if (report.outcome != SyncOutcome::kPublished &&
      report.outcome != SyncOutcome::kUnchanged) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(sync_mutex_);
  if (!last_synced_) return std::nullopt;
  return *last_synced_;
}

SyncReport PlaylistSync::SyncOnce(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(sync_mutex_);
  SyncReport report;

  if (auth_fatal_.load(std::memory_order_acquire)) {
    report.outcome = SyncOutcome::kAuthFatal;
    report.detail = "authentication previously failed";
    return report;
  }

  bool fatal = false;
  auto fetched = FetchWithReauth(device_id, &fatal);
  if (fatal) {
    auth_fatal_.store(true, std::memory_order_release);
    report.outcome = SyncOutcome::kAuthFatal;
    report.detail = fetched.detail;
    Logger::Error("[PlaylistSync] Re-authentication failed: " + fetched.detail);
    FatalCallback cb;
    {
      std::lock_guard<std::mutex> fl(fatal_mutex_);
      cb = on_fatal_;
    }
    if (cb) cb(report.detail);
    return report;
  }

  if (!fetched.ok()) {
    report.outcome = fetched.status == ClientStatus::kNotFound ? SyncOutcome::kNoAssignment
                                                               : SyncOutcome::kFetchFailed;
    report.detail = fetched.detail;
    if (fetched.status == ClientStatus::kNotFound) {
      Logger::Info("[PlaylistSync] No assignment for " + device_id);
    } else {
      Logger::Warn(std::string("[PlaylistSync] Assignment fetch failed: ") +
                   ClientStatusToString(fetched.status) + " " + fetched.detail);
    }
    return report;
  }
  if (!fetched.value.has_value()) {
    report.outcome = SyncOutcome::kNoAssignment;
    Logger::Info("[PlaylistSync] No assignment for " + device_id);
    return report;
  }

  auto next = std::make_shared<model::Playlist>(std::move(*fetched.value));
  next->RecomputeDerived();

  const PlaylistDiff diff = DiffPlaylists(last_synced_.get(), *next);
  report.change = diff.change;
  if (!diff.Changed()) {
    report.outcome = SyncOutcome::kUnchanged;
    Logger::Debug("[PlaylistSync] Playlist " + next->id + " unchanged");
    return report;
  }

  {
    std::ostringstream oss;
    oss << "[PlaylistSync] Playlist " << next->id << " changed ("
        << PlaylistChangeToString(diff.change) << ", items=" << next->item_count
        << ", new_content=" << diff.added_content_ids.size() << ")";
    Logger::Info(oss.str());
  }

  if (!EnsureContent(*next, report)) {
    report.outcome = SyncOutcome::kDownloadFailed;
    Logger::Warn("[PlaylistSync] Keeping previous playlist: " + report.detail);
    return report;
  }

  last_synced_ = next;
  slot_->Publish(next);
  report.outcome = SyncOutcome::kPublished;

  // Pin everything the new playlist references while trimming the cache.
  std::vector<content::ContentLease> pins;
  pins.reserve(next->items.size());
  for (const auto& item : next->items) {
    auto lease = store_->Acquire(ContentIdOf(item));
    if (lease) pins.push_back(std::move(lease));
  }
  report.evicted = store_->EnforceQuota();

  Logger::Info("[PlaylistSync] Published " + next->id + " fetched=" +
               std::to_string(report.fetches) + " evicted=" +
               std::to_string(report.evicted.size()));
  return report;
}

ClientResult<std::optional<model::Playlist>> PlaylistSync::FetchWithReauth(
    const std::string& device_id, bool* fatal) {
  *fatal = false;
  auto result = client_->FetchAssignment(device_id);
  if (result.status != ClientStatus::kAuthFailure) return result;

  Logger::Info("[PlaylistSync] Token rejected; re-authenticating");
  auto auth = client_->Authenticate();
  if (auth.status == ClientStatus::kAuthFailure) {
    *fatal = true;
    return ClientResult<std::optional<model::Playlist>>::Fail(
        ClientStatus::kAuthFailure, "credential rejected: " + auth.detail);
  }
  if (!auth.ok()) {
    return ClientResult<std::optional<model::Playlist>>::Fail(auth.status, auth.detail);
  }

  result = client_->FetchAssignment(device_id);
  if (result.status == ClientStatus::kAuthFailure) {
    *fatal = true;
    result.detail = "rejected after re-authentication: " + result.detail;
  }
  return result;
}

bool PlaylistSync::EnsureContent(const model::Playlist& playlist, SyncReport& report) {
  std::set<std::string> seen;
  for (const auto& item : playlist.items) {
    model::ContentDescriptor descriptor = item.content;
    if (descriptor.content_id.empty()) descriptor.content_id = item.asset_id;
    if (!seen.insert(descriptor.content_id).second) continue;

    if (stop_requested_.load(std::memory_order_acquire)) {
      report.detail = "stopping";
      return false;
    }

    content::DownloadResult r = DownloadWithRetry(descriptor);
    if (!r.success) {
      report.detail = descriptor.content_id + ": " +
                      content::ContentErrorToString(r.error) + " " + r.detail;
      return false;
    }
    if (r.fetched) {
      ++report.fetches;
      total_fetches_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  return true;
}

content::DownloadResult PlaylistSync::DownloadWithRetry(
    const model::ContentDescriptor& descriptor) {
  auto backoff = config_.integrity_backoff_initial;
  content::DownloadResult r;
  for (int attempt = 1; attempt <= config_.max_integrity_attempts; ++attempt) {
    r = store_->Download(descriptor);
    if (r.success || r.error != content::ContentError::kIntegrityMismatch) return r;
    if (attempt == config_.max_integrity_attempts) break;

    std::ostringstream oss;
    oss << "[PlaylistSync] Integrity mismatch on " << descriptor.content_id
        << " (attempt " << attempt << "/" << config_.max_integrity_attempts
        << "), retrying in " << backoff.count() << "ms";
    Logger::Warn(oss.str());

    wait_->WaitFor(backoff);
    if (stop_requested_.load(std::memory_order_acquire)) break;
    backoff *= config_.integrity_backoff_factor;
  }
  return r;
}

void PlaylistSync::Start(std::string device_id) {
  if (thread_.joinable()) return;
  stop_requested_.store(false, std::memory_order_release);
  thread_ = std::thread(&PlaylistSync::PollLoop, this, std::move(device_id));
}

void PlaylistSync::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  wait_->Wake();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PlaylistSync::PollLoop(std::string device_id) {
  Logger::Info("[PlaylistSync] Polling every " +
               std::to_string(config_.poll_interval.count()) + "ms");
  while (!stop_requested_.load(std::memory_order_acquire)) {
    const SyncReport report = SyncOnce(device_id);
    if (report.outcome == SyncOutcome::kAuthFatal) break;
    if (stop_requested_.load(std::memory_order_acquire)) break;
    wait_->WaitFor(config_.poll_interval);
  }
  Logger::Info("[PlaylistSync] Poll loop exited");
}

}  // namespace holohub::sync
