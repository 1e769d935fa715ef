// Repository: HoloHub-fleet
// Component: Content Store
// Purpose: Device-side content-addressed cache. Streams remote objects into
//          a temp file while hashing, commits by fsync + rename(), tracks
//          entries in a durable index and evicts least-recently-used entries
//          under a byte budget. Entries being rendered are pinned by leases.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONTENT_CONTENT_STORE_HPP_
#define HOLOHUB_CONTENT_CONTENT_STORE_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "holohub/content/CacheIndex.hpp"
#include "holohub/content/ContentTypes.hpp"
#include "holohub/content/IContentSource.hpp"
#include "holohub/model/PlaylistTypes.hpp"
#include "holohub/timing/ITimeSource.hpp"

namespace holohub::content {

class ContentStore;

// RAII pin on a cache entry. While any lease for an id is alive the entry is
// skipped by EnforceQuota() and its file is not unlinked.
class ContentLease {
 public:
  ContentLease() = default;
  ~ContentLease();

  ContentLease(const ContentLease&) = delete;
  ContentLease& operator=(const ContentLease&) = delete;
  ContentLease(ContentLease&& other) noexcept;
  ContentLease& operator=(ContentLease&& other) noexcept;

  explicit operator bool() const { return store_ != nullptr; }
  const std::string& ContentId() const { return content_id_; }
  const std::string& Path() const { return path_; }

  void Release();

 private:
  friend class ContentStore;
  ContentLease(ContentStore* store, std::string content_id, std::string path);

  ContentStore* store_ = nullptr;
  std::string content_id_;
  std::string path_;
};

struct ContentStoreConfig {
  std::string root_dir;
  int64_t max_bytes = 10LL * 1024 * 1024 * 1024;   // 10 GiB
  std::chrono::milliseconds fetch_deadline{std::chrono::minutes(5)};
  // Access stamps alone reach the index at most this often; commits,
  // removals and eviction are written at once. Zero writes every access.
  std::chrono::milliseconds access_flush_interval{std::chrono::minutes(5)};
};

class ContentStore {
 public:
  // Creates <root>/content and <root>/tmp, removes orphan partial files and
  // verifies every indexed entry against its file.
  // Throws std::runtime_error if the root cannot be created.
  ContentStore(ContentStoreConfig config,
               std::shared_ptr<IContentSource> source,
               std::shared_ptr<timing::ITimeSource> clock);
  ~ContentStore();

  ContentStore(const ContentStore&) = delete;
  ContentStore& operator=(const ContentStore&) = delete;

  bool IsCached(const std::string& content_id) const;

  // Fetches and commits descriptor.content_id. If an entry already exists
  // and matches the expected checksum (when given) no fetch is made.
  DownloadResult Download(const model::ContentDescriptor& descriptor,
                          ProgressFn progress = nullptr);

  // Bumps last_access. nullopt if not cached or the file vanished.
  std::optional<std::string> GetPath(const std::string& content_id);

  // Pins the entry and bumps last_access. Empty lease if not cached.
  ContentLease Acquire(const std::string& content_id);

  // Evicts unpinned entries, least recently accessed first, until
  // TotalBytes() <= budget. Returns the evicted ids in eviction order.
  std::vector<std::string> EnforceQuota();

  // Removes entry and file. If pinned, the file is unlinked when the last
  // lease is released. Returns false if the id was not cached.
  bool Invalidate(const std::string& content_id);

  // Invalidates unpinned entries whose last access is older than max_age_ms.
  size_t CleanupOlderThan(int64_t max_age_ms);

  // Invalidates every unpinned entry.
  size_t PurgeUnpinned();

  // Writes pending access stamps. Also done on destruction.
  bool FlushIndex();

  // Aborts in-flight downloads (they discard their partial file), waits for
  // them to return and refuses further downloads.
  void DrainDownloads();

  int64_t TotalBytes() const;
  int64_t MaxBytes() const { return config_.max_bytes; }
  std::vector<CacheEntry> Entries() const;
  std::optional<CacheEntry> GetEntry(const std::string& content_id) const;
  int PinCount(const std::string& content_id) const;
  const std::string& RootDir() const { return config_.root_dir; }
  std::string ContentDir() const;
  std::string TmpDir() const;

  // File extension for a MIME type (".glb", ".gltf", ".png", "_quilt.mp4",
  // ".bin" otherwise).
  static std::string ExtensionForMime(const std::string& mime_type);

  // Content ids become file names: [A-Za-z0-9._-], not starting with '.'.
  static bool IsSafeContentId(const std::string& content_id);

 private:
  friend class ContentLease;
  void Release(const std::string& content_id);

  DownloadResult FetchAndCommit(const model::ContentDescriptor& descriptor,
                                const ProgressFn& progress);

  void RemoveOrphanPartials();
  void LoadAndVerifyIndex();
  void RemoveUnindexedContent();

  int64_t NextStampLocked();
  void TouchLocked(CacheEntry& entry);
  bool PersistIndexLocked();
  void EraseEntryLocked(std::map<std::string, CacheEntry>::iterator it);
  size_t RemoveUnpinnedLocked(const std::function<bool(const CacheEntry&)>& pred);

  ContentStoreConfig config_;
  std::shared_ptr<IContentSource> source_;
  std::shared_ptr<timing::ITimeSource> clock_;
  CacheIndex index_;

  mutable std::mutex mutex_;
  std::condition_variable download_cv_;
  std::map<std::string, CacheEntry> entries_;
  std::map<std::string, int> pins_;
  std::map<std::string, std::string> deferred_unlinks_;  // id -> path
  std::set<std::string> downloading_;
  int64_t total_bytes_ = 0;
  int64_t last_stamp_ = 0;
  int64_t last_persist_ms_ = 0;
  bool index_dirty_ = false;
  int in_flight_ = 0;
  bool draining_ = false;
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace holohub::content

#endif  // HOLOHUB_CONTENT_CONTENT_STORE_HPP_
