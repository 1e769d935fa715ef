// Repository: HoloHub-fleet
// Component: Content Store
// Copyright (c) 2025 HoloHub

#include "holohub/content/ContentStore.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

#include "holohub/util/Crypto.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::content {

namespace fs = std::filesystem;
using util::Logger;

namespace {

std::string ToLower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool FileSize(const std::string& path, int64_t* size) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
  *size = static_cast<int64_t>(st.st_size);
  return true;
}

void UnlinkQuietly(const std::string& path) {
  if (unlink(path.c_str()) != 0 && errno != ENOENT) {
    Logger::Warn("[ContentStore] unlink " + path + " failed: " + std::strerror(errno));
  }
}

}  // namespace

// =============================================================================
// ContentLease
// =============================================================================

ContentLease::ContentLease(ContentStore* store, std::string content_id,
                           std::string path)
    : store_(store), content_id_(std::move(content_id)), path_(std::move(path)) {}

ContentLease::~ContentLease() { Release(); }

ContentLease::ContentLease(ContentLease&& other) noexcept
    : store_(other.store_),
      content_id_(std::move(other.content_id_)),
      path_(std::move(other.path_)) {
  other.store_ = nullptr;
}

ContentLease& ContentLease::operator=(ContentLease&& other) noexcept {
  if (this != &other) {
    Release();
    store_ = other.store_;
    content_id_ = std::move(other.content_id_);
    path_ = std::move(other.path_);
    other.store_ = nullptr;
  }
  return *this;
}

void ContentLease::Release() {
  if (store_) {
    store_->Release(content_id_);
    store_ = nullptr;
  }
}

// =============================================================================
// ContentStore
// =============================================================================

ContentStore::ContentStore(ContentStoreConfig config,
                           std::shared_ptr<IContentSource> source,
                           std::shared_ptr<timing::ITimeSource> clock)
    : config_(std::move(config)),
      source_(std::move(source)),
      clock_(std::move(clock)),
      index_(config_.root_dir + "/" + CacheIndex::kFileName) {
  if (config_.root_dir.empty()) {
    throw std::runtime_error("ContentStore: root directory is empty");
  }
  if (!source_ || !clock_) {
    throw std::runtime_error("ContentStore: source and clock are required");
  }
  for (const std::string& dir : {ContentDir(), TmpDir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("ContentStore: cannot create " + dir + ": " +
                               ec.message());
    }
  }

  RemoveOrphanPartials();
  LoadAndVerifyIndex();
  RemoveUnindexedContent();

  Logger::Info("[ContentStore] Ready at " + config_.root_dir + " entries=" +
               std::to_string(entries_.size()) + " bytes=" +
               std::to_string(total_bytes_) + "/" +
               std::to_string(config_.max_bytes));
}

ContentStore::~ContentStore() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index_dirty_) PersistIndexLocked();
  if (!pins_.empty()) {
    Logger::Warn("[ContentStore] Destroyed with " + std::to_string(pins_.size()) +
                 " pinned entr(ies) outstanding");
  }
}

std::string ContentStore::ContentDir() const { return config_.root_dir + "/content"; }
std::string ContentStore::TmpDir() const { return config_.root_dir + "/tmp"; }

std::string ContentStore::ExtensionForMime(const std::string& mime_type) {
  if (mime_type == "model/glb") return ".glb";
  if (mime_type == "model/gltf" || mime_type == "model/gltf+json") return ".gltf";
  if (mime_type == "quilt/png" || mime_type == "image/png") return ".png";
  if (mime_type == "quilt/sequence" || mime_type == "video/mp4") return "_quilt.mp4";
  return ".bin";
}

bool ContentStore::IsSafeContentId(const std::string& content_id) {
  if (content_id.empty() || content_id.size() > 128 || content_id[0] == '.') {
    return false;
  }
  for (char c : content_id) {
    const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
                    c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// Startup
// -----------------------------------------------------------------------------

void ContentStore::RemoveOrphanPartials() {
  std::error_code ec;
  size_t removed = 0;
  for (fs::directory_iterator it(TmpDir(), ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.find(".part.") == std::string::npos) continue;
    UnlinkQuietly(it->path().string());
    ++removed;
  }
  if (removed > 0) {
    Logger::Info("[ContentStore] Removed " + std::to_string(removed) +
                 " orphan partial download(s)");
  }
}

void ContentStore::LoadAndVerifyIndex() {
  size_t dropped = 0;
  std::vector<CacheEntry> loaded = index_.Load(&dropped);
  for (auto& e : loaded) {
    int64_t on_disk = 0;
    if (!IsSafeContentId(e.content_id) || entries_.count(e.content_id) > 0) {
      ++dropped;
      continue;
    }
    if (!FileSize(e.local_path, &on_disk)) {
      Logger::Warn("[ContentStore] Dropping " + e.content_id + ": file missing");
      ++dropped;
      continue;
    }
    if (on_disk != e.size_bytes) {
      Logger::Warn("[ContentStore] Dropping " + e.content_id + ": size " +
                   std::to_string(on_disk) + " != " + std::to_string(e.size_bytes));
      UnlinkQuietly(e.local_path);
      ++dropped;
      continue;
    }
    std::optional<std::string> digest = util::Sha256::HexOfFile(e.local_path);
    if (!digest || *digest != e.sha256) {
      Logger::Warn("[ContentStore] Dropping " + e.content_id + ": checksum mismatch");
      UnlinkQuietly(e.local_path);
      ++dropped;
      continue;
    }
    last_stamp_ = std::max({last_stamp_, e.last_access_utc_ms, e.downloaded_utc_ms});
    total_bytes_ += e.size_bytes;
    entries_.emplace(e.content_id, std::move(e));
  }
  if (dropped > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    PersistIndexLocked();
  }
}

void ContentStore::RemoveUnindexedContent() {
  std::set<std::string> referenced;
  for (const auto& kv : entries_) {
    referenced.insert(fs::path(kv.second.local_path).filename().string());
  }
  std::error_code ec;
  for (fs::directory_iterator it(ContentDir(), ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (referenced.count(name) > 0) continue;
    Logger::Info("[ContentStore] Removing unindexed file " + name);
    UnlinkQuietly(it->path().string());
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------

bool ContentStore::IsCached(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(content_id) > 0;
}

int64_t ContentStore::TotalBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_bytes_;
}

std::vector<CacheEntry> ContentStore::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CacheEntry> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.push_back(kv.second);
  return out;
}

std::optional<CacheEntry> ContentStore::GetEntry(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(content_id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

int ContentStore::PinCount(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pins_.find(content_id);
  return it == pins_.end() ? 0 : it->second;
}

// -----------------------------------------------------------------------------
// Download
// -----------------------------------------------------------------------------

DownloadResult ContentStore::Download(const model::ContentDescriptor& descriptor,
                                      ProgressFn progress) {
  const std::string& id = descriptor.content_id;
  if (!IsSafeContentId(id)) {
    return DownloadResult::Failure(ContentError::kNotFound,
                                   "invalid content id '" + id + "'");
  }
  if (descriptor.declared_size > config_.max_bytes) {
    return DownloadResult::Failure(
        ContentError::kQuotaExceeded,
        id + " declares " + std::to_string(descriptor.declared_size) +
            " bytes, budget is " + std::to_string(config_.max_bytes));
  }

  const std::string expected = ToLower(descriptor.expected_sha256);
  {
    std::unique_lock<std::mutex> lock(mutex_);
    download_cv_.wait(lock, [&] { return draining_ || downloading_.count(id) == 0; });
    if (draining_) {
      return DownloadResult::Failure(ContentError::kCancelled, "store is draining");
    }
    auto it = entries_.find(id);
    if (it != entries_.end() && (expected.empty() || it->second.sha256 == expected)) {
      return DownloadResult::Success(it->second, false);
    }
    downloading_.insert(id);
    ++in_flight_;
  }

  DownloadResult result = FetchAndCommit(descriptor, progress);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    downloading_.erase(id);
    --in_flight_;
  }
  download_cv_.notify_all();

  if (!result.success) {
    Logger::Warn("[ContentStore] Download " + id + " failed: " +
                 ContentErrorToString(result.error) + " (" + result.detail + ")");
  }
  return result;
}

DownloadResult ContentStore::FetchAndCommit(const model::ContentDescriptor& descriptor,
                                            const ProgressFn& progress) {
  const std::string& id = descriptor.content_id;
  const int64_t declared = descriptor.declared_size;
  const std::string tmp_path = TmpDir() + "/" + id + ".part." +
                               std::to_string(static_cast<unsigned long>(getpid()));

  util::Sha256 hasher;
  int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return DownloadResult::Failure(ContentError::kIOFailure,
                                   "open " + tmp_path + ": " + std::strerror(errno));
  }

  int64_t received = 0;
  bool write_failed = false;
  bool oversize = false;
  bool cancelled = false;
  ChunkSink sink = [&](const uint8_t* data, size_t len) -> bool {
    if (cancel_requested_.load(std::memory_order_acquire)) {
      cancelled = true;
      return false;
    }
    if (declared > 0 && received + static_cast<int64_t>(len) > declared) {
      oversize = true;
      return false;
    }
    size_t off = 0;
    while (off < len) {
      ssize_t n = write(fd, data + off, len - off);
      if (n < 0) {
        if (errno == EINTR) continue;
        write_failed = true;
        return false;
      }
      off += static_cast<size_t>(n);
    }
    hasher.Update(data, len);
    received += static_cast<int64_t>(len);
    if (progress) progress(received, declared);
    return true;
  };

  const ContentError fetch_error = source_->Fetch(descriptor, sink, config_.fetch_deadline);

  auto discard = [&](ContentError err, const std::string& why) {
    if (fd >= 0) close(fd);
    UnlinkQuietly(tmp_path);
    return DownloadResult::Failure(err, why);
  };

  if (cancelled) return discard(ContentError::kCancelled, "cancelled by drain");
  if (write_failed) return discard(ContentError::kIOFailure, "write to " + tmp_path + " failed");
  if (oversize) {
    return discard(ContentError::kIntegrityMismatch,
                   "stream exceeds declared size " + std::to_string(declared));
  }
  if (fetch_error != ContentError::kNone) {
    return discard(fetch_error, "fetch failed after " + std::to_string(received) + " bytes");
  }
  if (declared > 0 && received != declared) {
    return discard(ContentError::kIntegrityMismatch,
                   "truncated: " + std::to_string(received) + " of " +
                       std::to_string(declared) + " bytes");
  }
  if (fsync(fd) != 0) {
    return discard(ContentError::kIOFailure, std::string("fsync: ") + std::strerror(errno));
  }
  if (close(fd) != 0) {
    fd = -1;
    return discard(ContentError::kIOFailure, std::string("close: ") + std::strerror(errno));
  }
  fd = -1;

  const std::string digest = hasher.FinalHex();
  const std::string expected = ToLower(descriptor.expected_sha256);
  if (!expected.empty() && digest != expected) {
    return discard(ContentError::kIntegrityMismatch,
                   "sha256 " + digest + " != expected " + expected);
  }

  const std::string final_path = ContentDir() + "/" + id + ExtensionForMime(descriptor.mime_type);
  if (rename(tmp_path.c_str(), final_path.c_str()) != 0) {
    return discard(ContentError::kIOFailure,
                   "rename to " + final_path + ": " + std::strerror(errno));
  }

  CacheEntry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto old = entries_.find(id);
    if (old != entries_.end()) {
      const std::string old_path = old->second.local_path;
      EraseEntryLocked(old);
      if (old_path != final_path) {
        if (pins_.count(id) > 0) {
          deferred_unlinks_[id] = old_path;
        } else {
          UnlinkQuietly(old_path);
        }
      }
    }
    auto deferred = deferred_unlinks_.find(id);
    if (deferred != deferred_unlinks_.end() && deferred->second == final_path) {
      deferred_unlinks_.erase(deferred);
    }

    entry.content_id = id;
    entry.local_path = final_path;
    entry.size_bytes = received;
    entry.content_type = descriptor.mime_type;
    entry.sha256 = digest;
    entry.downloaded_utc_ms = NextStampLocked();
    entry.last_access_utc_ms = entry.downloaded_utc_ms;
    entries_[id] = entry;
    total_bytes_ += received;
    PersistIndexLocked();
  }

  Logger::Info("[ContentStore] Committed " + id + " (" + std::to_string(received) +
               " bytes, sha256=" + digest.substr(0, 12) + ")");
  return DownloadResult::Success(std::move(entry), true);
}

// -----------------------------------------------------------------------------
// Access / pinning
// -----------------------------------------------------------------------------

std::optional<std::string> ContentStore::GetPath(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(content_id);
  if (it == entries_.end()) return std::nullopt;
  int64_t size = 0;
  if (!FileSize(it->second.local_path, &size)) {
    Logger::Warn("[ContentStore] " + content_id + " vanished from disk");
    EraseEntryLocked(it);
    PersistIndexLocked();
    return std::nullopt;
  }
  TouchLocked(it->second);
  return it->second.local_path;
}

ContentLease ContentStore::Acquire(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(content_id);
  if (it == entries_.end()) return ContentLease();
  int64_t size = 0;
  if (!FileSize(it->second.local_path, &size)) {
    Logger::Warn("[ContentStore] " + content_id + " vanished from disk");
    EraseEntryLocked(it);
    PersistIndexLocked();
    return ContentLease();
  }
  TouchLocked(it->second);
  ++pins_[content_id];
  return ContentLease(this, content_id, it->second.local_path);
}

void ContentStore::Release(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto pin = pins_.find(content_id);
  if (pin == pins_.end()) return;
  if (--pin->second > 0) return;
  pins_.erase(pin);
  auto deferred = deferred_unlinks_.find(content_id);
  if (deferred != deferred_unlinks_.end()) {
    Logger::Debug("[ContentStore] Deferred removal of " + content_id);
    UnlinkQuietly(deferred->second);
    deferred_unlinks_.erase(deferred);
  }
}

// -----------------------------------------------------------------------------
// Eviction
// -----------------------------------------------------------------------------

std::vector<std::string> ContentStore::EnforceQuota() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> evicted;
  if (total_bytes_ <= config_.max_bytes) return evicted;

  std::vector<const CacheEntry*> candidates;
  for (const auto& kv : entries_) {
    if (pins_.count(kv.first) == 0) candidates.push_back(&kv.second);
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const CacheEntry* a, const CacheEntry* b) {
              if (a->last_access_utc_ms != b->last_access_utc_ms)
                return a->last_access_utc_ms < b->last_access_utc_ms;
              if (a->downloaded_utc_ms != b->downloaded_utc_ms)
                return a->downloaded_utc_ms < b->downloaded_utc_ms;
              return a->content_id < b->content_id;
            });

  std::vector<std::string> victims;
  int64_t projected = total_bytes_;
  for (const CacheEntry* e : candidates) {
    if (projected <= config_.max_bytes) break;
    projected -= e->size_bytes;
    victims.push_back(e->content_id);
  }

  for (const auto& id : victims) {
    auto it = entries_.find(id);
    const std::string path = it->second.local_path;
    EraseEntryLocked(it);
    UnlinkQuietly(path);
    evicted.push_back(id);
    Logger::Info("[ContentStore] Evicted " + id);
  }
  if (!evicted.empty()) PersistIndexLocked();

  if (total_bytes_ > config_.max_bytes) {
    Logger::Warn("[ContentStore] Over budget by " +
                 std::to_string(total_bytes_ - config_.max_bytes) +
                 " bytes held by pinned entries");
  }
  return evicted;
}

bool ContentStore::Invalidate(const std::string& content_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(content_id);
  if (it == entries_.end()) return false;
  const std::string path = it->second.local_path;
  EraseEntryLocked(it);
  if (pins_.count(content_id) > 0) {
    deferred_unlinks_[content_id] = path;
  } else {
    UnlinkQuietly(path);
  }
  PersistIndexLocked();
  Logger::Info("[ContentStore] Invalidated " + content_id);
  return true;
}

size_t ContentStore::CleanupOlderThan(int64_t max_age_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = clock_->NowUtcMs();
  const size_t removed = RemoveUnpinnedLocked(
      [&](const CacheEntry& e) { return now - e.last_access_utc_ms > max_age_ms; });
  if (removed > 0) {
    Logger::Info("[ContentStore] Age cleanup removed " + std::to_string(removed) +
                 " entr(ies)");
  }
  return removed;
}

size_t ContentStore::PurgeUnpinned() {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t removed = RemoveUnpinnedLocked([](const CacheEntry&) { return true; });
  Logger::Info("[ContentStore] Purged " + std::to_string(removed) + " entr(ies)");
  return removed;
}

size_t ContentStore::RemoveUnpinnedLocked(const std::function<bool(const CacheEntry&)>& pred) {
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto current = it++;
    if (pins_.count(current->first) > 0) continue;
    if (!pred(current->second)) continue;
    const std::string path = current->second.local_path;
    EraseEntryLocked(current);
    UnlinkQuietly(path);
    ++removed;
  }
  if (removed > 0) PersistIndexLocked();
  return removed;
}

void ContentStore::DrainDownloads() {
  std::unique_lock<std::mutex> lock(mutex_);
  draining_ = true;
  cancel_requested_.store(true, std::memory_order_release);
  download_cv_.notify_all();
  download_cv_.wait(lock, [this] { return in_flight_ == 0; });
  Logger::Info("[ContentStore] Downloads drained");
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

int64_t ContentStore::NextStampLocked() {
  last_stamp_ = std::max(clock_->NowUtcMs(), last_stamp_ + 1);
  return last_stamp_;
}

void ContentStore::TouchLocked(CacheEntry& entry) {
  entry.last_access_utc_ms = NextStampLocked();
  index_dirty_ = true;
  if (clock_->NowUtcMs() - last_persist_ms_ >= config_.access_flush_interval.count()) {
    PersistIndexLocked();
  }
}

bool ContentStore::FlushIndex() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!index_dirty_) return true;
  return PersistIndexLocked();
}

bool ContentStore::PersistIndexLocked() {
  std::vector<CacheEntry> snapshot;
  snapshot.reserve(entries_.size());
  for (const auto& kv : entries_) snapshot.push_back(kv.second);
  if (!index_.Save(snapshot)) {
    Logger::Warn("[ContentStore] Index persist failed; in-memory state kept");
    index_dirty_ = true;
    return false;
  }
  index_dirty_ = false;
  last_persist_ms_ = clock_->NowUtcMs();
  return true;
}

void ContentStore::EraseEntryLocked(std::map<std::string, CacheEntry>::iterator it) {
  total_bytes_ -= it->second.size_bytes;
  entries_.erase(it);
}

}  // namespace holohub::content
