// Repository: HoloHub-fleet
// Component: Content Cache Types
// Purpose: Cache entry record, error taxonomy and download result for the
//          device-side content store.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONTENT_CONTENT_TYPES_HPP_
#define HOLOHUB_CONTENT_CONTENT_TYPES_HPP_

#include <cstdint>
#include <functional>
#include <string>

namespace holohub::content {

// =============================================================================
// Error Codes
// =============================================================================

enum class ContentError {
  kNone = 0,

  // Remote object (or assignment) absent: "nothing to do".
  kNotFound,

  // Bytes failed the checksum or the stream was truncated. Never served.
  kIntegrityMismatch,

  // Local storage failure (open/write/rename).
  kIOFailure,

  // Object larger than the whole cache budget.
  kQuotaExceeded,

  // Remote did not answer within the deadline.
  kNetworkTimeout,

  // Credential rejected by the control plane.
  kAuthFailure,

  // Store is draining for shutdown; partial file discarded.
  kCancelled,
};

const char* ContentErrorToString(ContentError error);

// =============================================================================
// Cache Entry
// Invariant: if the file at local_path exists it hashes to sha256.
// =============================================================================

struct CacheEntry {
  std::string content_id;
  std::string local_path;
  int64_t size_bytes = 0;
  std::string content_type;
  std::string sha256;              // lowercase hex
  int64_t downloaded_utc_ms = 0;
  int64_t last_access_utc_ms = 0;
};

struct DownloadResult {
  bool success = false;
  ContentError error = ContentError::kNone;
  std::string detail;
  CacheEntry entry;
  bool fetched = false;            // false when served from cache

  static DownloadResult Success(CacheEntry e, bool was_fetched) {
    DownloadResult r;
    r.success = true;
    r.entry = std::move(e);
    r.fetched = was_fetched;
    return r;
  }
  static DownloadResult Failure(ContentError err, std::string why) {
    DownloadResult r;
    r.error = err;
    r.detail = std::move(why);
    return r;
  }
};

// Progress callback: (bytes_received, bytes_declared). declared may be 0.
using ProgressFn = std::function<void(int64_t, int64_t)>;

}  // namespace holohub::content

#endif  // HOLOHUB_CONTENT_CONTENT_TYPES_HPP_
