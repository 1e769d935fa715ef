// Repository: HoloHub-fleet
// Component: Cache Index
// Purpose: Durable index of cache entries, stored beside the content files.
//          One JSON object per line, each line carrying a CRC32 of its entry
//          body so torn or hand-edited lines are detected on load.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONTENT_CACHE_INDEX_HPP_
#define HOLOHUB_CONTENT_CACHE_INDEX_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "holohub/content/ContentTypes.hpp"

namespace holohub::content {

class CacheIndex {
 public:
  static constexpr const char* kFileName = "cache_index.jsonl";

  explicit CacheIndex(std::string path);

  // Reads all valid lines. Lines failing CRC or parse are skipped and
  // counted in *dropped (if non-null). Missing file yields an empty index.
  std::vector<CacheEntry> Load(size_t* dropped = nullptr) const;

  // Rewrites the index via tmp file + rename(). Returns false on any I/O
  // failure; the previous index file is then left untouched.
  bool Save(const std::vector<CacheEntry>& entries) const;

  const std::string& Path() const { return path_; }

  // Single-line encoding (exposed for tests).
  static std::string EncodeLine(const CacheEntry& entry);
  static bool DecodeLine(const std::string& line, CacheEntry& out);

 private:
  std::string path_;
};

}  // namespace holohub::content

#endif  // HOLOHUB_CONTENT_CACHE_INDEX_HPP_
