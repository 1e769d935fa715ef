// Repository: HoloHub-fleet
// Component: Cache Index
// Copyright (c) 2025 HoloHub

#include "holohub/content/CacheIndex.hpp"

#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "holohub/util/JsonFields.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::content {

using util::JsonQuote;
using util::Logger;

namespace {

constexpr const char* kCrcPrefix = "{\"crc32\":";
constexpr const char* kEntryKey = ",\"entry\":";

uint32_t Crc32Of(const std::string& body) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(body.data()),
              static_cast<uInt>(body.size()));
  return static_cast<uint32_t>(crc);
}

std::string EncodeEntryBody(const CacheEntry& e) {
  std::ostringstream o;
  o << "{\"content_id\":" << JsonQuote(e.content_id)
    << ",\"local_path\":" << JsonQuote(e.local_path)
    << ",\"size_bytes\":" << e.size_bytes
    << ",\"content_type\":" << JsonQuote(e.content_type)
    << ",\"sha256\":" << JsonQuote(e.sha256)
    << ",\"downloaded_utc_ms\":" << e.downloaded_utc_ms
    << ",\"last_access_utc_ms\":" << e.last_access_utc_ms
    << "}";
  return o.str();
}

}  // namespace

CacheIndex::CacheIndex(std::string path) : path_(std::move(path)) {}

std::string CacheIndex::EncodeLine(const CacheEntry& entry) {
  const std::string body = EncodeEntryBody(entry);
  std::ostringstream o;
  o << kCrcPrefix << Crc32Of(body) << kEntryKey << body << "}";
  return o.str();
}

bool CacheIndex::DecodeLine(const std::string& line, CacheEntry& out) {
  if (line.compare(0, std::strlen(kCrcPrefix), kCrcPrefix) != 0) return false;
  util::JsonFieldReader header(line);
  int64_t crc = 0;
  if (!header.Int64("crc32", &crc)) return false;
  const size_t pos = header.Position();
  if (line.compare(pos, std::strlen(kEntryKey), kEntryKey) != 0) return false;
  const size_t body_start = pos + std::strlen(kEntryKey);
  if (line.size() < body_start + 2 || line.back() != '}') return false;
  const std::string body = line.substr(body_start, line.size() - body_start - 1);
  if (static_cast<int64_t>(Crc32Of(body)) != crc) return false;

  CacheEntry e;
  util::JsonFieldReader fields(body);
  if (!fields.String("content_id", &e.content_id) ||
      !fields.String("local_path", &e.local_path) ||
      !fields.Int64("size_bytes", &e.size_bytes) ||
      !fields.String("content_type", &e.content_type) ||
      !fields.String("sha256", &e.sha256) ||
      !fields.Int64("downloaded_utc_ms", &e.downloaded_utc_ms) ||
      !fields.Int64("last_access_utc_ms", &e.last_access_utc_ms)) {
    return false;
  }
  if (e.content_id.empty() || e.local_path.empty() || e.size_bytes < 0) return false;
  out = std::move(e);
  return true;
}

std::vector<CacheEntry> CacheIndex::Load(size_t* dropped) const {
  std::vector<CacheEntry> entries;
  size_t bad = 0;
  std::ifstream in(path_);
  if (in) {
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      CacheEntry e;
      if (DecodeLine(line, e)) {
        entries.push_back(std::move(e));
      } else {
        ++bad;
      }
    }
  }
  if (bad > 0) {
    Logger::Warn("[CacheIndex] Dropped " + std::to_string(bad) +
                 " corrupt line(s) from " + path_);
  }
  if (dropped) *dropped = bad;
  return entries;
}

bool CacheIndex::Save(const std::vector<CacheEntry>& entries) const {
  std::string tmp_path =
      path_ + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc);
    if (!of) {
      Logger::Error("[CacheIndex] Cannot open " + tmp_path + ": " +
                    std::strerror(errno));
      return false;
    }
    for (const auto& e : entries) {
      of << EncodeLine(e) << '\n';
    }
    of.flush();
    if (!of) {
      of.close();
      (void)unlink(tmp_path.c_str());
      Logger::Error("[CacheIndex] Write failed for " + tmp_path);
      return false;
    }
    of.close();
  }
  if (rename(tmp_path.c_str(), path_.c_str()) != 0) {
    Logger::Error("[CacheIndex] rename to " + path_ + " failed: " +
                  std::strerror(errno));
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

}  // namespace holohub::content
