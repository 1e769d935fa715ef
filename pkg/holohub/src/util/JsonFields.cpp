// Repository: HoloHub-fleet
// Component: Flat JSON field helpers
// Copyright (c) 2025 HoloHub

#include "holohub/util/JsonFields.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

namespace holohub::util {

namespace {

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string JsonQuote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out += '"';
  for (char c : value) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

size_t JsonFieldReader::SeekValue(const char* key) const {
  const std::string needle = JsonQuote(key) + ":";
  const size_t at = text_.find(needle, pos_);
  return at == std::string::npos ? at : at + needle.size();
}

bool JsonFieldReader::String(const char* key, std::string* out) {
  size_t i = SeekValue(key);
  if (i == std::string::npos || i >= text_.size() || text_[i] != '"') return false;
  std::string value;
  for (++i; i < text_.size(); ++i) {
    const char c = text_[i];
    if (c == '"') {
      *out = std::move(value);
      pos_ = i + 1;
      return true;
    }
    if (c != '\\') {
      value += c;
      continue;
    }
    if (++i >= text_.size()) return false;
    switch (text_[i]) {
      case '"':  value += '"'; break;
      case '\\': value += '\\'; break;
      case '/':  value += '/'; break;
      case 'n':  value += '\n'; break;
      case 'r':  value += '\r'; break;
      case 't':  value += '\t'; break;
      case 'u': {
        if (i + 4 >= text_.size()) return false;
        int code = 0;
        for (size_t k = 1; k <= 4; ++k) {
          const int h = HexValue(text_[i + k]);
          if (h < 0) return false;
          code = code * 16 + h;
        }
        // Only what JsonQuote emits.
        if (code >= 0x80) return false;
        value += static_cast<char>(code);
        i += 4;
        break;
      }
      default:
        return false;
    }
  }
  return false;
}

bool JsonFieldReader::Int64(const char* key, int64_t* out) {
  const size_t start = SeekValue(key);
  if (start == std::string::npos || start >= text_.size()) return false;
  const char first = text_[start];
  if (first != '-' && (first < '0' || first > '9')) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(text_.c_str() + start, &end, 10);
  if (errno != 0 || end == text_.c_str() + start) return false;
  *out = static_cast<int64_t>(v);
  pos_ = static_cast<size_t>(end - text_.c_str());
  return true;
}

}  // namespace holohub::util
