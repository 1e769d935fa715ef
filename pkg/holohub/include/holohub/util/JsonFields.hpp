// Repository: HoloHub-fleet
// Component: Flat JSON field helpers
// Purpose: Writes and reads the single-level JSON records used by the
//          on-disk cache index. Fields are read in the order written.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_UTIL_JSON_FIELDS_HPP_
#define HOLOHUB_UTIL_JSON_FIELDS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace holohub::util {

// Quoted JSON string. Control characters other than \n \r \t become \u00XX.
std::string JsonQuote(const std::string& value);

// Forward-only reader over one flat record. Each lookup starts at the end
// of the previous match, so keys must be requested in record order.
class JsonFieldReader {
 public:
  explicit JsonFieldReader(const std::string& text, size_t start = 0)
      : text_(text), pos_(start) {}

  bool String(const char* key, std::string* out);
  bool Int64(const char* key, int64_t* out);

  // Offset just past the last value read.
  size_t Position() const { return pos_; }

 private:
  // Offset of the value for "key": or npos.
  size_t SeekValue(const char* key) const;

  const std::string& text_;
  size_t pos_;
};

}  // namespace holohub::util

#endif  // HOLOHUB_UTIL_JSON_FIELDS_HPP_
