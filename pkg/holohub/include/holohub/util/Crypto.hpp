// Repository: HoloHub-fleet
// Component: Crypto Helpers
// Purpose: Incremental SHA-256 (content integrity, credential hashing) and
//          random bearer tokens, backed by OpenSSL.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_UTIL_CRYPTO_HPP_
#define HOLOHUB_UTIL_CRYPTO_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

struct evp_md_ctx_st;

namespace holohub::util {

// Streaming SHA-256. Update() any number of times, then FinalHex() once.
class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void Update(const uint8_t* data, size_t len);
  void Update(const std::string& data);

  // Lowercase hex digest (64 chars). Further Update() calls are rejected.
  std::string FinalHex();

  static std::string HexOf(const std::string& data);

  // Hashes a file in 64 KiB chunks; nullopt if it cannot be read.
  static std::optional<std::string> HexOfFile(const std::string& path);

 private:
  evp_md_ctx_st* ctx_;
  bool finalized_ = false;
};

// Random token of `bytes` bytes, hex encoded (2 * bytes chars).
std::string RandomHexToken(size_t bytes);

// Constant-time comparison for digests/tokens.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

}  // namespace holohub::util

#endif  // HOLOHUB_UTIL_CRYPTO_HPP_
