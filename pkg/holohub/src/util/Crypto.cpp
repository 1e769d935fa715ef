// Repository: HoloHub-fleet
// Component: Crypto Helpers
// Copyright (c) 2025 HoloHub

#include "holohub/util/Crypto.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace holohub::util {

namespace {

constexpr size_t kFileChunkBytes = 64 * 1024;

std::string ToHex(const unsigned char* data, size_t len) {
  static const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += hexdig[(data[i] >> 4) & 0x0F];
    out += hexdig[data[i] & 0x0F];
  }
  return out;
}

}  // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (ctx_ == nullptr) {
    throw std::runtime_error("Sha256: EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("Sha256: EVP_DigestInit_ex failed");
  }
}

Sha256::~Sha256() {
  EVP_MD_CTX_free(ctx_);
}

void Sha256::Update(const uint8_t* data, size_t len) {
  if (finalized_) {
    throw std::logic_error("Sha256: Update after FinalHex");
  }
  if (len == 0) return;
  if (EVP_DigestUpdate(ctx_, data, len) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestUpdate failed");
  }
}

void Sha256::Update(const std::string& data) {
  Update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string Sha256::FinalHex() {
  if (finalized_) {
    throw std::logic_error("Sha256: FinalHex called twice");
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_, digest, &digest_len) != 1) {
    throw std::runtime_error("Sha256: EVP_DigestFinal_ex failed");
  }
  finalized_ = true;
  return ToHex(digest, digest_len);
}

std::string Sha256::HexOf(const std::string& data) {
  Sha256 h;
  h.Update(data);
  return h.FinalHex();
}

std::optional<std::string> Sha256::HexOfFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  Sha256 h;
  std::vector<char> buf(kFileChunkBytes);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in.gcount();
    if (got > 0) {
      h.Update(reinterpret_cast<const uint8_t*>(buf.data()), static_cast<size_t>(got));
    }
  }
  if (in.bad()) return std::nullopt;
  return h.FinalHex();
}

std::string RandomHexToken(size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RandomHexToken: RAND_bytes failed");
  }
  return ToHex(buf.data(), buf.size());
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace holohub::util
