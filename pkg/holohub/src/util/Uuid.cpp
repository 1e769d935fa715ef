// Repository: HoloHub-fleet
// Component: UUID helpers
// Copyright (c) 2025 HoloHub

#include "holohub/util/Uuid.hpp"

#include <cctype>
#include <random>

namespace holohub::util {

std::string GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

bool IsCanonicalUuid(const std::string& s) {
  if (s.size() != 36) return false;
  for (size_t i = 0; i < s.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (s[i] != '-') return false;
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

}  // namespace holohub::util
