// Repository: HoloHub-fleet
// Component: UUID helpers
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_UTIL_UUID_HPP_
#define HOLOHUB_UTIL_UUID_HPP_

#include <string>

namespace holohub::util {

// Random (version 4) UUID, lowercase canonical form.
std::string GenerateUuidV4();

// True for the 8-4-4-4-12 hex form (either case).
bool IsCanonicalUuid(const std::string& s);

}  // namespace holohub::util

#endif  // HOLOHUB_UTIL_UUID_HPP_
