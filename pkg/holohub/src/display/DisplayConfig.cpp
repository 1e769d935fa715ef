// Repository: HoloHub-fleet
// Component: Display Configuration
// Copyright (c) 2025 HoloHub

#include "holohub/display/DisplayConfig.hpp"

#include <iterator>

namespace holohub::display {

namespace {

constexpr DisplayPreset kPresets[] = {
    {"looking_glass_portrait", "Looking Glass Portrait", 2048, 2048, 48, 45, 7.9},
    {"looking_glass_16", "Looking Glass 16 inch", 4096, 4096, 48, 45, 16.0},
    {"looking_glass_32", "Looking Glass 32 inch", 8192, 8192, 48, 45, 32.0},
    {"looking_glass_65", "Looking Glass 65 inch", 8192, 8192, 48, 45, 65.0},
    {"hypervsn_solo", "Hypervsn Solo", 1920, 1080, 0, 0, 21.5},
};

}  // namespace

const DisplayPreset* FindDisplayPreset(const std::string& display_type) {
  for (const auto& p : kPresets) {
    if (display_type == p.type) return &p;
  }
  return nullptr;
}

std::vector<std::string> KnownDisplayTypes() {
  std::vector<std::string> out;
  out.reserve(std::size(kPresets));
  for (const auto& p : kPresets) out.emplace_back(p.type);
  return out;
}

bool DisplayConfig::ApplyPreset() {
  const DisplayPreset* preset = FindDisplayPreset(display_type);
  if (!preset) return false;
  width = preset->width;
  height = preset->height;
  quilt_views = preset->quilt_views;
  quilt_depth = preset->quilt_depth;
  return true;
}

}  // namespace holohub::display
