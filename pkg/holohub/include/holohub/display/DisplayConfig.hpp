// Repository: HoloHub-fleet
// Component: Display Configuration
// Purpose: Output geometry for a display and the presets of known hardware.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_DISPLAY_DISPLAY_CONFIG_HPP_
#define HOLOHUB_DISPLAY_DISPLAY_CONFIG_HPP_

#include <string>
#include <vector>

namespace holohub::display {

struct DisplayPreset {
  const char* type;
  const char* display_name;
  int width;
  int height;
  int quilt_views;      // 0 for non-lightfield (LED fan) displays
  int quilt_depth;
  double diagonal_inches;
};

// nullptr for unknown types.
const DisplayPreset* FindDisplayPreset(const std::string& display_type);
std::vector<std::string> KnownDisplayTypes();

struct DisplayConfig {
  std::string display_type = "looking_glass_portrait";
  std::string backend = "simulation";
  int width = 2048;
  int height = 2048;
  int quilt_views = 48;
  int quilt_depth = 45;
  int brightness = 80;

  // Copies geometry from the preset for display_type. Returns false (and
  // leaves the config untouched) for unknown types.
  bool ApplyPreset();
};

}  // namespace holohub::display

#endif  // HOLOHUB_DISPLAY_DISPLAY_CONFIG_HPP_
