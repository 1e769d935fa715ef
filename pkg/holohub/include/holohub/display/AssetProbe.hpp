// Repository: HoloHub-fleet
// Component: Asset Probe
// Purpose: Reads container metadata (duration, frame size) of quilt video
//          assets with libavformat. Without FFmpeg every probe fails.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_DISPLAY_ASSET_PROBE_HPP_
#define HOLOHUB_DISPLAY_ASSET_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace holohub::display {

struct MediaInfo {
  std::string path;
  int64_t duration_ms = 0;
  int width = 0;
  int height = 0;
  int stream_count = 0;
};

class AssetProbe {
 public:
  // True when built with HOLOHUB_FFMPEG_AVAILABLE.
  static bool Available();

  static std::optional<MediaInfo> Probe(const std::string& path);

  // Quilt sequences and plain video go through the probe; models and
  // still quilts do not.
  static bool IsProbeable(const std::string& mime_type);
};

}  // namespace holohub::display

#endif  // HOLOHUB_DISPLAY_ASSET_PROBE_HPP_
