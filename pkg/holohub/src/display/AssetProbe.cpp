// Repository: HoloHub-fleet
// Component: Asset Probe
// Copyright (c) 2025 HoloHub

#include "holohub/display/AssetProbe.hpp"

#include <chrono>

#ifdef HOLOHUB_FFMPEG_AVAILABLE
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}
#endif

#include "holohub/util/Logger.hpp"

namespace holohub::display {

using util::Logger;

bool AssetProbe::Available() {
#ifdef HOLOHUB_FFMPEG_AVAILABLE
  return true;
#else
  return false;
#endif
}

bool AssetProbe::IsProbeable(const std::string& mime_type) {
  return mime_type == "quilt/sequence" || mime_type.rfind("video/", 0) == 0;
}

std::optional<MediaInfo> AssetProbe::Probe(const std::string& path) {
#ifdef HOLOHUB_FFMPEG_AVAILABLE
  AVFormatContext* fmt_ctx = nullptr;

  auto open_start = std::chrono::steady_clock::now();
  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    Logger::Warn("[AssetProbe] Failed to open: " + path);
    return std::nullopt;
  }
  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    Logger::Warn("[AssetProbe] Failed to find stream info: " + path);
    return std::nullopt;
  }
  auto probe_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - open_start).count();

  MediaInfo info;
  info.path = path;
  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    info.duration_ms = fmt_ctx->duration / 1000;  // AV_TIME_BASE is microseconds
  }
  info.stream_count = static_cast<int>(fmt_ctx->nb_streams);
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVCodecParameters* par = fmt_ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      info.width = par->width;
      info.height = par->height;
      break;
    }
  }
  avformat_close_input(&fmt_ctx);

  Logger::Debug("[AssetProbe] Probed " + path + " (" +
                std::to_string(info.duration_ms) + "ms, " +
                std::to_string(info.width) + "x" + std::to_string(info.height) +
                ") in " + std::to_string(probe_ms) + "ms");
  return info;
#else
  (void)path;
  Logger::Debug("[AssetProbe] FFmpeg not available");
  return std::nullopt;
#endif
}

}  // namespace holohub::display
