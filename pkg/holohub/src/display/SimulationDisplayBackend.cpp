// Repository: HoloHub-fleet
// Component: Simulation Display Backend
// Copyright (c) 2025 HoloHub

#include "holohub/display/SimulationDisplayBackend.hpp"

#include <algorithm>
#include <sys/stat.h>

#include "holohub/display/AssetProbe.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::display {

using util::Logger;

SimulationDisplayBackend::SimulationDisplayBackend(DisplayConfig config)
    : config_(std::move(config)) {
  config_.brightness = std::clamp(config_.brightness, 0, 100);
}

bool SimulationDisplayBackend::Initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  initialized_ = true;
  Logger::Info("[SimulationDisplay] Initialized " + config_.display_type + " " +
               std::to_string(config_.width) + "x" + std::to_string(config_.height) +
               " quilt=" + std::to_string(config_.quilt_views) + "/" +
               std::to_string(config_.quilt_depth) +
               " brightness=" + std::to_string(config_.brightness) + "%");
  return true;
}

bool SimulationDisplayBackend::ShowContent(const model::PlaylistItem& item,
                                           const std::string& local_path) {
  struct stat st;
  if (stat(local_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    Logger::Warn("[SimulationDisplay] Content file missing: " + local_path);
    return false;
  }

  if (AssetProbe::IsProbeable(item.content.mime_type) && AssetProbe::Available()) {
    if (!AssetProbe::Probe(local_path)) {
      Logger::Warn("[SimulationDisplay] Unplayable quilt video for " + item.asset_id);
      return false;
    }
  }

  std::string transition = "-";
  auto t = item.custom_settings.find(kSettingTransition);
  if (t != item.custom_settings.end()) transition = t->second;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    Logger::Warn("[SimulationDisplay] ShowContent before Initialize");
    return false;
  }
  current_asset_id_ = item.asset_id;
  ++frames_shown_;
  Logger::Info("[SimulationDisplay] Showing " + item.asset_id + " (" +
               item.content.mime_type + ", " + std::to_string(st.st_size) +
               " bytes, transition=" + transition + ")");
  return true;
}

void SimulationDisplayBackend::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_asset_id_.clear();
  Logger::Debug("[SimulationDisplay] Cleared");
}

void SimulationDisplayBackend::SetBrightness(int percent) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.brightness = std::clamp(percent, 0, 100);
  Logger::Info("[SimulationDisplay] Brightness " + std::to_string(config_.brightness) + "%");
}

void SimulationDisplayBackend::Shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) return;
  initialized_ = false;
  current_asset_id_.clear();
  Logger::Info("[SimulationDisplay] Shut down after " + std::to_string(frames_shown_) +
               " item(s)");
}

int SimulationDisplayBackend::Brightness() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_.brightness;
}

std::string SimulationDisplayBackend::CurrentAssetId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_asset_id_;
}

uint64_t SimulationDisplayBackend::FramesShown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_shown_;
}

bool SimulationDisplayBackend::IsInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

}  // namespace holohub::display
