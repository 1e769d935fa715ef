// Repository: HoloHub-fleet
// Component: Simulation Display Backend
// Purpose: Headless backend for development and CI. Validates the content
//          file, probes quilt video when FFmpeg is present and logs what a
//          real display would show.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_DISPLAY_SIMULATION_DISPLAY_BACKEND_HPP_
#define HOLOHUB_DISPLAY_SIMULATION_DISPLAY_BACKEND_HPP_

#include <cstdint>
#include <mutex>
#include <string>

#include "holohub/display/DisplayConfig.hpp"
#include "holohub/display/IDisplayBackend.hpp"

namespace holohub::display {

class SimulationDisplayBackend : public IDisplayBackend {
 public:
  explicit SimulationDisplayBackend(DisplayConfig config);

  const char* Name() const override { return "simulation"; }
  bool Initialize() override;
  bool ShowContent(const model::PlaylistItem& item,
                   const std::string& local_path) override;
  void Clear() override;
  void SetBrightness(int percent) override;
  void Shutdown() override;

  // Introspection for tests and diagnostics.
  int Brightness() const;
  std::string CurrentAssetId() const;
  uint64_t FramesShown() const;
  bool IsInitialized() const;

 private:
  mutable std::mutex mutex_;
  DisplayConfig config_;
  bool initialized_ = false;
  std::string current_asset_id_;
  uint64_t frames_shown_ = 0;
};

}  // namespace holohub::display

#endif  // HOLOHUB_DISPLAY_SIMULATION_DISPLAY_BACKEND_HPP_
