// Repository: HoloHub-fleet
// Component: Display Backend Interface
// Purpose: The one capability the playback core needs from a holographic
//          display. Hardware SDK backends live outside this repository and
//          register with DisplayBackendRegistry.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_DISPLAY_IDISPLAY_BACKEND_HPP_
#define HOLOHUB_DISPLAY_IDISPLAY_BACKEND_HPP_

#include <string>

#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::display {

// Setting keys the playback loop writes into the item passed to ShowContent.
inline constexpr const char* kSettingTransition = "transition";
inline constexpr const char* kSettingTransitionDurationMs = "transition_duration_ms";

class IDisplayBackend {
 public:
  virtual ~IDisplayBackend() = default;

  virtual const char* Name() const = 0;

  // Returns false if the display cannot be brought up.
  virtual bool Initialize() = 0;

  // Presents the item whose content is at local_path. Returns false on
  // failure; the caller skips the item.
  virtual bool ShowContent(const model::PlaylistItem& item,
                           const std::string& local_path) = 0;

  virtual void Clear() = 0;

  // 0..100; implementations clamp.
  virtual void SetBrightness(int percent) = 0;

  virtual void Shutdown() = 0;
};

}  // namespace holohub::display

#endif  // HOLOHUB_DISPLAY_IDISPLAY_BACKEND_HPP_
