// Repository: HoloHub-fleet
// Component: Display Backend Registry
// Purpose: Name -> factory table used at startup to pick the backend named
//          by DISPLAY_BACKEND. "simulation" is always registered.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_DISPLAY_DISPLAY_BACKEND_REGISTRY_HPP_
#define HOLOHUB_DISPLAY_DISPLAY_BACKEND_REGISTRY_HPP_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "holohub/display/DisplayConfig.hpp"
#include "holohub/display/IDisplayBackend.hpp"

namespace holohub::display {

using BackendFactory =
    std::function<std::unique_ptr<IDisplayBackend>(const DisplayConfig&)>;

class DisplayBackendRegistry {
 public:
  DisplayBackendRegistry();

  // Returns false if the name is taken.
  bool Register(const std::string& name, BackendFactory factory);

  // nullptr for unknown names.
  std::unique_ptr<IDisplayBackend> Create(const std::string& name,
                                          const DisplayConfig& config) const;

  bool Has(const std::string& name) const;
  std::vector<std::string> Names() const;

 private:
  std::map<std::string, BackendFactory> factories_;
};

}  // namespace holohub::display

#endif  // HOLOHUB_DISPLAY_DISPLAY_BACKEND_REGISTRY_HPP_
