// Repository: HoloHub-fleet
// Component: Display Backend Registry
// Copyright (c) 2025 HoloHub

#include "holohub/display/DisplayBackendRegistry.hpp"

#include "holohub/display/SimulationDisplayBackend.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::display {

DisplayBackendRegistry::DisplayBackendRegistry() {
  factories_["simulation"] = [](const DisplayConfig& config) {
    return std::make_unique<SimulationDisplayBackend>(config);
  };
}

bool DisplayBackendRegistry::Register(const std::string& name, BackendFactory factory) {
  if (name.empty() || !factory) return false;
  return factories_.emplace(name, std::move(factory)).second;
}

std::unique_ptr<IDisplayBackend> DisplayBackendRegistry::Create(
    const std::string& name, const DisplayConfig& config) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) {
    util::Logger::Error("[DisplayBackendRegistry] Unknown backend '" + name + "'");
    return nullptr;
  }
  return it->second(config);
}

bool DisplayBackendRegistry::Has(const std::string& name) const {
  return factories_.count(name) > 0;
}

std::vector<std::string> DisplayBackendRegistry::Names() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& kv : factories_) out.push_back(kv.first);
  return out;
}

}  // namespace holohub::display
