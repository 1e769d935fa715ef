// Repository: HoloHub-fleet
// Component: Device daemon
// Purpose: Runs one display device against a control plane until SIGINT or
//          SIGTERM, or until its credential is rejected.
// Copyright (c) 2025 HoloHub

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "holohub/agent/DeviceAgent.hpp"
#include "holohub/config/DeviceConfig.hpp"
#include "holohub/display/DisplayConfig.hpp"
#include "holohub/util/Logger.hpp"
#include "rpc/GrpcControlPlaneClient.hpp"

namespace {

using holohub::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  std::string hardware_id;
  std::string device_secret;
  std::string api_url;
  std::string cache_dir;
  bool production = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "HoloHub display device agent.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH         KEY=VALUE settings file (environment overrides it)\n"
            << "  --hardware-id ID      Device hardware id (MAC or 64-hex hash)\n"
            << "  --device-secret S     Device secret (16+ characters)\n"
            << "  --api-url HOST:PORT   Control plane address\n"
            << "  --cache-dir PATH      Content cache directory\n"
            << "  --production          Use the configured display backend, not simulation\n"
            << "  --help                Show this help message\n"
            << "\n"
            << "Known display types:";
  for (const auto& type : holohub::display::KnownDisplayTypes()) std::cerr << " " << type;
  std::cerr << "\n\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--hardware-id" && i + 1 < argc) {
      args.hardware_id = argv[++i];
    } else if (arg == "--device-secret" && i + 1 < argc) {
      args.device_secret = argv[++i];
    } else if (arg == "--api-url" && i + 1 < argc) {
      args.api_url = argv[++i];
    } else if (arg == "--cache-dir" && i + 1 < argc) {
      args.cache_dir = argv[++i];
    } else if (arg == "--production") {
      args.production = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  std::vector<std::string> problems;
  holohub::config::DeviceConfig config =
      holohub::config::LoadDeviceConfig(args.config_path, holohub::config::ProcessEnv(), &problems);
  if (!args.hardware_id.empty()) config.hardware_id = args.hardware_id;
  if (!args.device_secret.empty()) config.device_secret = args.device_secret;
  if (!args.api_url.empty()) config.api_base_url = args.api_url;
  if (!args.cache_dir.empty()) config.content_cache_dir = args.cache_dir;
  if (args.production) {
    config.production = true;
    config.simulation_mode = false;
  }

  for (const auto& p : config.Validate()) problems.push_back(p);
  if (!problems.empty()) {
    for (const auto& p : problems) Logger::Error("[Config] " + p);
    return 2;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  holohub::rpc::ControlPlaneClientOptions client_options;
  client_options.target_address = config.api_base_url;
  client_options.hardware_id = config.hardware_id;
  client_options.device_secret = config.device_secret;
  client_options.call_timeout = std::chrono::seconds(config.api_timeout_sec);
  auto client = std::make_shared<holohub::rpc::GrpcControlPlaneClient>(client_options);

  holohub::agent::AgentDependencies deps;
  deps.client = client;
  deps.content_source = client;

  holohub::agent::DeviceAgent agent(config, deps);
  auto started = agent.Start();
  if (!started.success) {
    Logger::Error(std::string("[Device] Startup failed: ") +
                  holohub::agent::AgentErrorToString(started.error) + ": " + started.detail);
    return 3;
  }

  while (!g_termination_requested.load(std::memory_order_acquire) && !agent.FatalError()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  agent.Stop();
  if (agent.FatalError()) {
    Logger::Error("[Device] Exiting: " + agent.FatalReason());
    return 4;
  }
  Logger::Info("[Device] Shutdown complete");
  return 0;
}
