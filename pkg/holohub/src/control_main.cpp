// Repository: HoloHub-fleet
// Component: Control plane daemon
// Purpose: Serves DeviceControlService and runs the liveness and
//          auto-decommission sweeps.
// Copyright (c) 2025 HoloHub

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "holohub/assignment/AssignmentService.hpp"
#include "holohub/assignment/PlaylistCatalog.hpp"
#include "holohub/config/ControlPlaneConfig.hpp"
#include "holohub/registry/DeviceRegistry.hpp"
#include "holohub/timing/ITimeSource.hpp"
#include "holohub/timing/IWaitStrategy.hpp"
#include "holohub/util/Logger.hpp"
#include "rpc/DeviceControlService.hpp"

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
  std::string listen_address;
  std::string asset_root;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "HoloHub fleet control plane.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH         KEY=VALUE settings file (environment overrides it)\n"
            << "  --listen HOST:PORT    gRPC listen address (default 0.0.0.0:50051)\n"
            << "  --asset-root PATH     Directory served by DownloadContent\n"
            << "  --help                Show this help message\n"
            << "\n";
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
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--asset-root" && i + 1 < argc) {
      args.asset_root = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

// Liveness and auto-decommission sweeps on a fixed interval.
void SweepLoop(holohub::registry::DeviceRegistry& registry,
               holohub::timing::ITimeSource& clock,
               holohub::timing::IWaitStrategy& wait,
               const holohub::config::ControlPlaneConfig& config,
               const std::atomic<bool>& stop) {
  const int64_t heartbeat_ms = static_cast<int64_t>(config.heartbeat_interval_sec) * 1000;
  while (!stop.load(std::memory_order_acquire)) {
    wait.WaitFor(std::chrono::seconds(config.liveness_sweep_interval_sec));
    if (stop.load(std::memory_order_acquire)) break;

    const int64_t now = clock.NowUtcMs();
    const size_t failures = registry.SweepLiveness(now, heartbeat_ms);
    if (failures > 0) {
      Logger::Debug("[Sweep] Recorded " + std::to_string(failures) + " liveness failure(s)");
    }
    if (config.auto_decommission_days > 0) {
      for (const auto& id : registry.SweepAutoDecommission(now, config.AutoDecommissionMs())) {
        Logger::Warn("[Sweep] Auto-decommissioned device " + id);
      }
    }
  }
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
  holohub::config::ControlPlaneConfig config = holohub::config::LoadControlPlaneConfig(
      args.config_path, holohub::config::ProcessEnv(), &problems);
  if (!args.listen_address.empty()) config.listen_address = args.listen_address;
  if (!args.asset_root.empty()) config.asset_root = args.asset_root;
  for (const auto& p : config.Validate()) problems.push_back(p);
  if (!problems.empty()) {
    for (const auto& p : problems) Logger::Error("[Config] " + p);
    return 2;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto clock = std::make_shared<holohub::timing::SystemTimeSource>();
  holohub::registry::RegistryConfig registry_config;
  registry_config.offline_failure_threshold = config.offline_failure_threshold;
  auto registry = std::make_shared<holohub::registry::DeviceRegistry>(clock, registry_config);
  auto catalog = std::make_shared<holohub::assignment::PlaylistCatalog>(clock);
  auto assignments =
      std::make_shared<holohub::assignment::AssignmentService>(registry, catalog, clock);

  holohub::rpc::DeviceControlServiceOptions options;
  options.asset_root = config.asset_root;
  options.chunk_bytes = static_cast<size_t>(config.download_chunk_kib) * 1024;
  holohub::rpc::DeviceControlServiceImpl service(registry, assignments, catalog, clock, options);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[Control] Failed to listen on " + config.listen_address);
    return 3;
  }
  Logger::Info("[Control] Listening on " + config.listen_address);

  std::atomic<bool> sweep_stop{false};
  holohub::timing::RealtimeWaitStrategy sweep_wait;
  std::thread sweeper([&] { SweepLoop(*registry, *clock, sweep_wait, config, sweep_stop); });

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[Control] Shutting down");
  sweep_stop.store(true, std::memory_order_release);
  sweep_wait.Wake();
  sweeper.join();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  server->Wait();

  std::ostringstream oss;
  const auto snapshot = registry->Snapshot();
  oss << "[Control] Final: devices=" << snapshot.device_count
      << " heartbeats_accepted=" << snapshot.heartbeats_accepted
      << " heartbeats_rejected=" << snapshot.heartbeats_rejected;
  Logger::Info(oss.str());
  return 0;
}
