// Repository: HoloHub-fleet
// Component: Metrics Collector
// Copyright (c) 2025 HoloHub

#include "holohub/playback/MetricsCollector.hpp"

#include <fstream>
#include <sstream>
#include <sys/statvfs.h>

namespace holohub::playback {

MetricsCollector::MetricsCollector(MetricsSources sources)
    : sources_(std::move(sources)) {}

SystemMetrics MetricsCollector::Collect() {
  SystemMetrics m;
  m.cpu_percent = SampleCpu();
  m.memory_percent = SampleMemory();
  m.storage_used_gb = SampleStorage();
  m.temperature_celsius = SampleTemperature();
  return m;
}

std::optional<double> MetricsCollector::SampleCpu() {
  std::ifstream in(sources_.proc_stat);
  std::string line;
  if (!in || !std::getline(in, line) || line.rfind("cpu ", 0) != 0) return std::nullopt;

  std::istringstream fields(line.substr(4));
  uint64_t value = 0;
  uint64_t total = 0;
  uint64_t idle = 0;
  int column = 0;
  while (fields >> value) {
    total += value;
    if (column == 3 || column == 4) idle += value;  // idle + iowait
    ++column;
  }
  if (column < 4) return std::nullopt;

  std::lock_guard<std::mutex> lock(cpu_mutex_);
  std::optional<double> result;
  if (have_cpu_baseline_ && total > last_total_) {
    const double d_total = static_cast<double>(total - last_total_);
    const double d_idle = static_cast<double>(idle - last_idle_);
    result = 100.0 * (1.0 - d_idle / d_total);
  }
  last_total_ = total;
  last_idle_ = idle;
  have_cpu_baseline_ = true;
  return result;
}

std::optional<double> MetricsCollector::SampleMemory() const {
  std::ifstream in(sources_.proc_meminfo);
  if (!in) return std::nullopt;
  uint64_t total_kb = 0;
  uint64_t available_kb = 0;
  std::string key;
  uint64_t value = 0;
  std::string unit;
  while (in >> key >> value) {
    std::getline(in, unit);
    if (key == "MemTotal:") total_kb = value;
    else if (key == "MemAvailable:") available_kb = value;
  }
  if (total_kb == 0 || available_kb > total_kb) return std::nullopt;
  return 100.0 * static_cast<double>(total_kb - available_kb) / static_cast<double>(total_kb);
}

std::optional<double> MetricsCollector::SampleStorage() const {
  struct statvfs vfs;
  if (statvfs(sources_.storage_path.c_str(), &vfs) != 0) return std::nullopt;
  const double used_bytes = static_cast<double>(vfs.f_blocks - vfs.f_bfree) *
                            static_cast<double>(vfs.f_frsize);
  return used_bytes / (1024.0 * 1024.0 * 1024.0);
}

std::optional<int32_t> MetricsCollector::SampleTemperature() const {
  std::ifstream in(sources_.thermal_zone);
  long millidegrees = 0;
  if (!in || !(in >> millidegrees)) return std::nullopt;
  return static_cast<int32_t>(millidegrees / 1000);
}

}  // namespace holohub::playback
