// Repository: HoloHub-fleet
// Component: Metrics Collector
// Purpose: Samples host health (CPU, memory, temperature, storage) for the
//          heartbeat. An explicit instance, injected where needed.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_PLAYBACK_METRICS_COLLECTOR_HPP_
#define HOLOHUB_PLAYBACK_METRICS_COLLECTOR_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace holohub::playback {

struct SystemMetrics {
  std::optional<double> cpu_percent;
  std::optional<double> memory_percent;
  std::optional<double> storage_used_gb;
  std::optional<int32_t> temperature_celsius;
};

struct MetricsSources {
  std::string proc_stat = "/proc/stat";
  std::string proc_meminfo = "/proc/meminfo";
  std::string thermal_zone = "/sys/class/thermal/thermal_zone0/temp";
  std::string storage_path = "/";
};

class MetricsCollector {
 public:
  explicit MetricsCollector(MetricsSources sources = {});
  virtual ~MetricsCollector() = default;

  // Fields that cannot be read are left empty. CPU is the busy share since
  // the previous call; the first call reports nothing for CPU.
  virtual SystemMetrics Collect();

 protected:
  std::optional<double> SampleCpu();
  std::optional<double> SampleMemory() const;
  std::optional<double> SampleStorage() const;
  std::optional<int32_t> SampleTemperature() const;

 private:
  MetricsSources sources_;
  std::mutex cpu_mutex_;
  uint64_t last_idle_ = 0;
  uint64_t last_total_ = 0;
  bool have_cpu_baseline_ = false;
};

}  // namespace holohub::playback

#endif  // HOLOHUB_PLAYBACK_METRICS_COLLECTOR_HPP_
