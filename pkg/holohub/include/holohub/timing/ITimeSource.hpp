// Repository: HoloHub-fleet
// Component: Time Source Interface
// Purpose: Wall-clock abstraction. Production reads system_clock; tests use
//          DeterministicTimeSource.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_TIMING_ITIME_SOURCE_HPP_
#define HOLOHUB_TIMING_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace holohub::timing {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace holohub::timing

#endif  // HOLOHUB_TIMING_ITIME_SOURCE_HPP_
