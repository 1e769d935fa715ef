// Repository: HoloHub-fleet
// Component: Recording display backend (test only)
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_TESTS_FIXTURES_RECORDING_DISPLAY_BACKEND_HPP_
#define HOLOHUB_TESTS_FIXTURES_RECORDING_DISPLAY_BACKEND_HPP_

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "holohub/display/IDisplayBackend.hpp"

namespace holohub::testing {

class RecordingDisplayBackend : public display::IDisplayBackend {
 public:
  struct Shown {
    std::string asset_id;
    std::string path;
    std::map<std::string, std::string> settings;
  };

  const char* Name() const override { return "recording"; }

  bool Initialize() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++init_calls_;
    return init_result_;
  }

  bool ShowContent(const model::PlaylistItem& item, const std::string& local_path) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (blocked_) {
      ++blocked_calls_;
      cv_.notify_all();
      cv_.wait(lock, [this] { return !blocked_; });
    }
    if (refuse_.count(item.asset_id) > 0) return false;
    shown_.push_back(Shown{item.asset_id, local_path, item.custom_settings});
    return true;
  }

  void Clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++clears_;
  }

  void SetBrightness(int level) override {
    std::lock_guard<std::mutex> lock(mutex_);
    brightness_.push_back(level);
  }

  void Shutdown() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++shutdowns_;
  }

  void Refuse(const std::string& asset_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_.insert(asset_id);
  }
  void SetInitResult(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    init_result_ = ok;
  }

  // While blocked, ShowContent parks until Unblock().
  void Block() {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_ = true;
  }
  void Unblock() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      blocked_ = false;
    }
    cv_.notify_all();
  }
  void WaitUntilBlocked() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return blocked_calls_ > 0; });
  }

  std::vector<Shown> ShownItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shown_;
  }
  std::vector<std::string> ShownAssets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& s : shown_) out.push_back(s.asset_id);
    return out;
  }
  int Clears() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clears_;
  }
  int Shutdowns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdowns_;
  }
  int InitCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return init_calls_;
  }
  std::vector<int> BrightnessCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return brightness_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Shown> shown_;
  std::set<std::string> refuse_;
  std::vector<int> brightness_;
  int clears_ = 0;
  int shutdowns_ = 0;
  int init_calls_ = 0;
  int blocked_calls_ = 0;
  bool init_result_ = true;
  bool blocked_ = false;
};

}  // namespace holohub::testing

#endif  // HOLOHUB_TESTS_FIXTURES_RECORDING_DISPLAY_BACKEND_HPP_
