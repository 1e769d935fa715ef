// Repository: HoloHub-fleet
// Component: Fake control plane client (test only)
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_TESTS_FIXTURES_FAKE_CONTROL_PLANE_CLIENT_HPP_
#define HOLOHUB_TESTS_FIXTURES_FAKE_CONTROL_PLANE_CLIENT_HPP_

#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "holohub/sync/IControlPlaneClient.hpp"

namespace holohub::testing {

class FakeControlPlaneClient : public sync::IControlPlaneClient {
 public:
  static constexpr const char* kDeviceId = "6f1c2d3e-4a5b-4c6d-8e7f-0123456789ab";

  // Next FetchAssignment results, consumed in order; the last one repeats.
  void QueueAssignment(sync::ClientResult<std::optional<model::Playlist>> result) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_.push_back(std::move(result));
  }

  void SetAssignment(const model::Playlist& playlist) {
    std::lock_guard<std::mutex> lock(mutex_);
    assignments_.clear();
    assignments_.push_back(
        sync::ClientResult<std::optional<model::Playlist>>::Ok(playlist));
  }

  void QueueAuth(sync::ClientStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_results_.push_back(status);
  }

  void QueueHeartbeat(sync::ClientResult<sync::HeartbeatAck> result) {
    std::lock_guard<std::mutex> lock(mutex_);
    heartbeat_results_.push_back(std::move(result));
  }

  // Runs inside every SubmitHeartbeat call, before it returns.
  void SetHeartbeatHook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    heartbeat_hook_ = std::move(hook);
  }

  sync::ClientResult<sync::AuthToken> Authenticate() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++auth_calls_;
    sync::ClientStatus status = sync::ClientStatus::kOk;
    if (!auth_results_.empty()) {
      status = auth_results_.front();
      auth_results_.pop_front();
    }
    if (status != sync::ClientStatus::kOk) {
      return sync::ClientResult<sync::AuthToken>::Fail(status, "auth rejected");
    }
    sync::AuthToken token;
    token.device_id = kDeviceId;
    token.token = "token-" + std::to_string(auth_calls_);
    return sync::ClientResult<sync::AuthToken>::Ok(token);
  }

  sync::ClientResult<sync::HeartbeatAck> SubmitHeartbeat(
      const model::HeartbeatReport& report, std::chrono::milliseconds deadline) override {
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hook = heartbeat_hook_;
    }
    if (hook) hook();
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(report);
    deadlines_.push_back(deadline);
    if (heartbeat_results_.empty()) {
      return sync::ClientResult<sync::HeartbeatAck>::Ok(sync::HeartbeatAck{});
    }
    auto r = heartbeat_results_.front();
    heartbeat_results_.pop_front();
    return r;
  }

  sync::ClientResult<std::optional<model::Playlist>> FetchAssignment(
      const std::string& /*device_id*/) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetch_calls_;
    if (assignments_.empty()) {
      return sync::ClientResult<std::optional<model::Playlist>>::Fail(
          sync::ClientStatus::kNotFound, "no assignment");
    }
    auto r = assignments_.front();
    if (assignments_.size() > 1) assignments_.pop_front();
    return r;
  }

  int AuthCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_calls_;
  }
  int FetchCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_calls_;
  }
  std::vector<model::HeartbeatReport> Reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
  }
  std::vector<std::chrono::milliseconds> Deadlines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deadlines_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<sync::ClientResult<std::optional<model::Playlist>>> assignments_;
  std::deque<sync::ClientStatus> auth_results_;
  std::deque<sync::ClientResult<sync::HeartbeatAck>> heartbeat_results_;
  std::vector<model::HeartbeatReport> reports_;
  std::vector<std::chrono::milliseconds> deadlines_;
  std::function<void()> heartbeat_hook_;
  int auth_calls_ = 0;
  int fetch_calls_ = 0;
};

}  // namespace holohub::testing

#endif  // HOLOHUB_TESTS_FIXTURES_FAKE_CONTROL_PLANE_CLIENT_HPP_
