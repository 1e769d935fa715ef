// Repository: HoloHub-fleet
// Component: Playback Loop
// Copyright (c) 2025 HoloHub

#include "holohub/playback/PlaybackLoop.hpp"

#include <cstdlib>
#include <random>
#include <sstream>

#include "holohub/sync/PlaylistDiff.hpp"
#include "holohub/util/Logger.hpp"

namespace holohub::playback {

using util::Logger;

const char* StepResultToString(StepResult r) {
  switch (r) {
    case StepResult::kIdle:    return "IDLE";
    case StepResult::kShown:   return "SHOWN";
    case StepResult::kSkipped: return "SKIPPED";
    case StepResult::kStopped: return "STOPPED";
  }
  return "UNKNOWN";
}

PlaybackLoop::PlaybackLoop(std::shared_ptr<sync::PlaylistSlot> slot,
                           std::shared_ptr<content::ContentStore> store,
                           std::shared_ptr<display::IDisplayBackend> backend,
                           std::shared_ptr<PlaybackStateBoard> board,
                           std::shared_ptr<timing::IWaitStrategy> wait,
                           std::shared_ptr<timing::ITimeSource> clock,
                           PlaybackLoopConfig config)
    : slot_(std::move(slot)),
      store_(std::move(store)),
      backend_(std::move(backend)),
      board_(board ? std::move(board) : std::make_shared<PlaybackStateBoard>()),
      wait_(wait ? std::move(wait) : std::make_shared<timing::RealtimeWaitStrategy>()),
      clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()),
      config_(config) {
  next_seed_ = config_.shuffle_seed != 0 ? config_.shuffle_seed : std::random_device{}();
  std::weak_ptr<timing::IWaitStrategy> weak_wait = wait_;
  slot_->SetPublishListener([weak_wait] {
    if (auto w = weak_wait.lock()) w->Wake();
  });
}

PlaybackLoop::~PlaybackLoop() {
  Stop();
  slot_->SetPublishListener(nullptr);
}

void PlaybackLoop::Start() {
  if (thread_.joinable()) return;
  stop_requested_.store(false, std::memory_order_release);
  thread_ = std::thread(&PlaybackLoop::Run, this);
}

void PlaybackLoop::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  wait_->Wake();
  if (thread_.joinable()) {
    thread_.join();
  }
  on_screen_.Release();
}

void PlaybackLoop::SetRunState(RunState state) {
  run_state_.store(state, std::memory_order_release);
  wait_->Wake();
}

void PlaybackLoop::Run() {
  Logger::Info(std::string("[PlaybackLoop] Started on backend ") + backend_->Name());
  while (!stop_requested_.load(std::memory_order_acquire)) {
    StepOnce();
  }
  Logger::Info("[PlaybackLoop] Stopped");
}

void PlaybackLoop::ResetForSnapshot(const sync::PlaylistSlot::Snapshot& snapshot) {
  current_ = snapshot;
  cursor_ = PlaybackCursor(snapshot->items.size(), snapshot->shuffle, next_seed_++);
  advance_pending_ = false;

  std::ostringstream oss;
  oss << "[PlaybackLoop] Playlist " << snapshot->id << " items=" << snapshot->items.size()
      << " shuffle=" << (snapshot->shuffle ? "on" : "off")
      << " transition=" << model::TransitionTypeName(snapshot->transition_type);
  Logger::Info(oss.str());

  if (snapshot->transition_type == model::TransitionType::kCut) {
    backend_->Clear();
  }
}

StepReport PlaybackLoop::Skip(const model::PlaylistItem& item, int32_t index,
                              const std::string& why) {
  Logger::Warn("[PlaybackLoop] Skipping " + item.asset_id + ": " + why);
  board_->RecordError(item.asset_id + ": " + why);
  advance_pending_ = true;
  wait_->WaitFor(config_.skip_backoff);

  StepReport report;
  report.result = StepResult::kSkipped;
  report.item_index = index;
  report.asset_id = item.asset_id;
  return report;
}

StepReport PlaybackLoop::StepOnce() {
  StepReport report;
  if (stop_requested_.load(std::memory_order_acquire)) {
    report.result = StepResult::kStopped;
    return report;
  }

  const RunState state = run_state_.load(std::memory_order_acquire);
  if (state != RunState::kPlaying) {
    if (state == RunState::kStopped && display_dirty_) {
      backend_->Clear();
      display_dirty_ = false;
      on_screen_.Release();
      current_.reset();
    }
    board_->SetIdle(state == RunState::kPaused ? model::PlaybackStatus::kPaused
                                               : model::PlaybackStatus::kStopped);
    wait_->WaitUntil(std::chrono::steady_clock::time_point::max());
    return report;
  }

  sync::PlaylistSlot::Snapshot snapshot = slot_->Load();
  if (!snapshot || snapshot->items.empty()) {
    if (display_dirty_ || current_) {
      backend_->Clear();
      display_dirty_ = false;
      Logger::Info("[PlaybackLoop] No playlist; display cleared");
    }
    current_.reset();
    on_screen_.Release();
    board_->SetIdle(model::PlaybackStatus::kStopped);
    wait_->WaitUntil(std::chrono::steady_clock::time_point::max());
    return report;
  }

  if (snapshot != current_) {
    ResetForSnapshot(snapshot);
  } else if (advance_pending_) {
    cursor_.Advance();
    advance_pending_ = false;
  }

  const int32_t index = static_cast<int32_t>(cursor_.Current());
  model::PlaylistItem item = current_->items[static_cast<size_t>(index)];
  const std::string& content_id = sync::ContentIdOf(item);

  content::ContentLease lease = store_->Acquire(content_id);
  if (!lease) {
    return Skip(item, index, "content " + content_id + " not cached");
  }

  const model::TransitionType transition = model::EffectiveTransition(*current_, item);
  item.custom_settings[display::kSettingTransition] = model::TransitionTypeName(transition);
  item.custom_settings[display::kSettingTransitionDurationMs] =
      std::to_string(current_->transition_duration_ms);

  auto brightness = item.custom_settings.find("brightness");
  if (brightness != item.custom_settings.end()) {
    char* end = nullptr;
    const long v = std::strtol(brightness->second.c_str(), &end, 10);
    if (end != brightness->second.c_str() && *end == '\0') {
      backend_->SetBrightness(static_cast<int>(v));
    }
  }

  if (!backend_->ShowContent(item, lease.Path())) {
    return Skip(item, index, "backend refused content");
  }
  display_dirty_ = true;
  on_screen_ = std::move(lease);
  board_->SetShowing(model::PlaybackStatus::kPlaying, current_->id, item.asset_id,
                     index, clock_->NowUtcMs());
  advance_pending_ = true;

  Logger::Debug("[PlaybackLoop] Showing index=" + std::to_string(index) + " asset=" +
                item.asset_id + " duration=" + std::to_string(item.duration_seconds) + "s");

  if (item.duration_seconds > 0) {
    wait_->WaitFor(std::chrono::seconds(item.duration_seconds));
  } else {
    wait_->WaitUntil(std::chrono::steady_clock::time_point::max());
  }

  report.result = StepResult::kShown;
  report.item_index = index;
  report.asset_id = item.asset_id;
  return report;
}

}  // namespace holohub::playback
