// Repository: HoloHub-fleet
// Component: Playback Loop
// Purpose: Render thread. Takes the current playlist snapshot, pins the
//          item's cached content, hands it to the display backend and waits
//          the item's duration on an interruptible wait strategy.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_PLAYBACK_PLAYBACK_LOOP_HPP_
#define HOLOHUB_PLAYBACK_PLAYBACK_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "holohub/content/ContentStore.hpp"
#include "holohub/display/IDisplayBackend.hpp"
#include "holohub/playback/PlaybackCursor.hpp"
#include "holohub/playback/PlaybackStateBoard.hpp"
#include "holohub/sync/PlaylistSlot.hpp"
#include "holohub/timing/ITimeSource.hpp"
#include "holohub/timing/IWaitStrategy.hpp"

namespace holohub::playback {

struct PlaybackLoopConfig {
  std::chrono::milliseconds skip_backoff{1000};
  uint32_t shuffle_seed = 0;          // 0 = seed from std::random_device
};

enum class StepResult {
  kIdle = 0,     // no playlist, or paused/stopped
  kShown,
  kSkipped,      // content missing or backend refused
  kStopped,      // Stop() requested
};

const char* StepResultToString(StepResult r);

struct StepReport {
  StepResult result = StepResult::kIdle;
  int32_t item_index = -1;
  std::string asset_id;
};

class PlaybackLoop {
 public:
  // Operator run state (play/pause/stop commands).
  enum class RunState { kPlaying, kPaused, kStopped };

  PlaybackLoop(std::shared_ptr<sync::PlaylistSlot> slot,
               std::shared_ptr<content::ContentStore> store,
               std::shared_ptr<display::IDisplayBackend> backend,
               std::shared_ptr<PlaybackStateBoard> board,
               std::shared_ptr<timing::IWaitStrategy> wait,
               std::shared_ptr<timing::ITimeSource> clock,
               PlaybackLoopConfig config = {});
  ~PlaybackLoop();

  PlaybackLoop(const PlaybackLoop&) = delete;
  PlaybackLoop& operator=(const PlaybackLoop&) = delete;

  // One iteration: show the item at the cursor (or idle) and wait.
  // Drives the thread; tests call it directly with a deterministic wait.
  StepReport StepOnce();

  void Start();
  void Stop();

  void SetRunState(RunState state);
  RunState GetRunState() const { return run_state_.load(std::memory_order_acquire); }

 private:
  void Run();
  void ResetForSnapshot(const sync::PlaylistSlot::Snapshot& snapshot);
  StepReport Skip(const model::PlaylistItem& item, int32_t index, const std::string& why);

  std::shared_ptr<sync::PlaylistSlot> slot_;
  std::shared_ptr<content::ContentStore> store_;
  std::shared_ptr<display::IDisplayBackend> backend_;
  std::shared_ptr<PlaybackStateBoard> board_;
  std::shared_ptr<timing::IWaitStrategy> wait_;
  std::shared_ptr<timing::ITimeSource> clock_;
  PlaybackLoopConfig config_;

  // Render-thread state.
  sync::PlaylistSlot::Snapshot current_;
  PlaybackCursor cursor_;
  bool advance_pending_ = false;
  bool display_dirty_ = false;
  uint32_t next_seed_ = 0;
  content::ContentLease on_screen_;

  std::atomic<RunState> run_state_{RunState::kPlaying};
  std::atomic<bool> stop_requested_{false};
  std::thread thread_;
};

}  // namespace holohub::playback

#endif  // HOLOHUB_PLAYBACK_PLAYBACK_LOOP_HPP_
