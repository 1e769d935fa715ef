// Repository: HoloHub-fleet
// Component: Assignment Service
// Copyright (c) 2025 HoloHub

#include "holohub/assignment/AssignmentService.hpp"

#include "holohub/schedule/ScheduleEvaluator.hpp"
#include "holohub/util/Logger.hpp"
#include "holohub/util/Uuid.hpp"

namespace holohub::assignment {

using util::Logger;

namespace {

AssignmentError FromRegistry(registry::RegistryError e) {
  switch (e) {
    case registry::RegistryError::kNone:                 return AssignmentError::kNone;
    case registry::RegistryError::kInvalidDeviceId:      return AssignmentError::kInvalidDeviceId;
    case registry::RegistryError::kDeviceDecommissioned: return AssignmentError::kDeviceDecommissioned;
    default:                                             return AssignmentError::kDeviceNotFound;
  }
}

}  // namespace

AssignmentService::AssignmentService(std::shared_ptr<registry::DeviceRegistry> registry,
                                     std::shared_ptr<PlaylistCatalog> catalog,
                                     std::shared_ptr<timing::ITimeSource> clock)
    : registry_(std::move(registry)),
      catalog_(std::move(catalog)),
      clock_(clock ? std::move(clock) : std::make_shared<timing::SystemTimeSource>()) {}

AssignmentError AssignmentService::CheckDevice(const std::string& device_id) const {
  if (!util::IsCanonicalUuid(device_id)) return AssignmentError::kInvalidDeviceId;
  auto device = registry_->Get(device_id);
  if (!device) return AssignmentError::kDeviceNotFound;
  if (device->status == registry::DeviceStatus::kDecommissioned) {
    return AssignmentError::kDeviceDecommissioned;
  }
  return AssignmentError::kNone;
}

AssignmentResult<std::string> AssignmentService::Assign(
    const std::string& device_id, const std::string& playlist_id,
    std::optional<model::Schedule> schedule_override,
    std::optional<std::string> assigned_by) {
  AssignmentError err = CheckDevice(device_id);
  if (err != AssignmentError::kNone) return AssignmentResult<std::string>::Fail(err);

  auto playlist = catalog_->Get(playlist_id);
  if (!playlist) return AssignmentResult<std::string>::Fail(AssignmentError::kPlaylistNotFound);
  if (playlist->IsDeleted()) {
    return AssignmentResult<std::string>::Fail(AssignmentError::kPlaylistDeleted);
  }
  if (schedule_override) {
    auto problems = schedule::ValidateSchedule(*schedule_override);
    if (!problems.empty()) {
      return AssignmentResult<std::string>::Fail(AssignmentError::kInvalidSchedule,
                                                 problems.front());
    }
  }

  const int64_t now = clock_->NowUtcMs();
  DeviceAssignment record;
  record.id = util::GenerateUuidV4();
  record.device_id = device_id;
  record.playlist_id = playlist_id;
  record.assigned_utc_ms = now;
  record.assigned_by = std::move(assigned_by);
  record.schedule_override = std::move(schedule_override);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& records = by_device_[device_id];
    for (auto& r : records) {
      if (r.active && r.playlist_id == playlist_id) {
        r.active = false;
        r.is_current = false;
        r.ended_utc_ms = now;
      }
    }
    records.push_back(record);
  }

  Logger::Info("[AssignmentService] Assigned playlist " + playlist_id + " to " + device_id +
               (record.assigned_by ? " by " + *record.assigned_by : std::string()));
  return AssignmentResult<std::string>::Ok(record.id);
}

AssignmentError AssignmentService::Unassign(const std::string& device_id,
                                            const std::string& playlist_id) {
  if (!util::IsCanonicalUuid(device_id)) return AssignmentError::kInvalidDeviceId;
  bool was_current = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_device_.find(device_id);
    if (it == by_device_.end()) return AssignmentError::kAssignmentNotFound;
    bool found = false;
    const int64_t now = clock_->NowUtcMs();
    for (auto& r : it->second) {
      if (r.active && r.playlist_id == playlist_id) {
        was_current = was_current || r.is_current;
        r.active = false;
        r.is_current = false;
        r.ended_utc_ms = now;
        found = true;
      }
    }
    if (!found) return AssignmentError::kAssignmentNotFound;
  }
  if (was_current) {
    const registry::RegistryError unbind = registry_->SetAssignedPlaylist(device_id, std::nullopt);
    if (unbind != registry::RegistryError::kNone) return FromRegistry(unbind);
  }
  Logger::Info("[AssignmentService] Unassigned playlist " + playlist_id + " from " + device_id);
  return AssignmentError::kNone;
}

AssignmentResult<std::optional<model::Playlist>> AssignmentService::GetAssignedPlaylist(
    const std::string& device_id, int64_t now_utc_ms) {
  using Result = AssignmentResult<std::optional<model::Playlist>>;
  const AssignmentError device_error = CheckDevice(device_id);
  if (device_error != AssignmentError::kNone) return Result::Fail(device_error);

  std::optional<model::Playlist> winner;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_device_.find(device_id);
    if (it == by_device_.end()) return Result::Ok(std::nullopt);

    std::vector<DeviceAssignment*> records;
    std::vector<model::Playlist> playlists;
    std::vector<schedule::AssignmentCandidate> candidates;
    for (auto& r : it->second) {
      if (!r.active) continue;
      auto playlist = catalog_->Get(r.playlist_id);
      if (!playlist || playlist->IsDeleted()) continue;
      schedule::AssignmentCandidate c;
      c.is_active = playlist->is_active;
      c.schedule = schedule::EffectiveSchedule(r.schedule_override, *playlist);
      c.assigned_utc_ms = r.assigned_utc_ms;
      candidates.push_back(std::move(c));
      playlists.push_back(std::move(*playlist));
      records.push_back(&r);
    }

    const auto pick = schedule::SelectLiveAssignment(candidates, now_utc_ms);
    for (auto& r : it->second) r.is_current = false;
    if (pick) {
      records[*pick]->is_current = true;
      winner = std::move(playlists[*pick]);
    }
  }

  const registry::RegistryError bind =
      registry_->SetAssignedPlaylist(device_id, winner ? std::optional<std::string>(winner->id)
                                                       : std::nullopt);
  if (bind != registry::RegistryError::kNone) return Result::Fail(FromRegistry(bind));
  return Result::Ok(std::move(winner));
}

std::vector<DeviceAssignment> AssignmentService::History(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_device_.find(device_id);
  if (it == by_device_.end()) return {};
  return it->second;
}

std::vector<DeviceAssignment> AssignmentService::ActiveAssignments(
    const std::string& device_id) const {
  std::vector<DeviceAssignment> out;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_device_.find(device_id);
  if (it == by_device_.end()) return out;
  for (const auto& r : it->second) {
    if (r.active) out.push_back(r);
  }
  return out;
}

}  // namespace holohub::assignment
