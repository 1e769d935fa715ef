// Repository: HoloHub-fleet
// Component: Assignment Service
// Purpose: Binds playlists to devices (with optional per-device schedule
//          overrides) and resolves which playlist a device should be
//          playing right now. History is kept; nothing is deleted.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_ASSIGNMENT_ASSIGNMENT_SERVICE_HPP_
#define HOLOHUB_ASSIGNMENT_ASSIGNMENT_SERVICE_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "holohub/assignment/AssignmentTypes.hpp"
#include "holohub/assignment/PlaylistCatalog.hpp"
#include "holohub/registry/DeviceRegistry.hpp"
#include "holohub/timing/ITimeSource.hpp"

namespace holohub::assignment {

class AssignmentService {
 public:
  AssignmentService(std::shared_ptr<registry::DeviceRegistry> registry,
                    std::shared_ptr<PlaylistCatalog> catalog,
                    std::shared_ptr<timing::ITimeSource> clock);

  // Re-assigning the same playlist to a device supersedes the previous
  // record. Returns the assignment id.
  AssignmentResult<std::string> Assign(const std::string& device_id,
                                       const std::string& playlist_id,
                                       std::optional<model::Schedule> schedule_override = std::nullopt,
                                       std::optional<std::string> assigned_by = std::nullopt);

  AssignmentError Unassign(const std::string& device_id, const std::string& playlist_id);

  // Resolves the live playlist at now_utc_ms, marks its record current and
  // records the binding on the device. value is nullopt when nothing is live.
  AssignmentResult<std::optional<model::Playlist>> GetAssignedPlaylist(
      const std::string& device_id, int64_t now_utc_ms);

  // All records for a device (active and ended), oldest first.
  std::vector<DeviceAssignment> History(const std::string& device_id) const;

  std::vector<DeviceAssignment> ActiveAssignments(const std::string& device_id) const;

 private:
  AssignmentError CheckDevice(const std::string& device_id) const;

  std::shared_ptr<registry::DeviceRegistry> registry_;
  std::shared_ptr<PlaylistCatalog> catalog_;
  std::shared_ptr<timing::ITimeSource> clock_;

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<DeviceAssignment>> by_device_;
};

}  // namespace holohub::assignment

#endif  // HOLOHUB_ASSIGNMENT_ASSIGNMENT_SERVICE_HPP_
