// Repository: HoloHub-fleet
// Component: Assignment Types
// Purpose: Device-to-playlist binding record and the error codes shared by
//          the playlist catalog and the assignment service.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_ASSIGNMENT_ASSIGNMENT_TYPES_HPP_
#define HOLOHUB_ASSIGNMENT_ASSIGNMENT_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::assignment {

enum class AssignmentError {
  kNone = 0,
  kPlaylistNotFound,
  kPlaylistDeleted,
  kItemNotFound,
  kInvalidItem,
  kInvalidOrder,        // reorder list is not a permutation of item ids
  kInvalidSchedule,
  kInvalidDeviceId,
  kDeviceNotFound,
  kDeviceDecommissioned,
  kAssignmentNotFound,
};

const char* AssignmentErrorToString(AssignmentError error);

template <typename T>
struct AssignmentResult {
  AssignmentError error = AssignmentError::kNone;
  std::string detail;
  T value{};

  bool ok() const { return error == AssignmentError::kNone; }

  static AssignmentResult Ok(T v) {
    AssignmentResult r;
    r.value = std::move(v);
    return r;
  }
  static AssignmentResult Fail(AssignmentError e, std::string why = {}) {
    AssignmentResult r;
    r.error = e;
    r.detail = std::move(why);
    return r;
  }
};

struct DeviceAssignment {
  std::string id;
  std::string device_id;
  std::string playlist_id;
  int64_t assigned_utc_ms = 0;
  std::optional<std::string> assigned_by;
  std::optional<model::Schedule> schedule_override;

  bool active = true;                      // false once unassigned or superseded
  std::optional<int64_t> ended_utc_ms;

  // The record most recently resolved as live for the device.
  bool is_current = false;
};

}  // namespace holohub::assignment

#endif  // HOLOHUB_ASSIGNMENT_ASSIGNMENT_TYPES_HPP_
