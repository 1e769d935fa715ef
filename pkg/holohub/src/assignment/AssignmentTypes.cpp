// Repository: HoloHub-fleet
// Component: Assignment Types
// Copyright (c) 2025 HoloHub

#include "holohub/assignment/AssignmentTypes.hpp"

namespace holohub::assignment {

const char* AssignmentErrorToString(AssignmentError error) {
  switch (error) {
    case AssignmentError::kNone:                 return "NONE";
    case AssignmentError::kPlaylistNotFound:     return "PLAYLIST_NOT_FOUND";
    case AssignmentError::kPlaylistDeleted:      return "PLAYLIST_DELETED";
    case AssignmentError::kItemNotFound:         return "ITEM_NOT_FOUND";
    case AssignmentError::kInvalidItem:          return "INVALID_ITEM";
    case AssignmentError::kInvalidOrder:         return "INVALID_ORDER";
    case AssignmentError::kInvalidSchedule:      return "INVALID_SCHEDULE";
    case AssignmentError::kInvalidDeviceId:      return "INVALID_DEVICE_ID";
    case AssignmentError::kDeviceNotFound:       return "DEVICE_NOT_FOUND";
    case AssignmentError::kDeviceDecommissioned: return "DEVICE_DECOMMISSIONED";
    case AssignmentError::kAssignmentNotFound:   return "ASSIGNMENT_NOT_FOUND";
  }
  return "UNKNOWN_ERROR";
}

}  // namespace holohub::assignment
