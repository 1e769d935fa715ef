// Repository: HoloHub-fleet
// Component: Content Cache Types
// Copyright (c) 2025 HoloHub

#include "holohub/content/ContentTypes.hpp"

namespace holohub::content {

const char* ContentErrorToString(ContentError error) {
  switch (error) {
    case ContentError::kNone:
      return "NONE";
    case ContentError::kNotFound:
      return "NOT_FOUND";
    case ContentError::kIntegrityMismatch:
      return "INTEGRITY_MISMATCH";
    case ContentError::kIOFailure:
      return "IO_FAILURE";
    case ContentError::kQuotaExceeded:
      return "QUOTA_EXCEEDED";
    case ContentError::kNetworkTimeout:
      return "NETWORK_TIMEOUT";
    case ContentError::kAuthFailure:
      return "AUTH_FAILURE";
    case ContentError::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN_ERROR";
}

}  // namespace holohub::content
