/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "pasteboard/error.h"
#include <sstream>

namespace pasteboard {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";

  case ErrorCode::ServerError:
    return "ServerError";
  case ErrorCode::MalformedReply:
    return "MalformedReply";
  case ErrorCode::ServerNoData:
    return "ServerNoData";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";

  case ErrorCode::ServerError:
    return "Pasteboard server error occurred";
  case ErrorCode::MalformedReply:
    return "Pasteboard server sent a malformed reply";
  case ErrorCode::ServerNoData:
    return "Pasteboard server returned no data";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::InvalidArgument:
  case ErrorCode::PermissionDenied:
    return false;

  // The server gave no data at all; the library does not retry and the
  // caller decides what to do with the pasteboard
  case ErrorCode::ServerNoData:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error Methods
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  if (!domain.empty()) {
    oss << domain << " ";
  }

  oss << error_code_name(code) << " (" << numeric_code() << ")";

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

Error Error::server_no_data() {
  Error err(ErrorCode::ServerNoData, "Pasteboard server returned no data.");
  err.domain = SERVER_ERROR_DOMAIN;
  return err;
}

} // namespace pasteboard
