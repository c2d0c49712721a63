/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipwatch/error.h"
#include <sstream>

namespace clipwatch {

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

  case ErrorCode::ConnectionError:
    return "ConnectionError";
  case ErrorCode::ExtensionUnavailable:
    return "ExtensionUnavailable";
  case ErrorCode::AtomInternFailed:
    return "AtomInternFailed";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::Terminated:
    return "Terminated";

  case ErrorCode::NoTargetsAvailable:
    return "NoTargetsAvailable";
  case ErrorCode::ConversionRefused:
    return "ConversionRefused";
  case ErrorCode::UnsupportedIncrementalTransfer:
    return "UnsupportedIncrementalTransfer";
  case ErrorCode::DecodeError:
    return "DecodeError";

  case ErrorCode::SinkError:
    return "SinkError";
  case ErrorCode::FileReadError:
    return "FileReadError";
  case ErrorCode::FileWriteError:
    return "FileWriteError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::ConnectionError:
  case ErrorCode::ExtensionUnavailable:
  case ErrorCode::AtomInternFailed:
  case ErrorCode::ConnectionLost:
  case ErrorCode::Terminated:
    return false;

  // All others only end the current cycle
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace clipwatch
