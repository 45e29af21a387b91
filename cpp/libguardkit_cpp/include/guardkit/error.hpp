// Error codes and helpers for guardkit C++ API
#pragma once

#include <string>

namespace guardkit {

enum class ErrorCode {
  kSuccess = 0,

  // General errors (1-99)
  kInvalidArgument = 1,
  kOutOfRange = 2,
  kNotInitialized = 3,
  kAlreadyReleased = 4,

  // Limit errors (100-199)
  kLimitExceeded = 100,
  kOverflow = 101,
  kExpansionExceeded = 102,
  kIterationLimit = 103,

  // I/O errors (200-299)
  kOpenFailed = 200,
  kWriteFailed = 201,
  kFlushFailed = 202,
  kCloseFailed = 203,

  // Unknown
  kUnknown = 999
};

// Convert ErrorCode to short, stable English text. The returned string is a
// static literal and does not require lifetime management.
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotInitialized:
      return "Not initialized";
    case ErrorCode::kAlreadyReleased:
      return "Already released";
    case ErrorCode::kLimitExceeded:
      return "Limit exceeded";
    case ErrorCode::kOverflow:
      return "Arithmetic overflow";
    case ErrorCode::kExpansionExceeded:
      return "Expansion ratio exceeded";
    case ErrorCode::kIterationLimit:
      return "Iteration limit reached";
    case ErrorCode::kOpenFailed:
      return "Open failed";
    case ErrorCode::kWriteFailed:
      return "Write failed";
    case ErrorCode::kFlushFailed:
      return "Flush failed";
    case ErrorCode::kCloseFailed:
      return "Close failed";
    case ErrorCode::kUnknown:
    default:
      return "Unknown error";
  }
}

}  // namespace guardkit
