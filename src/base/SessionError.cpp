#include "SessionError.hpp"

namespace at {
string errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::VALIDATION_ERROR:
      return "VALIDATION_ERROR";
    case ErrorCode::LIMIT_EXCEEDED:
      return "LIMIT_EXCEEDED";
    case ErrorCode::NOT_FOUND:
      return "NOT_FOUND";
    case ErrorCode::SPAWN_FAILURE:
      return "SPAWN_FAILURE";
    case ErrorCode::WORKSPACE_ERROR:
      return "WORKSPACE_ERROR";
    case ErrorCode::INVALID_STATE:
      return "INVALID_STATE";
    case ErrorCode::IO_FAILURE:
      return "IO_FAILURE";
    case ErrorCode::AUTH_FAILURE:
      return "AUTH_FAILURE";
    case ErrorCode::INTERNAL_ERROR:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}
}  // namespace at
