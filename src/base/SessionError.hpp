#ifndef __AT_SESSION_ERROR__
#define __AT_SESSION_ERROR__

#include "Headers.hpp"

namespace at {
/**
 * @brief Classifies every failure an operation can report to its caller.
 */
enum class ErrorCode {
  VALIDATION_ERROR,
  LIMIT_EXCEEDED,
  NOT_FOUND,
  SPAWN_FAILURE,
  WORKSPACE_ERROR,
  INVALID_STATE,
  IO_FAILURE,
  AUTH_FAILURE,
  INTERNAL_ERROR,
};

string errorCodeToString(ErrorCode code);

/**
 * @brief Exception thrown by session operations, tagged with an ErrorCode.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorCode _code, const string& message)
      : std::runtime_error(message), code(_code) {}

  /** @brief The classification used by callers to map the failure. */
  ErrorCode getCode() const { return code; }

 protected:
  ErrorCode code;
};
}  // namespace at

#endif  // __AT_SESSION_ERROR__
