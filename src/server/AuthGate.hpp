#ifndef __AT_AUTH_GATE__
#define __AT_AUTH_GATE__

#include <sodium.h>

#include "Headers.hpp"

namespace at {
/**
 * @brief Checks `Authorization: Bearer <token>` headers against a shared
 * secret in constant time.
 *
 * An empty secret disables authentication; that is logged loudly at
 * construction and again on the first request let through.
 */
class AuthGate {
 public:
  explicit AuthGate(const string& token);
  ~AuthGate();

  bool isEnabled() const { return enabled; }

  /**
   * @brief Validates the raw value of the Authorization header.
   * @throws SessionError(AUTH_FAILURE) when the header is missing,
   * malformed, or carries the wrong token.
   */
  void check(const string& authorizationHeader);

 protected:
  bool enabled;
  unsigned char tokenHash[crypto_generichash_BYTES];
  atomic<bool> warnedDisabled;
};
}  // namespace at

#endif  // __AT_AUTH_GATE__
