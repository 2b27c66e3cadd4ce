#include "AuthGate.hpp"

#include "SessionError.hpp"

namespace at {
namespace {
const string BEARER_PREFIX = "Bearer ";
}

AuthGate::AuthGate(const string& token)
    : enabled(!token.empty()), warnedDisabled(false) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  memset(tokenHash, 0, sizeof(tokenHash));
  if (enabled) {
    crypto_generichash(tokenHash, sizeof(tokenHash),
                       (const unsigned char*)token.c_str(), token.length(),
                       NULL, 0);
  } else {
    LOG(WARNING) << API_AUTH_TOKEN_ENV
                 << " is not configured; authentication is DISABLED";
  }
}

AuthGate::~AuthGate() { sodium_memzero(tokenHash, sizeof(tokenHash)); }

void AuthGate::check(const string& authorizationHeader) {
  if (!enabled) {
    bool expected = false;
    if (warnedDisabled.compare_exchange_strong(expected, true)) {
      LOG(WARNING) << "Serving an unauthenticated API request; set "
                   << API_AUTH_TOKEN_ENV << " to require a bearer token";
    }
    return;
  }

  if (authorizationHeader.length() <= BEARER_PREFIX.length() ||
      authorizationHeader.compare(0, BEARER_PREFIX.length(), BEARER_PREFIX) !=
          0) {
    throw SessionError(ErrorCode::AUTH_FAILURE,
                       "missing or invalid authorization header");
  }

  // Hashing both sides gives equal length inputs to the constant time compare
  unsigned char providedHash[crypto_generichash_BYTES];
  crypto_generichash(
      providedHash, sizeof(providedHash),
      (const unsigned char*)authorizationHeader.c_str() + BEARER_PREFIX.length(),
      authorizationHeader.length() - BEARER_PREFIX.length(), NULL, 0);
  if (sodium_memcmp(providedHash, tokenHash, sizeof(tokenHash)) != 0) {
    throw SessionError(ErrorCode::AUTH_FAILURE, "invalid authentication token");
  }
}
}  // namespace at
