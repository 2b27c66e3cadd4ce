#ifndef __AT_CREDENTIAL_CIPHER__
#define __AT_CREDENTIAL_CIPHER__

#include <sodium.h>

#include "Headers.hpp"

namespace at {

/**
 * @brief Seals credential blobs at rest with libsodium secretbox.
 *
 * Every call draws a fresh random nonce which is prepended to the
 * ciphertext, so the stored form is nonce || ciphertext || MAC.
 */
class CredentialCipher {
 public:
  /**
   * @brief Initializes libsodium and decodes the key.
   * @param hexKey 64 hex characters (256 bits of key material).
   * @throws SessionError(VALIDATION_ERROR) when the key is malformed.
   */
  explicit CredentialCipher(const string& hexKey);
  ~CredentialCipher();

  /**
   * @brief Encrypts a plaintext buffer under a fresh nonce.
   * @return The nonce followed by the ciphertext including the MAC.
   */
  string encrypt(const string& plaintext);

  /**
   * @brief Authenticates and decrypts a blob produced by encrypt().
   * @throws SessionError(AUTH_FAILURE) on truncation or tampering.
   */
  string decrypt(const string& blob);

  /**
   * @brief Produces a new random key in the hex form accepted above.
   */
  static string generateHexKey();

 protected:
  /** @brief Shared secret key used for encrypt/decrypt operations. */
  unsigned char key[crypto_secretbox_KEYBYTES];
};
}  // namespace at

#endif  // __AT_CREDENTIAL_CIPHER__
