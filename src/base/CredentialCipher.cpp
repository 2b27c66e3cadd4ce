#include "CredentialCipher.hpp"

#include "SessionError.hpp"

#define SODIUM_FAIL(X)                                         \
  {                                                            \
    int rc = (X);                                              \
    if ((rc) == -1) STFATAL << "Crypto Error: (" << rc << ")"; \
  }
namespace at {

CredentialCipher::CredentialCipher(const string& hexKey) {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  if (hexKey.length() != crypto_secretbox_KEYBYTES * 2) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "Encryption key must be " +
                           to_string(crypto_secretbox_KEYBYTES * 2) +
                           " hex characters");
  }
  size_t keyLength = 0;
  if (sodium_hex2bin(key, sizeof(key), hexKey.c_str(), hexKey.length(), NULL,
                     &keyLength, NULL) != 0 ||
      keyLength != crypto_secretbox_KEYBYTES) {
    sodium_memzero(key, sizeof(key));
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "Encryption key is not valid hex");
  }
}

CredentialCipher::~CredentialCipher() { sodium_memzero(key, sizeof(key)); }

string CredentialCipher::encrypt(const string& plaintext) {
  string retval(
      crypto_secretbox_NONCEBYTES + plaintext.length() + crypto_secretbox_MACBYTES,
      '\0');
  unsigned char* nonce = (unsigned char*)&retval[0];
  randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);
  SODIUM_FAIL(crypto_secretbox_easy(
      (unsigned char*)&retval[crypto_secretbox_NONCEBYTES],
      (const unsigned char*)plaintext.c_str(), plaintext.length(), nonce, key));
  return retval;
}

string CredentialCipher::decrypt(const string& blob) {
  if (blob.length() < crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES) {
    throw SessionError(ErrorCode::AUTH_FAILURE, "Ciphertext too short");
  }
  const unsigned char* nonce = (const unsigned char*)blob.c_str();
  size_t cipherLength = blob.length() - crypto_secretbox_NONCEBYTES;
  string retval(cipherLength - crypto_secretbox_MACBYTES, '\0');
  if (crypto_secretbox_open_easy(
          (unsigned char*)&retval[0],
          (const unsigned char*)blob.c_str() + crypto_secretbox_NONCEBYTES,
          cipherLength, nonce, key) == -1) {
    throw SessionError(ErrorCode::AUTH_FAILURE,
                       "Decrypt failed.  Possible key mismatch?");
  }
  return retval;
}

string CredentialCipher::generateHexKey() {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  unsigned char raw[crypto_secretbox_KEYBYTES];
  crypto_secretbox_keygen(raw);
  char hex[crypto_secretbox_KEYBYTES * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
  sodium_memzero(raw, sizeof(raw));
  string retval(hex);
  sodium_memzero(hex, sizeof(hex));
  return retval;
}
}  // namespace at
