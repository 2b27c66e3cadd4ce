#include "CredentialCipher.hpp"
#include "TestHeaders.hpp"

using namespace at;

TEST_CASE("CredentialCipher encrypts and decrypts", "[CredentialCipher]") {
  string key = CredentialCipher::generateHexKey();
  REQUIRE(key.length() == 64);
  CredentialCipher cipher(key);

  SessionCredentials credentials;
  credentials.set_anthropicapikey("sk-ant-secret");
  credentials.set_githubtoken("ghp_token");
  string plaintext = protoToString(credentials);

  string sealed = cipher.encrypt(plaintext);
  REQUIRE(sealed.length() == plaintext.length() + crypto_secretbox_NONCEBYTES +
                                 crypto_secretbox_MACBYTES);
  REQUIRE(sealed.find("sk-ant-secret") == string::npos);

  auto decoded = stringToProto<SessionCredentials>(cipher.decrypt(sealed));
  REQUIRE(decoded.anthropicapikey() == "sk-ant-secret");
  REQUIRE(decoded.githubtoken() == "ghp_token");
}

TEST_CASE("CredentialCipher uses a fresh nonce per message",
          "[CredentialCipher]") {
  CredentialCipher cipher(CredentialCipher::generateHexKey());
  string a = cipher.encrypt("same plaintext");
  string b = cipher.encrypt("same plaintext");
  REQUIRE(a != b);
  REQUIRE(cipher.decrypt(a) == cipher.decrypt(b));
  REQUIRE(cipher.decrypt(cipher.encrypt("")) == "");
}

TEST_CASE("CredentialCipher rejects tampered and foreign ciphertext",
          "[CredentialCipher]") {
  CredentialCipher cipher(CredentialCipher::generateHexKey());
  string sealed = cipher.encrypt("secret");

  SECTION("Flipped byte") {
    sealed[sealed.length() - 1] ^= 0x01;
    REQUIRE(errorCodeOf([&]() { cipher.decrypt(sealed); }) ==
            ErrorCode::AUTH_FAILURE);
  }

  SECTION("Truncated") {
    REQUIRE(errorCodeOf([&]() { cipher.decrypt(sealed.substr(0, 10)); }) ==
            ErrorCode::AUTH_FAILURE);
  }

  SECTION("Different key") {
    CredentialCipher other(CredentialCipher::generateHexKey());
    REQUIRE(errorCodeOf([&]() { other.decrypt(sealed); }) ==
            ErrorCode::AUTH_FAILURE);
  }
}

TEST_CASE("CredentialCipher validates the key", "[CredentialCipher]") {
  REQUIRE(errorCodeOf([]() { CredentialCipher cipher("abcd"); }) ==
          ErrorCode::VALIDATION_ERROR);
  REQUIRE(errorCodeOf([]() { CredentialCipher cipher(string(64, 'z')); }) ==
          ErrorCode::VALIDATION_ERROR);
  CredentialCipher cipher(string(64, 'a'));
  REQUIRE(cipher.decrypt(cipher.encrypt("ok")) == "ok");
}
