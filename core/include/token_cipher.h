#ifndef IDTOK_CORE_TOKEN_CIPHER_H
#define IDTOK_CORE_TOKEN_CIPHER_H

#include <mutex>
#include <string>
#include <string_view>

#include "crypto.h"
#include "key_deriver.h"
#include "random_source.h"
#include "secure_types.h"
#include "session_payload.h"
#include "token_error.h"

namespace idtok::core {

// Message reported for every decryption failure, whatever the cause.
constexpr char kTokenAuthFailure[] = "token authentication failed";

// Produces and opens "<iv hex>:<ciphertext hex>" tokens: AES-256-CBC over the
// JSON payload, keyed per user by the KeyDeriver.
class TokenCipher {
 public:
  TokenCipher(KeyDeriver* deriver, const std::string& api_key,
              RandomSource* random);

  bool Encrypt(const std::string& user_id, const std::string& client_uuid,
               std::string& out_token, TokenError& error);

  // Same as Encrypt with a caller-chosen IV. Reusing an IV under one key
  // leaks plaintext equality; meant for known-answer checks.
  bool EncryptWithIv(const std::string& user_id,
                     const std::string& client_uuid, const crypto::AesIv& iv,
                     std::string& out_token, TokenError& error);

  // Fails with kDecryption and kTokenAuthFailure on any malformed,
  // tampered or foreign token.
  bool Decrypt(std::string_view token, const std::string& user_id,
               SessionPayload& out_payload, TokenError& error);

 private:
  std::string ApiKey() const;

  KeyDeriver* deriver_;
  RandomSource* random_;
  mutable std::mutex api_key_mutex_;
  shard::ScrambledString api_key_;
};

}  // namespace idtok::core

#endif  // IDTOK_CORE_TOKEN_CIPHER_H
