#ifndef IDTOK_CORE_IDENTIFIER_ISSUER_H
#define IDTOK_CORE_IDENTIFIER_ISSUER_H

#include <cstddef>
#include <string>
#include <string_view>

#include "random_source.h"
#include "session_payload.h"
#include "token_cipher.h"
#include "token_error.h"

namespace idtok::core {

constexpr std::size_t kNonceSize = 12;

struct IdentifierParts {
  std::string_view nonce_hex;
  std::string_view iv_hex;
  std::string_view cipher_hex;
};

// Splits "<nonce>:<iv>:<ciphertext>" and checks each field's hex shape
// (24 and 32 lowercase hex characters, then a non-empty even-length run).
// Views point into `identifier`.
bool SplitIdentifier(std::string_view identifier, IdentifierParts& out);

class IdentifierIssuer {
 public:
  IdentifierIssuer(TokenCipher* cipher, RandomSource* random);

  bool Issue(const std::string& user_id, const std::string& client_uuid,
             std::string& out_identifier, TokenError& error);

  // The nonce is a correlation tag only and carries no integrity.
  bool Open(std::string_view identifier, const std::string& user_id,
            SessionPayload& out_payload, TokenError& error);

 private:
  TokenCipher* cipher_;
  RandomSource* random_;
};

}  // namespace idtok::core

#endif  // IDTOK_CORE_IDENTIFIER_ISSUER_H
