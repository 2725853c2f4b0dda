#include "identifier_issuer.h"

#include <array>

#include "crypto.h"
#include "hex_utils.h"

namespace idtok::core {

bool SplitIdentifier(std::string_view identifier, IdentifierParts& out) {
  out = IdentifierParts{};
  const auto first = identifier.find(':');
  if (first == std::string_view::npos) {
    return false;
  }
  const auto second = identifier.find(':', first + 1);
  if (second == std::string_view::npos ||
      identifier.find(':', second + 1) != std::string_view::npos) {
    return false;
  }
  const std::string_view nonce = identifier.substr(0, first);
  const std::string_view iv = identifier.substr(first + 1, second - first - 1);
  const std::string_view cipher = identifier.substr(second + 1);
  if (nonce.size() != kNonceSize * 2 || !common::IsLowerHex(nonce) ||
      iv.size() != crypto::kAesBlockSize * 2 || !common::IsLowerHex(iv) ||
      cipher.empty() || (cipher.size() % 2) != 0 ||
      !common::IsLowerHex(cipher)) {
    return false;
  }
  out.nonce_hex = nonce;
  out.iv_hex = iv;
  out.cipher_hex = cipher;
  return true;
}

IdentifierIssuer::IdentifierIssuer(TokenCipher* cipher, RandomSource* random)
    : cipher_(cipher), random_(random) {}

bool IdentifierIssuer::Issue(const std::string& user_id,
                             const std::string& client_uuid,
                             std::string& out_identifier, TokenError& error) {
  out_identifier.clear();
  if (!cipher_ || !random_) {
    error.Set(TokenErrorKind::kConfiguration, "issuer not initialized");
    return false;
  }
  std::string token;
  if (!cipher_->Encrypt(user_id, client_uuid, token, error)) {
    return false;
  }
  std::array<std::uint8_t, kNonceSize> nonce{};
  if (!random_->Fill(nonce.data(), nonce.size())) {
    error.Set(TokenErrorKind::kCrypto, "nonce generation failed");
    return false;
  }
  out_identifier = common::BytesToHex(nonce.data(), nonce.size());
  out_identifier.push_back(':');
  out_identifier.append(token);
  return true;
}

bool IdentifierIssuer::Open(std::string_view identifier,
                            const std::string& user_id,
                            SessionPayload& out_payload, TokenError& error) {
  out_payload = SessionPayload{};
  if (!cipher_) {
    error.Set(TokenErrorKind::kConfiguration, "issuer not initialized");
    return false;
  }
  IdentifierParts parts;
  if (!SplitIdentifier(identifier, parts)) {
    error.Set(TokenErrorKind::kDecryption, kTokenAuthFailure);
    return false;
  }
  // The token is everything after the nonce and its separator.
  const std::string_view token = identifier.substr(parts.nonce_hex.size() + 1);
  return cipher_->Decrypt(token, user_id, out_payload, error);
}

}  // namespace idtok::core
