#include "token_cipher.h"

#include <algorithm>
#include <utility>
#include <vector>

#include "constant_time.h"
#include "hex_utils.h"
#include "secure_buffer.h"

namespace idtok::core {

TokenCipher::TokenCipher(KeyDeriver* deriver, const std::string& api_key,
                         RandomSource* random)
    : deriver_(deriver), random_(random), api_key_(api_key) {}

std::string TokenCipher::ApiKey() const {
  std::lock_guard<std::mutex> lock(api_key_mutex_);
  return api_key_.get();
}

bool TokenCipher::Encrypt(const std::string& user_id,
                          const std::string& client_uuid,
                          std::string& out_token, TokenError& error) {
  out_token.clear();
  if (!random_) {
    error.Set(TokenErrorKind::kConfiguration, "random source missing");
    return false;
  }
  crypto::AesIv iv{};
  if (!random_->Fill(iv.data(), iv.size())) {
    error.Set(TokenErrorKind::kCrypto, "iv generation failed");
    return false;
  }
  return EncryptWithIv(user_id, client_uuid, iv, out_token, error);
}

bool TokenCipher::EncryptWithIv(const std::string& user_id,
                                const std::string& client_uuid,
                                const crypto::AesIv& iv,
                                std::string& out_token, TokenError& error) {
  out_token.clear();
  if (!deriver_) {
    error.Set(TokenErrorKind::kConfiguration, "key deriver missing");
    return false;
  }

  SessionPayload payload;
  payload.user_id = user_id;
  payload.client_uuid = client_uuid;
  payload.api_key = ApiKey();
  std::string json;
  std::string reason;
  const bool serialized = SerializePayload(payload, json, reason);
  WipePayload(payload);
  common::ScopedWipe wipe_json(json);
  if (!serialized) {
    error.Set(TokenErrorKind::kInvalidInput, reason);
    return false;
  }

  DerivedKey key{};
  common::ScopedWipe wipe_key(key);
  if (!deriver_->Derive(user_id, key, reason)) {
    error.Set(TokenErrorKind::kCrypto, reason);
    return false;
  }

  std::vector<std::uint8_t> cipher;
  if (!crypto::Aes256CbcEncrypt(
          key, iv, reinterpret_cast<const std::uint8_t*>(json.data()),
          json.size(), cipher, reason)) {
    error.Set(TokenErrorKind::kCrypto, reason);
    return false;
  }

  out_token = common::BytesToHex(iv.data(), iv.size());
  out_token.push_back(':');
  out_token.append(common::BytesToHex(cipher));
  error.Clear();
  return true;
}

bool TokenCipher::Decrypt(std::string_view token, const std::string& user_id,
                          SessionPayload& out_payload, TokenError& error) {
  out_payload = SessionPayload{};
  const auto fail = [&error]() {
    error.Set(TokenErrorKind::kDecryption, kTokenAuthFailure);
    return false;
  };
  if (!deriver_) {
    error.Set(TokenErrorKind::kConfiguration, "key deriver missing");
    return false;
  }

  const auto sep = token.find(':');
  if (sep == std::string_view::npos) {
    return fail();
  }
  std::vector<std::uint8_t> iv_bytes;
  std::vector<std::uint8_t> cipher;
  if (!common::HexToBytes(token.substr(0, sep), iv_bytes) ||
      iv_bytes.size() != crypto::kAesBlockSize ||
      !common::HexToBytes(token.substr(sep + 1), cipher) ||
      (cipher.size() % crypto::kAesBlockSize) != 0) {
    return fail();
  }
  crypto::AesIv iv{};
  std::copy(iv_bytes.begin(), iv_bytes.end(), iv.begin());

  DerivedKey key{};
  common::ScopedWipe wipe_key(key);
  std::string reason;
  if (!deriver_->Derive(user_id, key, reason)) {
    // The KDF itself failing is an environment problem, not a bad token.
    error.Set(TokenErrorKind::kCrypto, reason);
    return false;
  }

  std::vector<std::uint8_t> plain;
  common::ScopedWipe wipe_plain(plain);
  if (!crypto::Aes256CbcDecrypt(key, iv, cipher.data(), cipher.size(), plain,
                                reason)) {
    return fail();
  }

  SessionPayload payload;
  const std::string_view json(reinterpret_cast<const char*>(plain.data()),
                              plain.size());
  std::string api_key = ApiKey();
  common::ScopedWipe wipe_api_key(api_key);
  const bool parsed = ParsePayload(json, payload, reason);
  const bool user_ok =
      parsed && common::ConstantTimeEqual(payload.user_id, user_id);
  const bool api_key_ok =
      parsed && common::ConstantTimeEqual(payload.api_key, api_key);
  if (!user_ok || !api_key_ok) {
    WipePayload(payload);
    return fail();
  }
  out_payload = std::move(payload);
  error.Clear();
  return true;
}

}  // namespace idtok::core
