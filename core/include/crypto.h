#ifndef IDTOK_CORE_CRYPTO_H
#define IDTOK_CORE_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idtok::core::crypto {

constexpr std::size_t kAesKeySize = 32;
constexpr std::size_t kAesBlockSize = 16;

struct Sha256Digest {
  std::array<std::uint8_t, 32> bytes{};
};

using AesKey = std::array<std::uint8_t, kAesKeySize>;
using AesIv = std::array<std::uint8_t, kAesBlockSize>;

bool Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out);

// PBKDF2 with HMAC-SHA-256 as the PRF (RFC 8018).
bool Pbkdf2Sha256(const std::uint8_t* password, std::size_t password_len,
                  const std::uint8_t* salt, std::size_t salt_len,
                  std::uint32_t iterations, std::uint8_t* out_key,
                  std::size_t out_len, std::string& error);

// AES-256-CBC with PKCS#7 padding. An empty plaintext still produces one
// block of padding.
bool Aes256CbcEncrypt(const AesKey& key, const AesIv& iv,
                      const std::uint8_t* plain, std::size_t plain_len,
                      std::vector<std::uint8_t>& out_cipher,
                      std::string& error);

bool Aes256CbcDecrypt(const AesKey& key, const AesIv& iv,
                      const std::uint8_t* cipher, std::size_t cipher_len,
                      std::vector<std::uint8_t>& out_plain,
                      std::string& error);

}  // namespace idtok::core::crypto

#endif  // IDTOK_CORE_CRYPTO_H
