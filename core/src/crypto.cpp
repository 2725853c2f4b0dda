#include "crypto.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <limits>

#include "secure_buffer.h"

namespace idtok::core::crypto {

namespace {

constexpr std::size_t kMaxEvpLen =
    static_cast<std::size_t>(std::numeric_limits<int>::max()) - kAesBlockSize;

struct CipherCtx {
  EVP_CIPHER_CTX* ctx{EVP_CIPHER_CTX_new()};
  ~CipherCtx() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }
};

std::string GetOpenSslError(const char* what) {
  const unsigned long err = ERR_get_error();
  ERR_clear_error();
  if (err == 0) {
    return std::string(what);
  }
  char buf[256] = {};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

}  // namespace

bool Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out) {
  static const std::uint8_t kEmpty = 0;
  unsigned int out_len = 0;
  if (EVP_Digest(data ? data : &kEmpty, data ? len : 0, out.bytes.data(),
                 &out_len, EVP_sha256(), nullptr) != 1 ||
      out_len != out.bytes.size()) {
    ERR_clear_error();
    return false;
  }
  return true;
}

bool Pbkdf2Sha256(const std::uint8_t* password, std::size_t password_len,
                  const std::uint8_t* salt, std::size_t salt_len,
                  std::uint32_t iterations, std::uint8_t* out_key,
                  std::size_t out_len, std::string& error) {
  if (!out_key || out_len == 0) {
    error = "pbkdf2 output missing";
    return false;
  }
  if (iterations == 0 ||
      iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
    error = "pbkdf2 iteration count invalid";
    return false;
  }
  if (password_len > kMaxEvpLen || salt_len > kMaxEvpLen ||
      out_len > kMaxEvpLen) {
    error = "pbkdf2 input too large";
    return false;
  }
  static const std::uint8_t kEmpty = 0;
  const int ok = PKCS5_PBKDF2_HMAC(
      reinterpret_cast<const char*>(password ? password : &kEmpty),
      static_cast<int>(password ? password_len : 0), salt ? salt : &kEmpty,
      static_cast<int>(salt ? salt_len : 0), static_cast<int>(iterations),
      EVP_sha256(), static_cast<int>(out_len), out_key);
  if (ok != 1) {
    error = GetOpenSslError("pbkdf2 failed");
    return false;
  }
  return true;
}

bool Aes256CbcEncrypt(const AesKey& key, const AesIv& iv,
                      const std::uint8_t* plain, std::size_t plain_len,
                      std::vector<std::uint8_t>& out_cipher,
                      std::string& error) {
  out_cipher.clear();
  if (!plain && plain_len != 0) {
    error = "aes plaintext missing";
    return false;
  }
  if (plain_len > kMaxEvpLen) {
    error = "aes plaintext too large";
    return false;
  }
  CipherCtx c;
  if (!c.ctx) {
    error = GetOpenSslError("aes context alloc failed");
    return false;
  }
  if (EVP_EncryptInit_ex(c.ctx, EVP_aes_256_cbc(), nullptr, key.data(),
                         iv.data()) != 1) {
    error = GetOpenSslError("aes encrypt init failed");
    return false;
  }

  out_cipher.resize(plain_len + kAesBlockSize);
  int len = 0;
  if (plain_len > 0 &&
      EVP_EncryptUpdate(c.ctx, out_cipher.data(), &len, plain,
                        static_cast<int>(plain_len)) != 1) {
    out_cipher.clear();
    error = GetOpenSslError("aes encrypt failed");
    return false;
  }
  int tail = 0;
  if (EVP_EncryptFinal_ex(c.ctx, out_cipher.data() + len, &tail) != 1) {
    out_cipher.clear();
    error = GetOpenSslError("aes encrypt final failed");
    return false;
  }
  out_cipher.resize(static_cast<std::size_t>(len + tail));
  return true;
}

bool Aes256CbcDecrypt(const AesKey& key, const AesIv& iv,
                      const std::uint8_t* cipher, std::size_t cipher_len,
                      std::vector<std::uint8_t>& out_plain,
                      std::string& error) {
  out_plain.clear();
  if (!cipher || cipher_len == 0 || (cipher_len % kAesBlockSize) != 0) {
    error = "aes ciphertext length invalid";
    return false;
  }
  if (cipher_len > kMaxEvpLen) {
    error = "aes ciphertext too large";
    return false;
  }
  CipherCtx c;
  if (!c.ctx) {
    error = GetOpenSslError("aes context alloc failed");
    return false;
  }
  if (EVP_DecryptInit_ex(c.ctx, EVP_aes_256_cbc(), nullptr, key.data(),
                         iv.data()) != 1) {
    error = GetOpenSslError("aes decrypt init failed");
    return false;
  }

  out_plain.resize(cipher_len + kAesBlockSize);
  int len = 0;
  if (EVP_DecryptUpdate(c.ctx, out_plain.data(), &len, cipher,
                        static_cast<int>(cipher_len)) != 1) {
    common::SecureWipe(out_plain);
    out_plain.clear();
    error = GetOpenSslError("aes decrypt failed");
    return false;
  }
  int tail = 0;
  if (EVP_DecryptFinal_ex(c.ctx, out_plain.data() + len, &tail) != 1) {
    // Wrong key and corrupted ciphertext both land here as a padding error.
    common::SecureWipe(out_plain);
    out_plain.clear();
    ERR_clear_error();
    error = "aes padding invalid";
    return false;
  }
  out_plain.resize(static_cast<std::size_t>(len + tail));
  return true;
}

}  // namespace idtok::core::crypto
