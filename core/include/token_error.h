#ifndef IDTOK_CORE_TOKEN_ERROR_H
#define IDTOK_CORE_TOKEN_ERROR_H

#include <cstdint>
#include <string>
#include <utility>

namespace idtok::core {

enum class TokenErrorKind : std::uint8_t {
  kNone = 0,
  kConfiguration = 1,
  kCrypto = 2,
  kDecryption = 3,
  kInvalidInput = 4
};

struct TokenError {
  TokenErrorKind kind{TokenErrorKind::kNone};
  std::string message;

  void Set(TokenErrorKind k, std::string msg) {
    kind = k;
    message = std::move(msg);
  }
  void Clear() {
    kind = TokenErrorKind::kNone;
    message.clear();
  }
  bool ok() const { return kind == TokenErrorKind::kNone; }
};

const char* TokenErrorKindName(TokenErrorKind kind);

}  // namespace idtok::core

#endif  // IDTOK_CORE_TOKEN_ERROR_H
