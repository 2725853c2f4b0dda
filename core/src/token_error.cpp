#include "token_error.h"

namespace idtok::core {

const char* TokenErrorKindName(TokenErrorKind kind) {
  switch (kind) {
    case TokenErrorKind::kNone:
      return "none";
    case TokenErrorKind::kConfiguration:
      return "configuration";
    case TokenErrorKind::kCrypto:
      return "crypto";
    case TokenErrorKind::kDecryption:
      return "decryption";
    case TokenErrorKind::kInvalidInput:
      return "invalid_input";
  }
  return "unknown";
}

}  // namespace idtok::core
