#include "text_codec.h"

#include <openssl/evp.h>

#include <limits>

namespace idtok::common {

namespace {

bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool IsContinuation(std::uint8_t b) { return (b & 0xC0) == 0x80; }

}  // namespace

bool IsValidUtf8(const std::uint8_t* data, std::size_t len) {
  if (!data) {
    return len == 0;
  }
  std::size_t i = 0;
  while (i < len) {
    const std::uint8_t b0 = data[i];
    if (b0 < 0x80) {
      ++i;
      continue;
    }
    std::size_t need = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0) {
      need = 1;
      cp = b0 & 0x1F;
      min_cp = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
      need = 2;
      cp = b0 & 0x0F;
      min_cp = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
      need = 3;
      cp = b0 & 0x07;
      min_cp = 0x10000;
    } else {
      return false;
    }
    if (len - i <= need) {
      return false;
    }
    for (std::size_t k = 1; k <= need; ++k) {
      const std::uint8_t b = data[i + k];
      if (!IsContinuation(b)) {
        return false;
      }
      cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += need + 1;
  }
  return true;
}

bool IsValidUtf8(std::string_view text) {
  return IsValidUtf8(reinterpret_cast<const std::uint8_t*>(text.data()),
                     text.size());
}

std::string Base64Encode(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0 ||
      len > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2)) {
    return {};
  }
  std::string out;
  out.resize(4 * ((len + 2) / 3) + 1);
  const int written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                      static_cast<int>(len));
  if (written < 0) {
    return {};
  }
  out.resize(static_cast<std::size_t>(written));
  return out;
}

bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out,
                  std::string& error) {
  out.clear();
  if (text.empty()) {
    return true;
  }
  if ((text.size() % 4) != 0 ||
      text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    error = "base64 length invalid";
    return false;
  }
  std::size_t padding = 0;
  if (text[text.size() - 1] == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  for (std::size_t i = 0; i < text.size() - padding; ++i) {
    if (!IsBase64Char(text[i])) {
      error = "base64 character invalid";
      return false;
    }
  }

  out.resize(text.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(
      out.data(), reinterpret_cast<const unsigned char*>(text.data()),
      static_cast<int>(text.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    out.clear();
    error = "base64 decode failed";
    return false;
  }
  // EVP_DecodeBlock counts the zero bytes produced by '=' padding.
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return true;
}

}  // namespace idtok::common
