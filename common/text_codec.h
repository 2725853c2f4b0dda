#ifndef IDTOK_TEXT_CODEC_H
#define IDTOK_TEXT_CODEC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idtok::common {

// Strict UTF-8 check: rejects overlong forms, surrogates and code points
// above U+10FFFF.
bool IsValidUtf8(const std::uint8_t* data, std::size_t len);
bool IsValidUtf8(std::string_view text);

// Standard alphabet with '=' padding. Decoding rejects whitespace, missing
// padding and characters outside the alphabet.
std::string Base64Encode(const std::uint8_t* data, std::size_t len);
bool Base64Decode(std::string_view text, std::vector<std::uint8_t>& out,
                  std::string& error);

}  // namespace idtok::common

#endif  // IDTOK_TEXT_CODEC_H
