#ifndef IDTOK_CONSTANT_TIME_H
#define IDTOK_CONSTANT_TIME_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace idtok::common {

// Runtime depends only on the longer input's length, never on content.
inline bool ConstantTimeEqual(const std::uint8_t* a, std::size_t a_len,
                              const std::uint8_t* b, std::size_t b_len) {
  const std::size_t max_len = a_len > b_len ? a_len : b_len;
  std::size_t diff = a_len ^ b_len;
  for (std::size_t i = 0; i < max_len; ++i) {
    const std::uint8_t ac = i < a_len ? a[i] : 0;
    const std::uint8_t bc = i < b_len ? b[i] : 0;
    diff |= static_cast<std::size_t>(ac ^ bc);
  }
  return diff == 0;
}

inline bool ConstantTimeEqual(std::string_view a, std::string_view b) {
  return ConstantTimeEqual(reinterpret_cast<const std::uint8_t*>(a.data()),
                           a.size(),
                           reinterpret_cast<const std::uint8_t*>(b.data()),
                           b.size());
}

}  // namespace idtok::common

#endif  // IDTOK_CONSTANT_TIME_H
