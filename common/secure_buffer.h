#ifndef IDTOK_SECURE_BUFFER_H
#define IDTOK_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idtok::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  volatile std::uint8_t* p = reinterpret_cast<volatile std::uint8_t*>(data);
  while (len--) {
    *p++ = 0;
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

inline void SecureWipe(std::string& text) {
  SecureWipe(text.empty() ? nullptr : &text[0], text.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Wipes the referenced storage when the scope ends. Only the final
// allocation is wiped; reserve up front if the buffer will grow.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf) : vec_(&buf) {}

  explicit ScopedWipe(std::string& text) : text_(&text) {}

  template <std::size_t N>
  explicit ScopedWipe(std::array<std::uint8_t, N>& buf)
      : raw_(buf.data()), raw_len_(N) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() {
    if (vec_) {
      SecureWipe(*vec_);
    }
    if (text_) {
      SecureWipe(*text_);
    }
    if (raw_) {
      SecureWipe(raw_, raw_len_);
    }
  }

 private:
  std::vector<std::uint8_t>* vec_{nullptr};
  std::string* text_{nullptr};
  void* raw_{nullptr};
  std::size_t raw_len_{0};
};

}  // namespace idtok::common

#endif  // IDTOK_SECURE_BUFFER_H
