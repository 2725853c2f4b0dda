#ifndef IDTOK_CORE_RANDOM_SOURCE_H
#define IDTOK_CORE_RANDOM_SOURCE_H

#include <cstddef>
#include <cstdint>

namespace idtok::core {

// Source of the IV and nonce bytes. Production code must use a CSPRNG; a
// predictable IV weakens CBC confidentiality.
class RandomSource {
 public:
  virtual ~RandomSource() = default;
  virtual bool Fill(std::uint8_t* out, std::size_t len) = 0;
};

class OsRandomSource final : public RandomSource {
 public:
  bool Fill(std::uint8_t* out, std::size_t len) override;
};

}  // namespace idtok::core

#endif  // IDTOK_CORE_RANDOM_SOURCE_H
