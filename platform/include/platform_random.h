#ifndef IDTOK_PLATFORM_RANDOM_H
#define IDTOK_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace idtok::platform {

// Fills `out` from the operating system CSPRNG. Returns false if fewer than
// `len` bytes could be produced; the buffer is zeroed in that case.
bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace idtok::platform

#endif  // IDTOK_PLATFORM_RANDOM_H
