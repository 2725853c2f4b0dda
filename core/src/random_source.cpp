#include "random_source.h"

#include "platform_random.h"

namespace idtok::core {

bool OsRandomSource::Fill(std::uint8_t* out, std::size_t len) {
  return idtok::platform::RandomBytes(out, len);
}

}  // namespace idtok::core
