#include "platform_random.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace idtok::platform {

namespace {

#if defined(__linux__)
std::size_t FillFromGetrandom(std::uint8_t* out, std::size_t len) {
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = getrandom(out + done, len - done, 0);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  return done;
}
#endif

std::size_t FillFromUrandom(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return 0;
  }
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = ::read(fd, out + done, len - done);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  ::close(fd);
  return done;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
#if defined(__linux__)
  if (FillFromGetrandom(out, len) == len) {
    return true;
  }
#endif
  if (FillFromUrandom(out, len) == len) {
    return true;
  }
  std::memset(out, 0, len);
  return false;
}

}  // namespace idtok::platform
