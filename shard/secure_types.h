#ifndef IDTOK_SHARD_SECURE_TYPES_H
#define IDTOK_SHARD_SECURE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace idtok::shard {

// Keeps a string XOR-masked and optionally reversed in memory so that the
// plaintext does not sit in the heap between uses. Every get() re-masks with
// a fresh key.
// Obfuscation only; not a cryptographic protection. Not thread-safe: callers
// sharing an instance must serialize access.
class ScrambledString {
 public:
  ScrambledString() { encrypt(std::string{}); }
  explicit ScrambledString(const std::string &value) { encrypt(value); }
  ~ScrambledString();

  ScrambledString(const ScrambledString &other) { encrypt(other.get()); }
  ScrambledString &operator=(const ScrambledString &other) {
    if (this != &other) {
      encrypt(other.get());
    }
    return *this;
  }

  std::string get() const {
    auto plain = decrypt();
    encrypt(plain);
    return plain;
  }

 private:
  void encrypt(const std::string &value) const;
  std::string decrypt() const;

  static std::mt19937 &randomEngine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
  }

  static constexpr std::size_t kPermMetaSize = 4;
  static constexpr std::size_t kKeyMetaSize = 4;

  mutable std::vector<std::uint8_t> buffer_{};
  mutable std::size_t len_{0};
};

}  // namespace idtok::shard

#endif  // IDTOK_SHARD_SECURE_TYPES_H
