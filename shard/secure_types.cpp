#include "secure_types.h"

#include <array>

#include "secure_buffer.h"

namespace idtok::shard {

namespace {

std::array<std::uint8_t, 4> SplitLe(std::uint32_t v) {
  return {static_cast<std::uint8_t>(v & 0xFF),
          static_cast<std::uint8_t>((v >> 8) & 0xFF),
          static_cast<std::uint8_t>((v >> 16) & 0xFF),
          static_cast<std::uint8_t>((v >> 24) & 0xFF)};
}

void WriteLe(std::vector<std::uint8_t> &buf, std::size_t offset,
             std::uint32_t v) {
  const auto bytes = SplitLe(v);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    buf[offset + i] = bytes[i];
  }
}

std::uint32_t ReadLe(const std::vector<std::uint8_t> &buf,
                     std::size_t offset) {
  return static_cast<std::uint32_t>(buf[offset]) |
         (static_cast<std::uint32_t>(buf[offset + 1]) << 8) |
         (static_cast<std::uint32_t>(buf[offset + 2]) << 16) |
         (static_cast<std::uint32_t>(buf[offset + 3]) << 24);
}

}  // namespace

ScrambledString::~ScrambledString() { common::SecureWipe(buffer_); }

void ScrambledString::encrypt(const std::string &value) const {
  const std::uint32_t key = randomEngine()();
  const auto mask = SplitLe(key);
  const std::size_t len = value.size();
  const std::uint32_t reversed = (len > 1) ? (randomEngine()() & 0x1u) : 0u;

  common::SecureWipe(buffer_);
  buffer_.assign(len + kPermMetaSize + kKeyMetaSize, 0);
  for (std::size_t i = 0; i < len; ++i) {
    const std::size_t target = reversed ? (len - 1 - i) : i;
    buffer_[target] = static_cast<std::uint8_t>(
        static_cast<unsigned char>(value[i]) ^ mask[i & 3]);
  }
  len_ = len;
  WriteLe(buffer_, len_, reversed);
  WriteLe(buffer_, len_ + kPermMetaSize, key);
}

std::string ScrambledString::decrypt() const {
  if (buffer_.size() != len_ + kPermMetaSize + kKeyMetaSize) {
    return std::string{};
  }
  const std::uint32_t reversed = ReadLe(buffer_, len_);
  const auto mask = SplitLe(ReadLe(buffer_, len_ + kPermMetaSize));

  std::string plain(len_, '\0');
  for (std::size_t i = 0; i < len_; ++i) {
    const std::size_t source = reversed ? (len_ - 1 - i) : i;
    plain[i] = static_cast<char>(buffer_[source] ^ mask[i & 3]);
  }
  return plain;
}

}  // namespace idtok::shard
