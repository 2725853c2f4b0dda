#ifndef IDTOK_HEX_UTILS_H
#define IDTOK_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idtok::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& bytes);
std::string Sha256Hex(const std::uint8_t* data, std::size_t len);
bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
bool IsLowerHex(std::string_view text);

}  // namespace idtok::common

#endif  // IDTOK_HEX_UTILS_H
