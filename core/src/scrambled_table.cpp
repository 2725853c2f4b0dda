#include "scrambled_table.h"

#include <algorithm>
#include <limits>
#include <string_view>

#include "random_source.h"
#include "secure_buffer.h"
#include "text_codec.h"

namespace idtok::core {

namespace {

bool CheckPermutation(const std::vector<std::uint16_t>& permutation,
                      std::size_t expected_len, std::string& error) {
  if (permutation.size() != expected_len) {
    error = "scrambled table permutation length mismatch";
    return false;
  }
  std::vector<bool> seen(expected_len, false);
  for (const std::uint16_t dst : permutation) {
    if (dst >= expected_len) {
      error = "scrambled table permutation out of range";
      return false;
    }
    if (seen[dst]) {
      error = "scrambled table permutation not a bijection";
      return false;
    }
    seen[dst] = true;
  }
  return true;
}

}  // namespace

bool ValidateScrambledTable(const ScrambledTable& table, std::string& error) {
  if (table.values.empty()) {
    error = "scrambled table empty";
    return false;
  }
  return CheckPermutation(table.permutation, table.values.size(), error);
}

bool Descramble(const ScrambledTable& table, std::string& out_secret,
                std::string& error) {
  out_secret.clear();
  if (!ValidateScrambledTable(table, error)) {
    return false;
  }

  std::string text(table.values.size(), '\0');
  common::ScopedWipe wipe_text(text);
  for (std::size_t s = 0; s < table.permutation.size(); ++s) {
    text[table.permutation[s]] = static_cast<char>(table.values[s]);
  }
  if (!common::IsValidUtf8(text)) {
    error = "scrambled table text not utf-8";
    return false;
  }

  std::vector<std::uint8_t> decoded;
  common::ScopedWipe wipe_decoded(decoded);
  std::string b64_error;
  if (!common::Base64Decode(text, decoded, b64_error)) {
    error = "scrambled table " + b64_error;
    return false;
  }
  std::reverse(decoded.begin(), decoded.end());
  if (!common::IsValidUtf8(decoded.data(), decoded.size())) {
    error = "scrambled table secret not utf-8";
    return false;
  }
  out_secret.assign(decoded.begin(), decoded.end());
  return true;
}

bool MakeRandomPermutation(std::size_t len, RandomSource* random,
                           std::vector<std::uint16_t>& out,
                           std::string& error) {
  out.clear();
  if (!random) {
    error = "random source missing";
    return false;
  }
  if (len == 0 || len > std::numeric_limits<std::uint16_t>::max()) {
    error = "permutation length invalid";
    return false;
  }
  out.resize(len);
  for (std::size_t i = 0; i < len; ++i) {
    out[i] = static_cast<std::uint16_t>(i);
  }
  for (std::size_t i = len - 1; i > 0; --i) {
    // Rejection sampling keeps the pick unbiased for any bound.
    const std::uint32_t bound = static_cast<std::uint32_t>(i + 1);
    const std::uint32_t limit =
        std::numeric_limits<std::uint32_t>::max() -
        (std::numeric_limits<std::uint32_t>::max() % bound);
    std::uint32_t r = 0;
    do {
      std::uint8_t bytes[4] = {};
      if (!random->Fill(bytes, sizeof(bytes))) {
        out.clear();
        error = "random generation failed";
        return false;
      }
      r = static_cast<std::uint32_t>(bytes[0]) |
          (static_cast<std::uint32_t>(bytes[1]) << 8) |
          (static_cast<std::uint32_t>(bytes[2]) << 16) |
          (static_cast<std::uint32_t>(bytes[3]) << 24);
    } while (r >= limit);
    std::swap(out[i], out[r % bound]);
  }
  return true;
}

std::size_t ScrambledLength(std::size_t secret_len) {
  return 4 * ((secret_len + 2) / 3);
}

bool Scramble(const std::string& secret,
              const std::vector<std::uint16_t>& permutation,
              ScrambledTable& out_table, std::string& error) {
  out_table = ScrambledTable{};
  if (secret.empty()) {
    error = "secret empty";
    return false;
  }
  if (!common::IsValidUtf8(secret)) {
    error = "secret not utf-8";
    return false;
  }

  std::vector<std::uint8_t> reversed(secret.rbegin(), secret.rend());
  common::ScopedWipe wipe_reversed(reversed);
  std::string text = common::Base64Encode(reversed.data(), reversed.size());
  common::ScopedWipe wipe_text(text);
  if (text.size() != ScrambledLength(secret.size())) {
    error = "secret encode failed";
    return false;
  }
  if (!CheckPermutation(permutation, text.size(), error)) {
    return false;
  }

  out_table.values.resize(text.size());
  for (std::size_t s = 0; s < permutation.size(); ++s) {
    out_table.values[s] = static_cast<std::uint8_t>(text[permutation[s]]);
  }
  out_table.permutation = permutation;
  return true;
}

}  // namespace idtok::core
