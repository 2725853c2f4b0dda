#ifndef IDTOK_CORE_SCRAMBLED_TABLE_H
#define IDTOK_CORE_SCRAMBLED_TABLE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace idtok::core {

class RandomSource;

// A secret stored as shuffled base64 of its reversed bytes. permutation[s]
// is the position in the unshuffled text that values[s] belongs to.
struct ScrambledTable {
  std::vector<std::uint8_t> values;
  std::vector<std::uint16_t> permutation;
};

// Checks that the permutation is a bijection on [0, values.size()).
bool ValidateScrambledTable(const ScrambledTable& table, std::string& error);

bool Descramble(const ScrambledTable& table, std::string& out_secret,
                std::string& error);

// Inverse of Descramble: reverse, base64-encode, then shuffle so that
// values[s] = encoded[permutation[s]]. The permutation must cover the
// encoded length exactly.
bool Scramble(const std::string& secret,
              const std::vector<std::uint16_t>& permutation,
              ScrambledTable& out_table, std::string& error);

// Uniform permutation of [0, len) via Fisher-Yates over `random`.
bool MakeRandomPermutation(std::size_t len, RandomSource* random,
                           std::vector<std::uint16_t>& out,
                           std::string& error);

// Length of the shuffled text Scramble produces for a secret of this size.
std::size_t ScrambledLength(std::size_t secret_len);

}  // namespace idtok::core

#endif  // IDTOK_CORE_SCRAMBLED_TABLE_H
