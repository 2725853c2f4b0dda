#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "builtin_tables.h"
#include "random_source.h"
#include "scrambled_table.h"

using idtok::core::Descramble;
using idtok::core::MakeRandomPermutation;
using idtok::core::Scramble;
using idtok::core::ScrambledLength;
using idtok::core::ScrambledTable;
using idtok::core::ValidateScrambledTable;

namespace {

class CounterRandom final : public idtok::core::RandomSource {
 public:
  bool Fill(std::uint8_t* out, std::size_t len) override {
    for (std::size_t i = 0; i < len; ++i) {
      out[i] = next_++;
    }
    return true;
  }

 private:
  std::uint8_t next_{0};
};

class FailingRandom final : public idtok::core::RandomSource {
 public:
  bool Fill(std::uint8_t*, std::size_t) override { return false; }
};

ScrambledTable Identity(const std::string& text) {
  ScrambledTable table;
  for (std::size_t i = 0; i < text.size(); ++i) {
    table.values.push_back(static_cast<std::uint8_t>(text[i]));
    table.permutation.push_back(static_cast<std::uint16_t>(i));
  }
  return table;
}

bool IsBijection(const std::vector<std::uint16_t>& perm) {
  std::vector<std::uint16_t> sorted = perm;
  std::sort(sorted.begin(), sorted.end());
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (sorted[i] != i) {
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  std::string secret;
  std::string err;

  // "aWg=" is base64 of "ih"; reversing gives the secret.
  {
    ScrambledTable table{{61, 103, 87, 97}, {3, 2, 1, 0}};
    bool ok = Descramble(table, secret, err);
    assert(ok);
    assert(secret == "hi");

    ok = Descramble(Identity("aWg="), secret, err);
    assert(ok);
    assert(secret == "hi");

    // Swapping the first two slots puts "Wa" back in order.
    ScrambledTable swapped{{87, 97, 103, 61}, {1, 0, 2, 3}};
    ok = Descramble(swapped, secret, err);
    assert(ok);
    assert(secret == "hi");
  }

  {
    bool ok = Descramble(idtok::core::BuiltinKdfSaltTable(), secret, err);
    assert(ok);
    assert(secret == "7IXVs84OGa3g9L9EVvdKI2DL");

    ok = Descramble(idtok::core::BuiltinApiKeyTable(), secret, err);
    assert(ok);
    assert(secret ==
           "6ce819f5dcc039febae2420016f148be28ef78389fc76790fb0671ab3c8925db");
  }

  // Permutation must be a bijection on [0, len).
  {
    ScrambledTable dup{{61, 103, 87, 97}, {3, 3, 1, 0}};
    assert(!ValidateScrambledTable(dup, err));
    assert(err == "scrambled table permutation not a bijection");
    assert(!Descramble(dup, secret, err));
    assert(secret.empty());

    ScrambledTable out_of_range{{61, 103, 87, 97}, {4, 2, 1, 0}};
    assert(!Descramble(out_of_range, secret, err));
    assert(err == "scrambled table permutation out of range");

    ScrambledTable short_perm{{61, 103, 87, 97}, {2, 1, 0}};
    assert(!Descramble(short_perm, secret, err));
    assert(err == "scrambled table permutation length mismatch");

    ScrambledTable empty;
    assert(!Descramble(empty, secret, err));
    assert(err == "scrambled table empty");
  }

  assert(!Descramble(Identity("a*=="), secret, err));
  assert(!Descramble(Identity("aWg"), secret, err));
  // 0xFF on its own is not UTF-8.
  assert(!Descramble(Identity("/w=="), secret, err));
  {
    ScrambledTable non_utf8_text{{0xC3, 97, 97, 97}, {0, 1, 2, 3}};
    assert(!Descramble(non_utf8_text, secret, err));
  }

  {
    ScrambledTable table;
    bool ok = Scramble("hi", {3, 2, 1, 0}, table, err);
    assert(ok);
    assert(table.values == (std::vector<std::uint8_t>{61, 103, 87, 97}));
    assert(table.permutation == (std::vector<std::uint16_t>{3, 2, 1, 0}));

    assert(!Scramble("hi", {0, 1, 2}, table, err));
    assert(!Scramble("hi", {0, 1, 1, 2}, table, err));
    assert(!Scramble("", {}, table, err));
    assert(!Scramble(std::string("\xFF"), {0, 1, 2, 3}, table, err));
  }

  assert(ScrambledLength(1) == 4);
  assert(ScrambledLength(3) == 4);
  assert(ScrambledLength(24) == 32);
  assert(ScrambledLength(64) == 88);

  {
    CounterRandom random;
    std::vector<std::uint16_t> perm;
    bool ok = MakeRandomPermutation(88, &random, perm, err);
    assert(ok);
    assert(perm.size() == 88);
    assert(IsBijection(perm));

    ok = MakeRandomPermutation(1, &random, perm, err);
    assert(ok);
    assert(perm == (std::vector<std::uint16_t>{0}));

    assert(!MakeRandomPermutation(0, &random, perm, err));
    assert(!MakeRandomPermutation(4, nullptr, perm, err));
    FailingRandom failing;
    assert(!MakeRandomPermutation(4, &failing, perm, err));
    assert(perm.empty());
  }

  // Rotating a secret through a fresh table recovers it exactly.
  {
    idtok::core::OsRandomSource random;
    const std::vector<std::string> secrets = {
        "7IXVs84OGa3g9L9EVvdKI2DL",
        "6ce819f5dcc039febae2420016f148be28ef78389fc76790fb0671ab3c8925db",
        "x", "caf\xC3\xA9 \xE2\x82\xAC"};
    for (const auto& expected : secrets) {
      std::vector<std::uint16_t> perm;
      bool ok = MakeRandomPermutation(ScrambledLength(expected.size()),
                                      &random, perm, err);
      assert(ok);
      ScrambledTable table;
      ok = Scramble(expected, perm, table, err);
      assert(ok);
      ok = ValidateScrambledTable(table, err);
      assert(ok);
      ok = Descramble(table, secret, err);
      assert(ok);
      assert(secret == expected);
    }
  }
  return 0;
}
