#include <cassert>
#include <string>
#include <thread>
#include <vector>

#include "hex_utils.h"
#include "key_deriver.h"

using idtok::core::DerivedKey;
using idtok::core::KeyDeriver;

namespace {

const std::string kSalt = "7IXVs84OGa3g9L9EVvdKI2DL";

std::string KeyHex(const DerivedKey& key) {
  return idtok::common::BytesToHex(key.data(), key.size());
}

}  // namespace

int main() {
  {
    KeyDeriver deriver(kSalt);
    assert(deriver.iterations() == 100000);
    DerivedKey k1{};
    DerivedKey k1_again{};
    DerivedKey k2{};
    std::string err;
    bool ok = deriver.Derive("u1", k1, err);
    assert(ok);
    assert(KeyHex(k1) ==
           "56bc7172b8e098c2b9ad407f9916e8b0411e95348af6e72ce67c31e7494b9439");
    ok = deriver.Derive("u1", k1_again, err);
    assert(ok);
    assert(k1 == k1_again);
    ok = deriver.Derive("u2", k2, err);
    assert(ok);
    assert(KeyHex(k2) ==
           "0043a4fa7ae8dfef435de1fce3df9edebd43a6202d32b2eaee18d7827e08728a");
    assert(k1 != k2);
    assert(deriver.cached_keys() == 0);
  }

  {
    KeyDeriver deriver(kSalt, 1000);
    DerivedKey key{};
    std::string err;
    bool ok = deriver.Derive("u1", key, err);
    assert(ok);
    assert(KeyHex(key) ==
           "de193f69816bd8ef071101a4e56a81f98a4d726c869c6bc9ba71a9ba58ef29ad");
  }

  {
    KeyDeriver deriver(kSalt, 1000, 2);
    DerivedKey a{};
    DerivedKey b{};
    std::string err;
    bool ok = deriver.Derive("u1", a, err);
    assert(ok);
    assert(deriver.cached_keys() == 1);
    ok = deriver.Derive("u1", b, err);
    assert(ok);
    assert(a == b);
    assert(deriver.cached_keys() == 1);

    ok = deriver.Derive("u2", b, err);
    assert(ok);
    ok = deriver.Derive("u3", b, err);
    assert(ok);
    assert(deriver.cached_keys() == 2);

    // u1 was evicted; deriving it again must still give the same key.
    ok = deriver.Derive("u1", b, err);
    assert(ok);
    assert(a == b);
    assert(deriver.cached_keys() == 2);
  }

  {
    KeyDeriver deriver(kSalt, 0);
    DerivedKey key{};
    std::string err;
    bool ok = deriver.Derive("u1", key, err);
    assert(!ok);
    assert(!err.empty());
    assert(key == DerivedKey{});
  }

  {
    KeyDeriver deriver(kSalt, 1000, 4);
    DerivedKey expected{};
    std::string err;
    bool ok = deriver.Derive("shared", expected, err);
    assert(ok);
    std::vector<std::thread> workers;
    std::vector<int> results(4, 0);
    for (std::size_t t = 0; t < results.size(); ++t) {
      workers.emplace_back([&deriver, &expected, &results, t]() {
        for (int i = 0; i < 8; ++i) {
          DerivedKey key{};
          std::string thread_err;
          const std::string user = i % 2 == 0 ? "shared" : "other";
          if (!deriver.Derive(user, key, thread_err)) {
            return;
          }
          if (user == "shared" && key != expected) {
            return;
          }
        }
        results[t] = 1;
      });
    }
    for (auto& w : workers) {
      w.join();
    }
    for (const int r : results) {
      assert(r == 1);
    }
    assert(deriver.cached_keys() == 2);
  }
  return 0;
}
