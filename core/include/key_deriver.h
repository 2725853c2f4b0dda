#ifndef IDTOK_CORE_KEY_DERIVER_H
#define IDTOK_CORE_KEY_DERIVER_H

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include "config.h"
#include "crypto.h"
#include "secure_types.h"

namespace idtok::core {

using DerivedKey = crypto::AesKey;

// Stretches a user id into an AES-256 key with PBKDF2-HMAC-SHA-256 over the
// shared salt. With cache_entries > 0 the most recently used keys are kept
// so repeated issuance for one user pays the KDF once.
class KeyDeriver {
 public:
  KeyDeriver(const std::string& salt,
             std::uint32_t iterations = kDefaultKdfIterations,
             std::size_t cache_entries = 0);
  ~KeyDeriver();

  KeyDeriver(const KeyDeriver&) = delete;
  KeyDeriver& operator=(const KeyDeriver&) = delete;

  bool Derive(const std::string& user_id, DerivedKey& out_key,
              std::string& error);

  std::size_t cached_keys() const;
  std::uint32_t iterations() const { return iterations_; }

 private:
  struct CacheEntry {
    DerivedKey key{};
    std::list<std::string>::iterator lru_pos;
  };

  bool LookupLocked(const std::string& user_id, DerivedKey& out_key);
  void StoreLocked(const std::string& user_id, const DerivedKey& key);

  mutable std::mutex mutex_;
  shard::ScrambledString salt_;
  const std::uint32_t iterations_;
  const std::size_t cache_capacity_;
  std::list<std::string> lru_;
  std::unordered_map<std::string, CacheEntry> cache_;
};

}  // namespace idtok::core

#endif  // IDTOK_CORE_KEY_DERIVER_H
