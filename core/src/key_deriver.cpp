#include "key_deriver.h"

#include "secure_buffer.h"

namespace idtok::core {

KeyDeriver::KeyDeriver(const std::string& salt, std::uint32_t iterations,
                       std::size_t cache_entries)
    : salt_(salt), iterations_(iterations), cache_capacity_(cache_entries) {}

KeyDeriver::~KeyDeriver() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& kv : cache_) {
    common::SecureWipe(kv.second.key);
  }
}

bool KeyDeriver::LookupLocked(const std::string& user_id,
                              DerivedKey& out_key) {
  auto it = cache_.find(user_id);
  if (it == cache_.end()) {
    return false;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  out_key = it->second.key;
  return true;
}

void KeyDeriver::StoreLocked(const std::string& user_id,
                             const DerivedKey& key) {
  auto it = cache_.find(user_id);
  if (it != cache_.end()) {
    // Another thread derived the same key while the lock was released.
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return;
  }
  while (cache_.size() >= cache_capacity_ && !lru_.empty()) {
    auto victim = cache_.find(lru_.back());
    if (victim != cache_.end()) {
      common::SecureWipe(victim->second.key);
      cache_.erase(victim);
    }
    lru_.pop_back();
  }
  lru_.push_front(user_id);
  CacheEntry entry;
  entry.key = key;
  entry.lru_pos = lru_.begin();
  cache_.emplace(user_id, entry);
  common::SecureWipe(entry.key);
}

bool KeyDeriver::Derive(const std::string& user_id, DerivedKey& out_key,
                        std::string& error) {
  std::string salt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cache_capacity_ > 0 && LookupLocked(user_id, out_key)) {
      return true;
    }
    salt = salt_.get();
  }
  common::ScopedWipe wipe_salt(salt);

  // The KDF runs unlocked so that concurrent callers do not serialize on it.
  if (!crypto::Pbkdf2Sha256(
          reinterpret_cast<const std::uint8_t*>(user_id.data()),
          user_id.size(), reinterpret_cast<const std::uint8_t*>(salt.data()),
          salt.size(), iterations_, out_key.data(), out_key.size(), error)) {
    common::SecureWipe(out_key);
    return false;
  }

  if (cache_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreLocked(user_id, out_key);
  }
  return true;
}

std::size_t KeyDeriver::cached_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace idtok::core
