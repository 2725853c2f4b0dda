#ifndef IDTOK_CORE_CONFIG_H
#define IDTOK_CORE_CONFIG_H

#include <cstdint>
#include <string>

namespace idtok::core {

constexpr std::uint32_t kDefaultKdfIterations = 100000;

enum class SecretSource : std::uint8_t { kBuiltin = 0, kEnv = 1 };

struct SecretsSection {
  SecretSource source{SecretSource::kBuiltin};
  std::string salt_env{"IDTOK_KDF_SALT"};
  std::string api_key_env{"IDTOK_API_KEY"};
};

struct KdfSection {
  std::uint32_t iterations{kDefaultKdfIterations};
  std::uint32_t key_cache_entries{0};
};

struct LogSection {
  bool debug_log{false};
};

struct IdentifierConfig {
  SecretsSection secrets;
  KdfSection kdf;
  LogSection log;
};

bool LoadConfig(const std::string& path, IdentifierConfig& out_config,
                std::string& error);

}  // namespace idtok::core

#endif  // IDTOK_CORE_CONFIG_H
