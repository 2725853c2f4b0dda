#ifndef IDTOK_CORE_SECRET_PROVIDER_H
#define IDTOK_CORE_SECRET_PROVIDER_H

#include <cstdint>
#include <memory>
#include <string>

#include "config.h"
#include "scrambled_table.h"

namespace idtok::core {

enum class SecretId : std::uint8_t { kKdfSalt = 0, kApiKey = 1 };

const char* SecretIdName(SecretId id);

class SecretProvider {
 public:
  virtual ~SecretProvider() = default;
  virtual bool Load(SecretId id, std::string& out_secret,
                    std::string& error) = 0;
};

// Recovers secrets from compiled-in scrambled tables.
class BuiltinSecretProvider final : public SecretProvider {
 public:
  BuiltinSecretProvider();
  BuiltinSecretProvider(ScrambledTable salt_table,
                        ScrambledTable api_key_table);
  bool Load(SecretId id, std::string& out_secret, std::string& error) override;

 private:
  ScrambledTable salt_table_;
  ScrambledTable api_key_table_;
};

// Reads secrets from environment variables filled in by a secret store.
class EnvSecretProvider final : public SecretProvider {
 public:
  EnvSecretProvider(std::string salt_var, std::string api_key_var);
  bool Load(SecretId id, std::string& out_secret, std::string& error) override;

 private:
  std::string salt_var_;
  std::string api_key_var_;
};

std::unique_ptr<SecretProvider> MakeSecretProvider(
    const SecretsSection& cfg, std::string& error);

}  // namespace idtok::core

#endif  // IDTOK_CORE_SECRET_PROVIDER_H
