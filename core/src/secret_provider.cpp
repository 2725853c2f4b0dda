#include "secret_provider.h"

#include <cstdlib>
#include <utility>

#include "builtin_tables.h"
#include "text_codec.h"

namespace idtok::core {

const char* SecretIdName(SecretId id) {
  switch (id) {
    case SecretId::kKdfSalt:
      return "kdf_salt";
    case SecretId::kApiKey:
      return "api_key";
  }
  return "unknown";
}

BuiltinSecretProvider::BuiltinSecretProvider()
    : BuiltinSecretProvider(BuiltinKdfSaltTable(), BuiltinApiKeyTable()) {}

BuiltinSecretProvider::BuiltinSecretProvider(ScrambledTable salt_table,
                                             ScrambledTable api_key_table)
    : salt_table_(std::move(salt_table)),
      api_key_table_(std::move(api_key_table)) {}

bool BuiltinSecretProvider::Load(SecretId id, std::string& out_secret,
                                 std::string& error) {
  const ScrambledTable& table =
      id == SecretId::kKdfSalt ? salt_table_ : api_key_table_;
  std::string descramble_error;
  if (!Descramble(table, out_secret, descramble_error)) {
    error = std::string(SecretIdName(id)) + ": " + descramble_error;
    return false;
  }
  return true;
}

EnvSecretProvider::EnvSecretProvider(std::string salt_var,
                                     std::string api_key_var)
    : salt_var_(std::move(salt_var)), api_key_var_(std::move(api_key_var)) {}

bool EnvSecretProvider::Load(SecretId id, std::string& out_secret,
                             std::string& error) {
  out_secret.clear();
  const std::string& var = id == SecretId::kKdfSalt ? salt_var_ : api_key_var_;
  const char* value = var.empty() ? nullptr : std::getenv(var.c_str());
  if (!value || *value == '\0') {
    error = std::string(SecretIdName(id)) + ": environment variable " + var +
            " not set";
    return false;
  }
  out_secret = value;
  if (!common::IsValidUtf8(out_secret)) {
    out_secret.clear();
    error = std::string(SecretIdName(id)) + ": environment value not utf-8";
    return false;
  }
  return true;
}

std::unique_ptr<SecretProvider> MakeSecretProvider(
    const SecretsSection& cfg, std::string& error) {
  switch (cfg.source) {
    case SecretSource::kBuiltin:
      return std::make_unique<BuiltinSecretProvider>();
    case SecretSource::kEnv:
      return std::make_unique<EnvSecretProvider>(cfg.salt_env,
                                                 cfg.api_key_env);
  }
  error = "unknown secret provider";
  return nullptr;
}

}  // namespace idtok::core
