#include "identifier_service.h"

#include <utility>

#include "hex_utils.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace idtok::core {

namespace {

namespace log = idtok::platform::log;

constexpr std::string_view kTag = "identifier";
constexpr std::size_t kTableIdHexChars = 16;

const char* SecretSourceName(SecretSource source) {
  return source == SecretSource::kEnv ? "env" : "builtin";
}

}  // namespace

IdentifierService::IdentifierService() = default;

IdentifierService::~IdentifierService() = default;

bool IdentifierService::Init(const std::string& config_path,
                             TokenError& error) {
  IdentifierConfig cfg;
  std::string reason;
  if (!LoadConfig(config_path, cfg, reason)) {
    error.Set(TokenErrorKind::kConfiguration, reason);
    log::Log(log::Level::kError, kTag, "config load failed",
             {{"path", config_path}, {"reason", reason}});
    return false;
  }
  return Init(cfg, error);
}

bool IdentifierService::Init(const IdentifierConfig& config,
                             TokenError& error) {
  std::string reason;
  auto secrets = MakeSecretProvider(config.secrets, reason);
  if (!secrets) {
    error.Set(TokenErrorKind::kConfiguration, reason);
    return false;
  }
  return Init(config, std::move(secrets), std::make_unique<OsRandomSource>(),
              error);
}

bool IdentifierService::Init(const IdentifierConfig& config,
                             std::unique_ptr<SecretProvider> secrets,
                             std::unique_ptr<RandomSource> random,
                             TokenError& error) {
  issuer_.reset();
  cipher_.reset();
  deriver_.reset();
  table_id_.clear();
  config_ = config;
  log::SetMinLevel(config_.log.debug_log ? log::Level::kDebug
                                         : log::Level::kInfo);

  if (!secrets || !random) {
    error.Set(TokenErrorKind::kConfiguration,
              "secret provider or random source missing");
    return false;
  }
  if (config_.kdf.iterations == 0) {
    error.Set(TokenErrorKind::kConfiguration, "kdf iterations must be non-zero");
    return false;
  }
  secrets_ = std::move(secrets);
  random_ = std::move(random);

  std::string salt;
  std::string api_key;
  common::ScopedWipe wipe_salt(salt);
  common::ScopedWipe wipe_api_key(api_key);
  std::string reason;
  if (!secrets_->Load(SecretId::kKdfSalt, salt, reason) ||
      !secrets_->Load(SecretId::kApiKey, api_key, reason)) {
    error.Set(TokenErrorKind::kConfiguration, reason);
    log::Log(log::Level::kError, kTag, "secret load failed",
             {{"provider", SecretSourceName(config_.secrets.source)},
              {"reason", reason}});
    return false;
  }
  if (salt.empty() || api_key.empty()) {
    error.Set(TokenErrorKind::kConfiguration, "secret empty");
    return false;
  }

  const std::string digest = common::Sha256Hex(
      reinterpret_cast<const std::uint8_t*>(salt.data()), salt.size());
  if (digest.size() < kTableIdHexChars) {
    error.Set(TokenErrorKind::kCrypto, "salt fingerprint failed");
    return false;
  }
  table_id_ = digest.substr(0, kTableIdHexChars);

  deriver_ = std::make_unique<KeyDeriver>(salt, config_.kdf.iterations,
                                          config_.kdf.key_cache_entries);
  cipher_ =
      std::make_unique<TokenCipher>(deriver_.get(), api_key, random_.get());
  issuer_ = std::make_unique<IdentifierIssuer>(cipher_.get(), random_.get());

  log::Log(log::Level::kInfo, kTag, "identifier service ready",
           {{"provider", SecretSourceName(config_.secrets.source)},
            {"table_id", table_id_},
            {"kdf_iterations", std::to_string(config_.kdf.iterations)},
            {"cache_entries",
             std::to_string(config_.kdf.key_cache_entries)}});
  error.Clear();
  return true;
}

bool IdentifierService::Issue(const std::string& user_id,
                              const std::string& client_uuid,
                              std::string& out_identifier, TokenError& error) {
  out_identifier.clear();
  if (!issuer_) {
    error.Set(TokenErrorKind::kConfiguration, "identifier service not ready");
    return false;
  }
  if (!issuer_->Issue(user_id, client_uuid, out_identifier, error)) {
    log::Log(log::Level::kWarn, kTag, "identifier issue failed",
             {{"kind", TokenErrorKindName(error.kind)},
              {"reason", error.message}});
    return false;
  }
  log::Log(log::Level::kDebug, kTag, "identifier issued",
           {{"nonce", std::string_view(out_identifier)
                          .substr(0, kNonceSize * 2)}});
  return true;
}

bool IdentifierService::Open(std::string_view identifier,
                             const std::string& user_id,
                             SessionPayload& out_payload, TokenError& error) {
  out_payload = SessionPayload{};
  if (!issuer_) {
    error.Set(TokenErrorKind::kConfiguration, "identifier service not ready");
    return false;
  }
  if (!issuer_->Open(identifier, user_id, out_payload, error)) {
    log::Log(log::Level::kWarn, kTag, "identifier rejected",
             {{"kind", TokenErrorKindName(error.kind)}});
    return false;
  }
  return true;
}

}  // namespace idtok::core
