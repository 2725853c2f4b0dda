#ifndef IDTOK_CORE_IDENTIFIER_SERVICE_H
#define IDTOK_CORE_IDENTIFIER_SERVICE_H

#include <memory>
#include <string>
#include <string_view>

#include "config.h"
#include "identifier_issuer.h"
#include "key_deriver.h"
#include "random_source.h"
#include "secret_provider.h"
#include "session_payload.h"
#include "token_cipher.h"
#include "token_error.h"

namespace idtok::core {

// Owns the issuance pipeline for the process. Init loads both secrets up
// front so that a broken table or a missing env secret fails at startup
// rather than on the first request.
class IdentifierService {
 public:
  IdentifierService();
  ~IdentifierService();

  IdentifierService(const IdentifierService&) = delete;
  IdentifierService& operator=(const IdentifierService&) = delete;

  bool Init(const std::string& config_path, TokenError& error);
  bool Init(const IdentifierConfig& config, TokenError& error);
  bool Init(const IdentifierConfig& config,
            std::unique_ptr<SecretProvider> secrets,
            std::unique_ptr<RandomSource> random, TokenError& error);

  bool Issue(const std::string& user_id, const std::string& client_uuid,
             std::string& out_identifier, TokenError& error);
  bool Open(std::string_view identifier, const std::string& user_id,
            SessionPayload& out_payload, TokenError& error);

  bool ready() const { return issuer_ != nullptr; }
  const IdentifierConfig& config() const { return config_; }
  // Short fingerprint of the salt; changes whenever the tables rotate.
  const std::string& table_id() const { return table_id_; }
  const KeyDeriver* key_deriver() const { return deriver_.get(); }

 private:
  IdentifierConfig config_;
  std::string table_id_;
  std::unique_ptr<SecretProvider> secrets_;
  std::unique_ptr<RandomSource> random_;
  std::unique_ptr<KeyDeriver> deriver_;
  std::unique_ptr<TokenCipher> cipher_;
  std::unique_ptr<IdentifierIssuer> issuer_;
};

}  // namespace idtok::core

#endif  // IDTOK_CORE_IDENTIFIER_SERVICE_H
