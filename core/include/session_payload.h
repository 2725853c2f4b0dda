#ifndef IDTOK_CORE_SESSION_PAYLOAD_H
#define IDTOK_CORE_SESSION_PAYLOAD_H

#include <cstddef>
#include <string>
#include <string_view>

namespace idtok::core {

struct SessionPayload {
  std::string user_id;
  std::string client_uuid;
  std::string api_key;
};

void WipePayload(SessionPayload& payload);

// Upper bound on the serialized size, counting every byte at its widest
// escape. SerializePayload reserves this much up front.
std::size_t SerializedPayloadCapacity(const SessionPayload& payload);

// Writes {"userId":..,"clientUUID":..,"apiKey":..} with no whitespace and
// ECMAScript JSON.stringify escaping, so existing decrypters see the same
// bytes. Fails only if a field is not valid UTF-8.
bool SerializePayload(const SessionPayload& payload, std::string& out_json,
                      std::string& error);

// Accepts exactly one JSON object holding the three string members above,
// in any order, each exactly once.
bool ParsePayload(std::string_view json, SessionPayload& out,
                  std::string& error);

}  // namespace idtok::core

#endif  // IDTOK_CORE_SESSION_PAYLOAD_H
