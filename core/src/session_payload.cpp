#include "session_payload.h"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>

#include "secure_buffer.h"
#include "text_codec.h"

namespace idtok::core {

namespace {

using json = nlohmann::json;

constexpr char kHex[] = "0123456789abcdef";

void AppendJsonString(std::string& out, const std::string& value) {
  out.push_back('"');
  for (const char ch : value) {
    switch (ch) {
      case '\\':
        out.append("\\\\");
        break;
      case '"':
        out.append("\\\"");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default: {
        const auto uc = static_cast<unsigned char>(ch);
        if (uc < 0x20) {
          out.append("\\u00");
          out.push_back(kHex[uc >> 4]);
          out.push_back(kHex[uc & 0x0F]);
        } else {
          out.push_back(ch);
        }
        break;
      }
    }
  }
  out.push_back('"');
}

constexpr std::size_t kPayloadOverhead = 48;
constexpr std::size_t kMaxEscapeWidth = 6;

std::string* MemberField(SessionPayload& payload, const std::string& name) {
  if (name == "userId") {
    return &payload.user_id;
  }
  if (name == "clientUUID") {
    return &payload.client_uuid;
  }
  if (name == "apiKey") {
    return &payload.api_key;
  }
  return nullptr;
}

bool ReadMembers(const json& doc, bool duplicated, SessionPayload& out,
                 std::string& error) {
  if (!doc.is_object()) {
    error = "payload not an object";
    return false;
  }
  if (duplicated) {
    error = "payload member duplicated";
    return false;
  }
  for (const auto& item : doc.items()) {
    std::string* target = MemberField(out, item.key());
    if (!target) {
      error = "payload member unexpected";
      return false;
    }
    if (!item.value().is_string()) {
      error = "payload member value invalid";
      return false;
    }
    *target = item.value().get_ref<const std::string&>();
  }
  if (doc.size() != 3) {
    error = "payload member missing";
    return false;
  }
  return true;
}

// Member values may hold the credential; clear them before the document
// releases its storage.
void WipeDocument(json& doc) {
  if (doc.is_string()) {
    common::SecureWipe(doc.get_ref<std::string&>());
    return;
  }
  if (!doc.is_structured()) {
    return;
  }
  for (auto& value : doc) {
    if (value.is_string()) {
      common::SecureWipe(value.get_ref<std::string&>());
    }
  }
}

}  // namespace

void WipePayload(SessionPayload& payload) {
  common::SecureWipe(payload.user_id);
  common::SecureWipe(payload.client_uuid);
  common::SecureWipe(payload.api_key);
}

std::size_t SerializedPayloadCapacity(const SessionPayload& payload) {
  return kPayloadOverhead +
         kMaxEscapeWidth * (payload.user_id.size() +
                            payload.client_uuid.size() +
                            payload.api_key.size());
}

bool SerializePayload(const SessionPayload& payload, std::string& out_json,
                      std::string& error) {
  out_json.clear();
  if (!common::IsValidUtf8(payload.user_id) ||
      !common::IsValidUtf8(payload.client_uuid) ||
      !common::IsValidUtf8(payload.api_key)) {
    error = "payload field not utf-8";
    return false;
  }
  out_json.reserve(SerializedPayloadCapacity(payload));
  out_json.append("{\"userId\":");
  AppendJsonString(out_json, payload.user_id);
  out_json.append(",\"clientUUID\":");
  AppendJsonString(out_json, payload.client_uuid);
  out_json.append(",\"apiKey\":");
  AppendJsonString(out_json, payload.api_key);
  out_json.push_back('}');
  return true;
}

bool ParsePayload(std::string_view text, SessionPayload& out,
                  std::string& error) {
  out = SessionPayload{};
  if (!common::IsValidUtf8(text)) {
    error = "payload not utf-8";
    return false;
  }

  // The document keeps only the last of repeated names, so catch them while
  // parsing.
  std::vector<std::string> names;
  bool duplicated = false;
  const json::parser_callback_t on_event =
      [&names, &duplicated](int depth, json::parse_event_t event,
                            json& parsed) {
        if (event == json::parse_event_t::key && depth == 1 &&
            parsed.is_string()) {
          const auto& name = parsed.get_ref<const std::string&>();
          if (std::find(names.begin(), names.end(), name) != names.end()) {
            duplicated = true;
          } else {
            names.push_back(name);
          }
        }
        return true;
      };

  json doc;
  try {
    doc = json::parse(text.begin(), text.end(), on_event);
  } catch (const json::exception& e) {
    // e.what() quotes the input; report only the error id.
    error = "payload json invalid (" + std::to_string(e.id) + ")";
    return false;
  }

  const bool ok = ReadMembers(doc, duplicated, out, error);
  WipeDocument(doc);
  if (!ok) {
    WipePayload(out);
    out = SessionPayload{};
  }
  return ok;
}

}  // namespace idtok::core
