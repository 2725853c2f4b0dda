#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

#include "platform_log.h"

namespace plog = idtok::platform::log;

namespace {

struct Sink {
  std::vector<std::string> lines;
};

void Collect(plog::Level level, const char* tag, const char* message,
             const plog::Field* fields, std::size_t field_count,
             void* user_data) {
  auto* sink = static_cast<Sink*>(user_data);
  std::string line = std::to_string(static_cast<int>(level));
  line.append(" ");
  line.append(tag);
  line.append(": ");
  line.append(message);
  for (std::size_t i = 0; i < field_count; ++i) {
    line.append(" ");
    line.append(fields[i].key.data(), fields[i].key.size());
    line.append("=");
    line.append(fields[i].value.data(), fields[i].value.size());
  }
  sink->lines.push_back(line);
}

// Forwards each line once more under a second tag.
void Relay(plog::Level level, const char* tag, const char* message,
           const plog::Field* fields, std::size_t field_count,
           void* user_data) {
  Collect(level, tag, message, fields, field_count, user_data);
  if (std::string(tag) != "relay") {
    plog::Log(level, "relay", message);
  }
}

}  // namespace

int main() {
  assert(plog::IsSensitiveKey("api_key"));
  assert(plog::IsSensitiveKey("kdf_salt"));
  assert(plog::IsSensitiveKey("Token"));
  assert(plog::IsSensitiveKey("db_password"));
  assert(plog::IsSensitiveKey("pin"));
  assert(!plog::IsSensitiveKey("key_id"));
  assert(!plog::IsSensitiveKey("table_id"));
  assert(!plog::IsSensitiveKey("nonce"));
  assert(!plog::IsSensitiveKey(""));

  assert(plog::RedactValue("apiKey", "abc") == "***");
  assert(plog::RedactValue("provider", "env") == "env");
  assert(plog::RedactMessage("load token=abc123, user=u1") ==
         "load token=***, user=u1");
  assert(plog::RedactMessage("SALT=xyz") == "SALT=***");
  assert(plog::RedactMessage("key=") == "key=");
  assert(plog::RedactMessage("nothing here") == "nothing here");

  Sink sink;
  plog::SetLogCallback(&Collect, &sink);
  assert(plog::MinLevel() == plog::Level::kInfo);

  plog::Log(plog::Level::kDebug, "t", "hidden");
  assert(sink.lines.empty());

  plog::Log(plog::Level::kInfo, "t", "ready secret=s3cr3t",
            {{"api_key", "6ce8"}, {"table_id", "b43d"}, {"", "dropped"}});
  assert(sink.lines.size() == 1);
  assert(sink.lines[0] == "1 t: ready secret=*** api_key=*** table_id=b43d");

  plog::SetMinLevel(plog::Level::kDebug);
  plog::Log(plog::Level::kDebug, "t", "shown");
  assert(sink.lines.size() == 2);
  assert(sink.lines[1] == "0 t: shown");

  plog::SetMinLevel(plog::Level::kError);
  plog::Log(plog::Level::kWarn, "t", "filtered");
  plog::Log(plog::Level::kError, "t", "kept");
  assert(sink.lines.size() == 3);
  assert(sink.lines[2] == "3 t: kept");

  plog::SetMinLevel(plog::Level::kInfo);

  {
    Sink relayed;
    plog::SetLogCallback(&Relay, &relayed);
    plog::Log(plog::Level::kWarn, "t", "nested");
    assert(relayed.lines.size() == 2);
    assert(relayed.lines[0] == "2 t: nested");
    assert(relayed.lines[1] == "2 relay: nested");
    plog::SetLogCallback(&Collect, &sink);
  }

  plog::SetLogCallback(nullptr, nullptr);
  plog::Log(plog::Level::kInfo, "t", "to stdout key=hidden");
  assert(sink.lines.size() == 3);
  return 0;
}
