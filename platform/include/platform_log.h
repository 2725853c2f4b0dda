#ifndef IDTOK_PLATFORM_LOG_H
#define IDTOK_PLATFORM_LOG_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace idtok::platform::log {

enum class Level : std::uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3
};

struct Field {
  std::string_view key;
  std::string_view value;
};

// Receives already-redacted text. Fields are passed through with their
// values redacted the same way the default sink prints them. Invoked outside
// the log lock; the callback may call Log, which re-enters it.
using LogCallback = void (*)(Level level,
                             const char* tag,
                             const char* message,
                             const Field* fields,
                             std::size_t field_count,
                             void* user_data);

void SetLogCallback(LogCallback cb, void* user_data);
void SetMinLevel(Level level);
Level MinLevel();

void Log(Level level, std::string_view tag, std::string_view message);
void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields);

bool IsSensitiveKey(std::string_view key);
std::string RedactValue(std::string_view key, std::string_view value);
std::string RedactMessage(std::string_view message);

}  // namespace idtok::platform::log

#endif  // IDTOK_PLATFORM_LOG_H
