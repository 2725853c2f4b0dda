#include "platform_log.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace idtok::platform::log {

namespace {

std::mutex g_log_mutex;
LogCallback g_log_cb = nullptr;
void* g_log_user = nullptr;
Level g_min_level = Level::kInfo;

constexpr const char* kSensitiveWords[] = {"token", "password", "secret",
                                           "salt",  "key",      "pin"};

const char* LevelToString(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

bool IsDelimiter(char ch) {
  const unsigned char uc = static_cast<unsigned char>(ch);
  return std::isspace(uc) != 0 || ch == ',' || ch == ';';
}

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// Masks the value part of any "<word>=value" run inside free text.
std::string RedactInline(std::string_view message) {
  std::string out(message);
  std::string lower = ToLowerAscii(out);
  for (const char* word : kSensitiveWords) {
    const std::string pattern = std::string(word) + "=";
    std::size_t pos = 0;
    while (true) {
      pos = lower.find(pattern, pos);
      if (pos == std::string::npos) {
        break;
      }
      const std::size_t start = pos + pattern.size();
      std::size_t end = start;
      while (end < out.size() && !IsDelimiter(out[end])) {
        ++end;
      }
      if (end > start) {
        out.replace(start, end - start, "***");
        lower.replace(start, end - start, "***");
        pos = start + 3;
      } else {
        pos = start;
      }
    }
  }
  return out;
}

void WriteLine(Level level,
               std::string_view tag,
               const std::string& message,
               const std::vector<std::string>& keys,
               const std::vector<std::string>& values) {
  std::string line;
  line.reserve(64 + message.size() + keys.size() * 16);
  line.append("[idtok] ");
  line.append(LevelToString(level));
  if (!tag.empty()) {
    line.push_back(' ');
    line.append(tag.data(), tag.size());
  }
  line.append(": ");
  line.append(message);
  for (std::size_t i = 0; i < keys.size(); ++i) {
    line.push_back(' ');
    line.append(keys[i]);
    line.push_back('=');
    line.append(values[i]);
  }
  line.push_back('\n');
  FILE* out =
      (level == Level::kError || level == Level::kWarn) ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_cb = cb;
  g_log_user = user_data;
}

void SetMinLevel(Level level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_min_level = level;
}

Level MinLevel() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_min_level;
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  LogCallback cb = nullptr;
  void* user = nullptr;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<std::uint8_t>(level) <
        static_cast<std::uint8_t>(g_min_level)) {
      return;
    }
    cb = g_log_cb;
    user = g_log_user;
  }

  const std::string redacted = RedactInline(message);
  std::vector<std::string> keys;
  std::vector<std::string> values;
  keys.reserve(fields.size());
  values.reserve(fields.size());
  for (const auto& field : fields) {
    if (field.key.empty()) {
      continue;
    }
    keys.emplace_back(field.key);
    values.push_back(RedactValue(field.key, field.value));
  }

  if (cb) {
    // Called without the lock so the callback may log in turn.
    const std::string tag_text(tag);
    std::vector<Field> out_fields;
    out_fields.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
      out_fields.push_back(Field{keys[i], values[i]});
    }
    cb(level, tag_text.c_str(), redacted.c_str(), out_fields.data(),
       out_fields.size(), user);
    return;
  }
  std::lock_guard<std::mutex> lock(g_log_mutex);
  WriteLine(level, tag, redacted, keys, values);
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string lower = ToLowerAscii(key);
  if (lower.find("key_id") != std::string::npos ||
      lower.find("keyid") != std::string::npos) {
    return false;
  }
  for (const char* word : kSensitiveWords) {
    if (lower.find(word) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

std::string RedactMessage(std::string_view message) {
  return RedactInline(message);
}

}  // namespace idtok::platform::log
