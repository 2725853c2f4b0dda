#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace idtok::core {

namespace {

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' ||
      value > std::numeric_limits<std::uint32_t>::max()) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

bool ParseSecretSource(const std::string& text, SecretSource& out) {
  if (text == "builtin") {
    out = SecretSource::kBuiltin;
    return true;
  }
  if (text == "env") {
    out = SecretSource::kEnv;
    return true;
  }
  return false;
}

struct IniState {
  std::string section;
  IdentifierConfig* cfg{nullptr};
};

bool ApplyKV(IniState& state, const std::string& key,
             const std::string& value) {
  if (state.section == "secrets") {
    if (key == "provider") {
      return ParseSecretSource(value, state.cfg->secrets.source);
    }
    if (key == "salt_env") {
      state.cfg->secrets.salt_env = value;
    } else if (key == "api_key_env") {
      state.cfg->secrets.api_key_env = value;
    }
    return true;
  }
  if (state.section == "kdf") {
    if (key == "iterations") {
      return ParseUint32(value, state.cfg->kdf.iterations);
    }
    if (key == "key_cache_entries") {
      return ParseUint32(value, state.cfg->kdf.key_cache_entries);
    }
    return true;
  }
  if (state.section == "log") {
    if (key == "debug_log") {
      return ParseBool(value, state.cfg->log.debug_log);
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, IdentifierConfig& out,
              std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      state.section = Trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    const std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value)) {
      std::ostringstream oss;
      oss << "invalid value for " << state.section << "." << key << " at line "
          << line_no;
      error = oss.str();
      return false;
    }
  }
  return true;
}

}  // namespace

bool LoadConfig(const std::string& path, IdentifierConfig& out_config,
                std::string& error) {
  out_config = IdentifierConfig{};
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  if (out_config.kdf.iterations == 0) {
    error = "kdf iterations must be non-zero";
    return false;
  }
  if (out_config.secrets.source == SecretSource::kEnv &&
      (out_config.secrets.salt_env.empty() ||
       out_config.secrets.api_key_env.empty())) {
    error = "env secret provider needs salt_env and api_key_env";
    return false;
  }
  return true;
}

}  // namespace idtok::core
