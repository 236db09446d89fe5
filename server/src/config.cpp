#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "hex_utils.h"

namespace sendkey::server {

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

bool ParseUint16(const std::string& text, std::uint16_t& out) {
  if (text.empty()) {
    return false;
  }
  char* end_ptr = nullptr;
  const long value = std::strtol(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value < 0 ||
      value > 65535) {
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFull) {
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

struct IniState {
  std::string section;
  ServerConfig* cfg{nullptr};
};

// Unknown keys are ignored; a known key with an unparsable value fails.
bool ApplyKV(IniState& state, const std::string& key,
             const std::string& value) {
  ServerConfig& cfg = *state.cfg;
  if (state.section == "mode" && key == "mode") {
    if (value == "0") {
      cfg.mode = StoreMode::kMySQL;
      return true;
    }
    if (value == "1") {
      cfg.mode = StoreMode::kMemory;
      return true;
    }
    return false;
  }
  if (state.section == "mysql") {
    if (key == "mysql_ip") {
      cfg.mysql.host = value;
    } else if (key == "mysql_port") {
      return ParseUint16(value, cfg.mysql.port);
    } else if (key == "mysql_database") {
      cfg.mysql.database = value;
    } else if (key == "mysql_username") {
      cfg.mysql.username = value;
    } else if (key == "mysql_password") {
      cfg.mysql.password = value;
    }
    return true;
  }
  if (state.section == "entries") {
    if (key == "master_key_hex") {
      return sendkey::common::HexToBytes(value, cfg.entries.master_key);
    }
    if (key == "max_invalid_attempts") {
      return ParseUint32(value, cfg.entries.max_invalid_attempts);
    }
    if (key == "sweep_interval_sec") {
      return ParseUint32(value, cfg.entries.sweep_interval_sec);
    }
    return true;
  }
  if (state.section == "auth") {
    if (key == "signing_key") {
      cfg.auth.signing_key = value;
    } else if (key == "access_token_minutes") {
      return ParseUint32(value, cfg.auth.access_token_minutes);
    } else if (key == "refresh_token_hours") {
      return ParseUint32(value, cfg.auth.refresh_token_hours);
    } else if (key == "password_blocks") {
      return ParseUint32(value, cfg.auth.password_blocks);
    } else if (key == "password_passes") {
      return ParseUint32(value, cfg.auth.password_passes);
    }
    return true;
  }
  if (state.section == "server") {
    if (key == "debug_log") {
      return ParseBool(value, cfg.server.debug_log);
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, ServerConfig& out, std::string& error) {
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
    std::string key = Trim(trimmed.substr(0, pos));
    std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value)) {
      std::ostringstream oss;
      oss << "invalid value for " << key << " on line " << line_no;
      error = oss.str();
      return false;
    }
  }
  return true;
}

}  // namespace

bool LoadConfig(const std::string& path, ServerConfig& out_config,
                std::string& error) {
  out_config = ServerConfig{};
  error.clear();
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  if (out_config.mode == StoreMode::kMySQL) {
    const bool ok = !out_config.mysql.host.empty() &&
                    out_config.mysql.port != 0 &&
                    !out_config.mysql.database.empty() &&
                    !out_config.mysql.username.empty() &&
                    !out_config.mysql.password.empty();
    if (!ok) {
      error = "mysql config incomplete";
      return false;
    }
  }
  if (out_config.entries.master_key.size() < kMinMasterKeyBytes) {
    error = "entries master key missing or too short";
    return false;
  }
  if (out_config.entries.max_invalid_attempts == 0 ||
      out_config.entries.max_invalid_attempts > 0x7FFFFFFFu) {
    error = "max_invalid_attempts out of range";
    return false;
  }
  if (out_config.auth.signing_key.empty()) {
    error = "auth signing key missing";
    return false;
  }
  if (out_config.auth.access_token_minutes == 0 ||
      out_config.auth.refresh_token_hours == 0) {
    error = "token lifetimes must be positive";
    return false;
  }
  if (out_config.auth.password_blocks < 8 ||
      out_config.auth.password_blocks > 8192 ||
      out_config.auth.password_passes == 0 ||
      out_config.auth.password_passes > 16) {
    error = "password hash params out of range";
    return false;
  }
  return true;
}

}  // namespace sendkey::server
