#ifndef SENDKEY_SERVER_CONFIG_H
#define SENDKEY_SERVER_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

namespace sendkey::server {

enum class StoreMode : std::uint8_t { kMySQL = 0, kMemory = 1 };

struct MySqlConfig {
  std::string host;
  std::uint16_t port{0};
  std::string database;
  std::string username;
  std::string password;
};

struct EntriesSection {
  std::vector<std::uint8_t> master_key;
  std::uint32_t max_invalid_attempts{3};
  std::uint32_t sweep_interval_sec{60};
};

struct AuthSection {
  std::string signing_key;
  std::uint32_t access_token_minutes{15};
  std::uint32_t refresh_token_hours{720};
  std::uint32_t password_blocks{4096};
  std::uint32_t password_passes{3};
};

struct ServerSection {
  bool debug_log{false};
};

struct ServerConfig {
  StoreMode mode{StoreMode::kMySQL};
  MySqlConfig mysql;
  EntriesSection entries;
  AuthSection auth;
  ServerSection server;
};

constexpr std::size_t kMinMasterKeyBytes = 16;

bool LoadConfig(const std::string& path, ServerConfig& out_config,
                std::string& error);

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_CONFIG_H
