#include <cassert>
#include <fstream>
#include <string>

#include "config.h"

using sendkey::server::LoadConfig;
using sendkey::server::ServerConfig;
using sendkey::server::StoreMode;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

static const char kEntriesAuth[] =
    "[entries]\n"
    "master_key_hex=000102030405060708090a0b0c0d0e0f  # 16 bytes\n"
    "[auth]\nsigning_key=test-signing-key\n";

int main() {
  {
    const std::string path = "tmp_config_mysql.ini";
    WriteFile(path,
              std::string("[mode]  # store mode\nmode=0  # mysql\n"
                          "[mysql]\nmysql_ip=127.0.0.1\nmysql_port=3306\n"
                          "mysql_database=sendkey\nmysql_username=root\n"
                          "mysql_password=pass\n"
                          "[server]\ndebug_log=1\n") +
                  kEntriesAuth);
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.mode == StoreMode::kMySQL);
    assert(cfg.mysql.host == "127.0.0.1");
    assert(cfg.mysql.port == 3306);
    assert(cfg.mysql.database == "sendkey");
    assert(cfg.server.debug_log);
    assert(cfg.entries.master_key.size() == 16);
    assert(cfg.entries.master_key[15] == 0x0f);
    assert(cfg.entries.max_invalid_attempts == 3);
    assert(cfg.entries.sweep_interval_sec == 60);
    assert(cfg.auth.signing_key == "test-signing-key");
    assert(cfg.auth.access_token_minutes == 15);
    assert(cfg.auth.refresh_token_hours == 720);
    assert(cfg.auth.password_blocks == 4096);
    assert(cfg.auth.password_passes == 3);
  }

  {
    const std::string path = "tmp_config_memory.ini";
    WriteFile(path, std::string("[mode]\nmode=1\n") + kEntriesAuth +
                        "access_token_minutes=5\nrefresh_token_hours=48\n"
                        "password_blocks=64\npassword_passes=1\n"
                        "[entries]\nmax_invalid_attempts=5\n"
                        "sweep_interval_sec=0\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.mode == StoreMode::kMemory);
    assert(cfg.auth.access_token_minutes == 5);
    assert(cfg.auth.refresh_token_hours == 48);
    assert(cfg.auth.password_blocks == 64);
    assert(cfg.entries.max_invalid_attempts == 5);
    assert(cfg.entries.sweep_interval_sec == 0);
  }

  {
    const std::string path = "tmp_config_mysql_incomplete.ini";
    WriteFile(path, std::string("[mode]\nmode=0\n[mysql]\nmysql_ip=db\n") +
                        kEntriesAuth);
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
    assert(err == "mysql config incomplete");
  }

  {
    const std::string path = "tmp_config_short_key.ini";
    WriteFile(path,
              "[mode]\nmode=1\n[entries]\nmaster_key_hex=0011\n"
              "[auth]\nsigning_key=k\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_bad_hex.ini";
    WriteFile(path,
              "[mode]\nmode=1\n[entries]\nmaster_key_hex=not-hex\n"
              "[auth]\nsigning_key=k\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_no_signing_key.ini";
    WriteFile(path,
              "[mode]\nmode=1\n[entries]\n"
              "master_key_hex=000102030405060708090a0b0c0d0e0f\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_zero_attempts.ini";
    WriteFile(path, std::string("[mode]\nmode=1\n") + kEntriesAuth +
                        "[entries]\nmax_invalid_attempts=0\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_zero_lifetime.ini";
    WriteFile(path, std::string("[mode]\nmode=1\n") + kEntriesAuth +
                        "access_token_minutes=0\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_blocks_range.ini";
    WriteFile(path, std::string("[mode]\nmode=1\n") + kEntriesAuth +
                        "password_blocks=9000\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_bad_number.ini";
    WriteFile(path, std::string("[mode]\nmode=1\n") + kEntriesAuth +
                        "refresh_token_hours=abc\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_config_bad_line.ini";
    WriteFile(path, "[mode]\nmode\n");
    ServerConfig cfg;
    std::string err;
    assert(!LoadConfig(path, cfg, err));
    assert(err == "invalid line 2");
  }

  {
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig("missing.ini", cfg, err);
    assert(!ok);
  }

  return 0;
}
