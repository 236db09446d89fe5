#include "server_app.h"

#include <chrono>
#include <utility>

#include "memory_store.h"
#include "mysql_store.h"
#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "app";

}  // namespace

ServerApp::ServerApp(NowFn now)
    : now_(now ? std::move(now) : NowFn(SystemNow)) {}

ServerApp::~ServerApp() = default;

bool ServerApp::Init(const std::string& config_path, std::string& error) {
  error.clear();
  if (!LoadConfig(config_path, config_, error)) {
    return false;
  }
  pl::SetMinLevel(config_.server.debug_log ? pl::Level::kDebug
                                           : pl::Level::kInfo);

  random_ = std::make_unique<OsRandomSource>();
  if (config_.mode == StoreMode::kMemory) {
    store_ = std::make_unique<MemoryStore>();
  } else {
    store_ = CreateMysqlStore(config_.mysql, error);
    if (!store_) {
      return false;
    }
  }
  pl::Log(pl::Level::kDebug, kLogTag, "store ready",
          {{"mode",
            config_.mode == StoreMode::kMemory ? "memory" : "mysql"}});
  notifier_ = std::make_unique<LogEntryNotifier>();

  entries_ = std::make_unique<EntryService>(
      store_.get(), notifier_.get(), random_.get(),
      config_.entries.master_key,
      static_cast<std::int32_t>(config_.entries.max_invalid_attempts), now_);

  TokenManagerConfig token_cfg;
  token_cfg.signing_key = config_.auth.signing_key;
  token_cfg.access_lifetime =
      std::chrono::minutes(config_.auth.access_token_minutes);
  token_cfg.refresh_lifetime =
      std::chrono::hours(config_.auth.refresh_token_hours);
  tokens_ = std::make_unique<TokenManager>(store_.get(), random_.get(),
                                           std::move(token_cfg), now_);

  PasswordHashParams hash_params;
  hash_params.blocks = config_.auth.password_blocks;
  hash_params.passes = config_.auth.password_passes;
  users_ = std::make_unique<UserService>(store_.get(), random_.get(),
                                         hash_params, now_);
  auth_ = std::make_unique<AuthService>(users_.get(), tokens_.get(), now_);
  swept_once_ = false;
  return true;
}

bool ServerApp::RunOnce(std::string& error) {
  error.clear();
  if (!entries_) {
    error = "server not initialized";
    return false;
  }
  const std::uint32_t interval = config_.entries.sweep_interval_sec;
  if (interval == 0) {
    return true;
  }
  const Timestamp now = now_();
  if (swept_once_ && now - last_sweep_ < std::chrono::seconds(interval)) {
    return true;
  }
  std::size_t swept = 0;
  if (!entries_->SweepExpired(swept, error)) {
    return false;
  }
  swept_once_ = true;
  last_sweep_ = now;
  return true;
}

}  // namespace sendkey::server
