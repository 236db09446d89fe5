#ifndef SENDKEY_SERVER_APP_H
#define SENDKEY_SERVER_APP_H

#include <memory>
#include <string>

#include "auth_service.h"
#include "config.h"
#include "entry_notifier.h"
#include "entry_service.h"
#include "random_source.h"
#include "records.h"
#include "repositories.h"
#include "token_manager.h"
#include "user_service.h"

namespace sendkey::server {

class ServerApp {
 public:
  explicit ServerApp(NowFn now = SystemNow);
  ~ServerApp();

  bool Init(const std::string& config_path, std::string& error);

  // Periodic work; runs the expiry sweep once the interval has elapsed.
  bool RunOnce(std::string& error);

  const ServerConfig& config() const { return config_; }
  Store* store() { return store_.get(); }
  EntryService* entries() { return entries_.get(); }
  TokenManager* tokens() { return tokens_.get(); }
  UserService* users() { return users_.get(); }
  AuthService* auth() { return auth_.get(); }

 private:
  NowFn now_;
  ServerConfig config_;
  std::unique_ptr<RandomSource> random_;
  std::unique_ptr<Store> store_;
  std::unique_ptr<EntryNotifier> notifier_;
  std::unique_ptr<EntryService> entries_;
  std::unique_ptr<TokenManager> tokens_;
  std::unique_ptr<UserService> users_;
  std::unique_ptr<AuthService> auth_;
  bool swept_once_{false};
  Timestamp last_sweep_{};
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_APP_H
