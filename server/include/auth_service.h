#ifndef SENDKEY_SERVER_AUTH_SERVICE_H
#define SENDKEY_SERVER_AUTH_SERVICE_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "records.h"
#include "token_manager.h"
#include "user_service.h"

namespace sendkey::server {

struct AuthLoginResult {
  bool success{false};
  std::vector<std::string> errors;
  std::optional<User> user;
  Token access_token;
  Token refresh_token;
};

struct RefreshResult {
  bool success{false};
  std::vector<std::string> errors;
  std::optional<Token> access_token;
};

// Session flows on top of the credential check and the token engine.
class AuthService {
 public:
  AuthService(UserService* users, TokenManager* tokens,
              NowFn now = SystemNow);

  bool Login(const LoginRequest& req, AuthLoginResult& out,
             std::string& error);

  // Expired refresh records are reported as invalid.
  bool Refresh(const Uuid& user_id, const std::string& refresh_token,
               RefreshResult& out, std::string& error);

  // out_revoked is false when no matching refresh token existed.
  bool Logout(const Uuid& user_id, const std::string& refresh_token,
              bool& out_revoked, std::string& error);

  // Accepts the raw Authorization header value, with or without the
  // "Bearer " prefix.
  TokenVerifyResult Authenticate(std::string_view authorization) const;

 private:
  UserService* users_;
  TokenManager* tokens_;
  NowFn now_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_AUTH_SERVICE_H
