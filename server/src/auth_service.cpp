#include "auth_service.h"

#include <cctype>
#include <utility>

#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "auth";
constexpr std::string_view kBearerPrefix = "Bearer ";

bool IsBlank(const std::string& s) {
  for (const char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace

AuthService::AuthService(UserService* users, TokenManager* tokens, NowFn now)
    : users_(users),
      tokens_(tokens),
      now_(now ? std::move(now) : NowFn(SystemNow)) {}

bool AuthService::Login(const LoginRequest& req, AuthLoginResult& out,
                        std::string& error) {
  error.clear();
  out = AuthLoginResult{};

  LoginResult login;
  if (!users_->Login(req, login, error)) {
    return false;
  }
  if (!login.success) {
    out.errors = std::move(login.errors);
    return true;
  }

  SessionTokens session;
  if (!tokens_->CreateSessionTokens(login.user->id, session, error)) {
    return false;
  }
  const std::string id = login.user->id.ToString();
  pl::Log(pl::Level::kInfo, kLogTag, "login", {{"user_id", id}});

  out.success = true;
  out.user = std::move(login.user);
  out.access_token = std::move(session.access);
  out.refresh_token = std::move(session.refresh);
  return true;
}

bool AuthService::Refresh(const Uuid& user_id,
                          const std::string& refresh_token,
                          RefreshResult& out, std::string& error) {
  error.clear();
  out = RefreshResult{};

  if (user_id.IsNil()) {
    out.errors.emplace_back("Invalid userId.");
  }
  if (IsBlank(refresh_token)) {
    out.errors.emplace_back("A refresh token is required.");
  }
  if (!out.errors.empty()) {
    return true;
  }

  std::optional<RefreshToken> record;
  if (!tokens_->VerifyRefreshToken(refresh_token, user_id, record, error)) {
    return false;
  }
  if (!record || now_() >= record->expires_at) {
    out.errors.emplace_back("Invalid refresh token.");
    return true;
  }

  Token access;
  if (!tokens_->RefreshAccessToken(*record, access, error)) {
    return false;
  }
  out.success = true;
  out.access_token = std::move(access);
  return true;
}

bool AuthService::Logout(const Uuid& user_id,
                         const std::string& refresh_token, bool& out_revoked,
                         std::string& error) {
  error.clear();
  out_revoked = false;
  std::optional<RefreshToken> record;
  if (!tokens_->VerifyRefreshToken(refresh_token, user_id, record, error)) {
    return false;
  }
  if (!record) {
    return true;
  }
  if (!tokens_->RevokeRefreshToken(*record, error)) {
    return false;
  }
  const std::string id = user_id.ToString();
  pl::Log(pl::Level::kInfo, kLogTag, "logout", {{"user_id", id}});
  out_revoked = true;
  return true;
}

TokenVerifyResult AuthService::Authenticate(
    std::string_view authorization) const {
  if (authorization.substr(0, kBearerPrefix.size()) == kBearerPrefix) {
    authorization.remove_prefix(kBearerPrefix.size());
  }
  return tokens_->VerifyAccessToken(authorization);
}

}  // namespace sendkey::server
