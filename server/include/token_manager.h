#ifndef SENDKEY_SERVER_TOKEN_MANAGER_H
#define SENDKEY_SERVER_TOKEN_MANAGER_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "random_source.h"
#include "records.h"
#include "repositories.h"

namespace sendkey::server {

struct Token {
  std::string token;
  std::int64_t expires{0};  // unix seconds
};

struct SessionTokens {
  Token access;
  Token refresh;
};

enum class TokenFailure : std::uint8_t {
  kNone = 0,
  kMissing,
  kMalformed,
  kAlgorithmMismatch,
  kBadSignature,
  kExpired,
  kBadClaims
};

const char* TokenFailureName(TokenFailure failure);
// HTTP status a transport should answer with: 200 for kNone, 401 otherwise.
int TokenFailureStatus(TokenFailure failure);

struct TokenVerifyResult {
  TokenFailure failure{TokenFailure::kNone};
  Uuid user_id;

  bool ok() const { return failure == TokenFailure::kNone; }
};

struct TokenManagerConfig {
  std::string signing_key;
  std::chrono::seconds access_lifetime{std::chrono::minutes(15)};
  std::chrono::seconds refresh_lifetime{std::chrono::hours(720)};
};

// Access tokens are HS256 compact JWS carrying exp, iat, jti and sub; they
// are checked by signature alone. Refresh tokens are opaque hex strings
// bound to a user only through the refresh token repository.
class TokenManager {
 public:
  TokenManager(RefreshTokenRepository* refresh_tokens, RandomSource* random,
               TokenManagerConfig config, NowFn now = SystemNow);

  bool IssueAccessToken(const Uuid& user_id, Token& out,
                        std::string& error) const;
  bool IssueRefreshToken(Token& out, std::string& error) const;

  TokenVerifyResult VerifyAccessToken(std::string_view token) const;

  // Exact value and owner match; no partial matches.
  bool VerifyRefreshToken(const std::string& value, const Uuid& user_id,
                          std::optional<RefreshToken>& out,
                          std::string& error) const;

  // Issues a new access token for record.user_id. The refresh token itself
  // is left untouched.
  bool RefreshAccessToken(const RefreshToken& record, Token& out,
                          std::string& error) const;

  // Issues and stores a refresh token, then issues an access token.
  bool CreateSessionTokens(const Uuid& user_id, SessionTokens& out,
                           std::string& error) const;

  bool RevokeRefreshToken(const RefreshToken& record,
                          std::string& error) const;

 private:
  std::string Sign(std::string_view signing_input) const;

  RefreshTokenRepository* refresh_tokens_;
  RandomSource* random_;
  TokenManagerConfig config_;
  NowFn now_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_TOKEN_MANAGER_H
