#include "token_manager.h"

#include <sstream>
#include <utility>
#include <vector>

#include "base64url.h"
#include "constant_time.h"
#include "crypto.h"
#include "hex_utils.h"
#include "json_util.h"
#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "tokens";
constexpr char kAlgorithm[] = "HS256";

std::string EncodedHeader() {
  return sendkey::common::Base64UrlEncode(
      std::string_view("{\"alg\":\"HS256\",\"typ\":\"JWT\"}"));
}

TokenVerifyResult Fail(TokenFailure failure) {
  TokenVerifyResult result;
  result.failure = failure;
  pl::Log(pl::Level::kDebug, kLogTag, "access token rejected",
          {{"reason", TokenFailureName(failure)}});
  return result;
}

}  // namespace

const char* TokenFailureName(TokenFailure failure) {
  switch (failure) {
    case TokenFailure::kNone:
      return "none";
    case TokenFailure::kMissing:
      return "missing";
    case TokenFailure::kMalformed:
      return "malformed";
    case TokenFailure::kAlgorithmMismatch:
      return "algorithm_mismatch";
    case TokenFailure::kBadSignature:
      return "bad_signature";
    case TokenFailure::kExpired:
      return "expired";
    case TokenFailure::kBadClaims:
      return "bad_claims";
  }
  return "unknown";
}

int TokenFailureStatus(TokenFailure failure) {
  return failure == TokenFailure::kNone ? 200 : 401;
}

TokenManager::TokenManager(RefreshTokenRepository* refresh_tokens,
                           RandomSource* random, TokenManagerConfig config,
                           NowFn now)
    : refresh_tokens_(refresh_tokens),
      random_(random),
      config_(std::move(config)),
      now_(now ? std::move(now) : NowFn(SystemNow)) {}

std::string TokenManager::Sign(std::string_view signing_input) const {
  crypto::Sha256Digest mac;
  crypto::HmacSha256(
      reinterpret_cast<const std::uint8_t*>(config_.signing_key.data()),
      config_.signing_key.size(),
      reinterpret_cast<const std::uint8_t*>(signing_input.data()),
      signing_input.size(), mac);
  return sendkey::common::Base64UrlEncode(mac.bytes.data(), mac.bytes.size());
}

bool TokenManager::IssueAccessToken(const Uuid& user_id, Token& out,
                                    std::string& error) const {
  error.clear();
  out = Token{};
  if (config_.signing_key.empty()) {
    error = "signing key missing";
    return false;
  }
  if (user_id.IsNil()) {
    error = "user id empty";
    return false;
  }
  const std::int64_t now = ToUnixSeconds(now_());
  const std::int64_t expires =
      now + static_cast<std::int64_t>(config_.access_lifetime.count());
  const std::string id = user_id.ToString();

  std::ostringstream claims;
  claims << "{\"exp\":" << expires << ",\"iat\":" << now << ",\"jti\":";
  WriteJsonEscaped(claims, id);
  claims << ",\"sub\":";
  WriteJsonEscaped(claims, id);
  claims << "}";

  std::string signing_input = EncodedHeader();
  signing_input.push_back('.');
  signing_input += sendkey::common::Base64UrlEncode(claims.str());

  out.token = signing_input + "." + Sign(signing_input);
  out.expires = expires;
  return true;
}

bool TokenManager::IssueRefreshToken(Token& out, std::string& error) const {
  error.clear();
  out = Token{};
  if (!random_) {
    error = "random source missing";
    return false;
  }
  std::vector<std::uint8_t> raw(kRefreshTokenBytes);
  if (!random_->Fill(raw.data(), raw.size())) {
    error = "refresh token generation failed";
    return false;
  }
  out.token = sendkey::common::BytesToHex(raw);
  out.expires = ToUnixSeconds(now_()) +
                static_cast<std::int64_t>(config_.refresh_lifetime.count());
  return true;
}

TokenVerifyResult TokenManager::VerifyAccessToken(
    std::string_view token) const {
  if (token.empty()) {
    return Fail(TokenFailure::kMissing);
  }
  const std::size_t dot1 = token.find('.');
  if (dot1 == std::string_view::npos) {
    return Fail(TokenFailure::kMalformed);
  }
  const std::size_t dot2 = token.find('.', dot1 + 1);
  if (dot2 == std::string_view::npos ||
      token.find('.', dot2 + 1) != std::string_view::npos) {
    return Fail(TokenFailure::kMalformed);
  }
  const std::string_view header_b64 = token.substr(0, dot1);
  const std::string_view claims_b64 = token.substr(dot1 + 1, dot2 - dot1 - 1);
  const std::string_view sig_b64 = token.substr(dot2 + 1);

  std::string header_json;
  FlatJsonObject header;
  std::string parse_err;
  if (!sendkey::common::Base64UrlDecode(header_b64, header_json) ||
      !ParseFlatJsonObject(header_json, header, parse_err)) {
    return Fail(TokenFailure::kMalformed);
  }
  const auto alg = header.find("alg");
  if (alg == header.end() || alg->second.kind != FlatJsonValue::Kind::kString ||
      alg->second.text != kAlgorithm) {
    return Fail(TokenFailure::kAlgorithmMismatch);
  }

  std::vector<std::uint8_t> presented_sig;
  if (!sendkey::common::Base64UrlDecode(sig_b64, presented_sig)) {
    return Fail(TokenFailure::kMalformed);
  }
  if (config_.signing_key.empty()) {
    return Fail(TokenFailure::kBadSignature);
  }
  const std::string_view signing_input = token.substr(0, dot2);
  crypto::Sha256Digest expected;
  crypto::HmacSha256(
      reinterpret_cast<const std::uint8_t*>(config_.signing_key.data()),
      config_.signing_key.size(),
      reinterpret_cast<const std::uint8_t*>(signing_input.data()),
      signing_input.size(), expected);
  if (!sendkey::common::ConstantTimeEqual(presented_sig.data(),
                                          presented_sig.size(),
                                          expected.bytes.data(),
                                          expected.bytes.size())) {
    return Fail(TokenFailure::kBadSignature);
  }

  std::string claims_json;
  FlatJsonObject claims;
  if (!sendkey::common::Base64UrlDecode(claims_b64, claims_json) ||
      !ParseFlatJsonObject(claims_json, claims, parse_err)) {
    return Fail(TokenFailure::kMalformed);
  }

  const std::int64_t now = ToUnixSeconds(now_());
  const auto exp = claims.find("exp");
  std::int64_t exp_value = 0;
  if (exp == claims.end() || !exp->second.AsInt64(exp_value)) {
    return Fail(TokenFailure::kBadClaims);
  }
  if (now > exp_value) {
    return Fail(TokenFailure::kExpired);
  }
  const auto iat = claims.find("iat");
  if (iat != claims.end()) {
    std::int64_t iat_value = 0;
    if (!iat->second.AsInt64(iat_value) || iat_value > now) {
      return Fail(TokenFailure::kBadClaims);
    }
  }

  const auto jti = claims.find("jti");
  TokenVerifyResult result;
  if (jti == claims.end() || jti->second.kind != FlatJsonValue::Kind::kString ||
      !Uuid::Parse(jti->second.text, result.user_id) ||
      result.user_id.IsNil()) {
    return Fail(TokenFailure::kBadClaims);
  }
  return result;
}

bool TokenManager::VerifyRefreshToken(const std::string& value,
                                      const Uuid& user_id,
                                      std::optional<RefreshToken>& out,
                                      std::string& error) const {
  error.clear();
  out.reset();
  if (value.empty() || user_id.IsNil()) {
    return true;
  }
  return refresh_tokens_->FindRefreshTokenByValueAndOwner(value, user_id, out,
                                                          error);
}

bool TokenManager::RefreshAccessToken(const RefreshToken& record, Token& out,
                                      std::string& error) const {
  return IssueAccessToken(record.user_id, out, error);
}

bool TokenManager::CreateSessionTokens(const Uuid& user_id,
                                       SessionTokens& out,
                                       std::string& error) const {
  error.clear();
  out = SessionTokens{};
  if (!IssueRefreshToken(out.refresh, error)) {
    return false;
  }
  RefreshToken record;
  if (!NewRandomUuid(*random_, record.id)) {
    error = "refresh token id generation failed";
    return false;
  }
  record.user_id = user_id;
  record.token = out.refresh.token;
  record.created_at = FromUnixSeconds(ToUnixSeconds(now_()));
  record.expires_at = FromUnixSeconds(out.refresh.expires);
  if (!refresh_tokens_->CreateRefreshToken(record, error)) {
    return false;
  }
  if (!IssueAccessToken(user_id, out.access, error)) {
    std::string revoke_err;
    if (!refresh_tokens_->DeleteRefreshToken(record.id, revoke_err)) {
      const std::string id = record.id.ToString();
      pl::Log(pl::Level::kWarn, kLogTag, "refresh token cleanup failed",
              {{"refresh_id", id}, {"error", revoke_err}});
    }
    return false;
  }
  return true;
}

bool TokenManager::RevokeRefreshToken(const RefreshToken& record,
                                      std::string& error) const {
  error.clear();
  return refresh_tokens_->DeleteRefreshToken(record.id, error);
}

}  // namespace sendkey::server
