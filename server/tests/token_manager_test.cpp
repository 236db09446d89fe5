#include <cassert>
#include <chrono>
#include <set>
#include <string>

#include "base64url.h"
#include "crypto.h"
#include "memory_store.h"
#include "test_support.h"
#include "token_manager.h"

using sendkey::common::Base64UrlDecode;
using sendkey::common::Base64UrlEncode;
using sendkey::server::MemoryStore;
using sendkey::server::NewRandomUuid;
using sendkey::server::RefreshToken;
using sendkey::server::SessionTokens;
using sendkey::server::Token;
using sendkey::server::TokenFailure;
using sendkey::server::TokenFailureName;
using sendkey::server::TokenFailureStatus;
using sendkey::server::TokenManager;
using sendkey::server::TokenManagerConfig;
using sendkey::server::TokenVerifyResult;
using sendkey::server::ToUnixSeconds;
using sendkey::server::Uuid;
using sendkey::server::testing::DeterministicRandom;
using sendkey::server::testing::ManualClock;

namespace {

constexpr char kSigningKey[] = "unit-test-signing-key";

TokenManagerConfig Config(const std::string& key = kSigningKey) {
  TokenManagerConfig cfg;
  cfg.signing_key = key;
  cfg.access_lifetime = std::chrono::minutes(15);
  cfg.refresh_lifetime = std::chrono::hours(720);
  return cfg;
}

// Builds a compact JWS by hand so the verifier can be fed odd inputs.
std::string Forge(const std::string& header_json,
                  const std::string& claims_json,
                  const std::string& key = kSigningKey) {
  const std::string input = Base64UrlEncode(header_json) + "." +
                            Base64UrlEncode(claims_json);
  sendkey::server::crypto::Sha256Digest mac;
  sendkey::server::crypto::HmacSha256(
      reinterpret_cast<const std::uint8_t*>(key.data()), key.size(),
      reinterpret_cast<const std::uint8_t*>(input.data()), input.size(), mac);
  return input + "." + Base64UrlEncode(mac.bytes.data(), mac.bytes.size());
}

const char kHs256Header[] = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";

}  // namespace

int main() {
  ManualClock clock;
  DeterministicRandom random;
  MemoryStore store;
  TokenManager tokens(&store, &random, Config(), clock.Fn());

  Uuid user;
  NewRandomUuid(random, user);
  const std::int64_t now = ToUnixSeconds(clock.Now());

  // Issue and verify.
  Token access;
  std::string err;
  assert(tokens.IssueAccessToken(user, access, err));
  assert(access.expires == now + 15 * 60);
  {
    const auto dot = access.token.find('.');
    std::string header;
    assert(Base64UrlDecode(access.token.substr(0, dot), header));
    assert(header == kHs256Header);
  }
  TokenVerifyResult ok = tokens.VerifyAccessToken(access.token);
  assert(ok.ok());
  assert(ok.user_id == user);
  assert(TokenFailureStatus(ok.failure) == 200);

  // Valid up to and including the expiry second.
  clock.Advance(std::chrono::minutes(15));
  assert(tokens.VerifyAccessToken(access.token).ok());
  clock.Advance(std::chrono::seconds(1));
  assert(tokens.VerifyAccessToken(access.token).failure ==
         TokenFailure::kExpired);

  assert(tokens.IssueAccessToken(user, access, err));

  // A different key cannot verify.
  {
    TokenManager other(&store, &random, Config("another-key"), clock.Fn());
    Token foreign;
    assert(other.IssueAccessToken(user, foreign, err));
    assert(tokens.VerifyAccessToken(foreign.token).failure ==
           TokenFailure::kBadSignature);
  }

  // Altered claims break the signature.
  {
    const auto dot1 = access.token.find('.');
    const auto dot2 = access.token.find('.', dot1 + 1);
    Uuid someone;
    NewRandomUuid(random, someone);
    const std::string claims =
        "{\"exp\":" + std::to_string(ToUnixSeconds(clock.Now()) + 60) +
        ",\"jti\":\"" + someone.ToString() + "\"}";
    const std::string tampered = access.token.substr(0, dot1) + "." +
                                 Base64UrlEncode(claims) +
                                 access.token.substr(dot2);
    assert(tokens.VerifyAccessToken(tampered).failure ==
           TokenFailure::kBadSignature);
  }

  assert(tokens.VerifyAccessToken("").failure == TokenFailure::kMissing);
  assert(tokens.VerifyAccessToken("abc").failure == TokenFailure::kMalformed);
  assert(tokens.VerifyAccessToken("a.b").failure == TokenFailure::kMalformed);
  assert(tokens.VerifyAccessToken(access.token + ".x").failure ==
         TokenFailure::kMalformed);
  assert(tokens.VerifyAccessToken("!!.e30.sig").failure ==
         TokenFailure::kMalformed);

  const std::string exp = std::to_string(ToUnixSeconds(clock.Now()) + 300);
  const std::string good_claims =
      "{\"exp\":" + exp + ",\"jti\":\"" + user.ToString() + "\"}";

  assert(tokens.VerifyAccessToken(Forge(kHs256Header, good_claims)).ok());

  // Only HS256 is accepted, whatever the signature says.
  {
    const std::string none_token = Base64UrlEncode(std::string(
                                       "{\"alg\":\"none\"}")) +
                                   "." + Base64UrlEncode(good_claims) + ".";
    assert(tokens.VerifyAccessToken(none_token).failure ==
           TokenFailure::kAlgorithmMismatch);
    assert(tokens
               .VerifyAccessToken(
                   Forge("{\"alg\":\"HS512\",\"typ\":\"JWT\"}", good_claims))
               .failure == TokenFailure::kAlgorithmMismatch);
    assert(tokens.VerifyAccessToken(Forge("{\"typ\":\"JWT\"}", good_claims))
               .failure == TokenFailure::kAlgorithmMismatch);
  }

  // Claims that do not identify a user.
  assert(tokens
             .VerifyAccessToken(Forge(
                 kHs256Header,
                 "{\"exp\":" + exp + ",\"jti\":\"not-a-uuid\"}"))
             .failure == TokenFailure::kBadClaims);
  assert(tokens.VerifyAccessToken(Forge(kHs256Header, "{\"exp\":" + exp + "}"))
             .failure == TokenFailure::kBadClaims);
  assert(tokens
             .VerifyAccessToken(Forge(kHs256Header,
                                      "{\"exp\":" + exp + ",\"jti\":42}"))
             .failure == TokenFailure::kBadClaims);
  assert(tokens
             .VerifyAccessToken(Forge(kHs256Header, "{\"jti\":\"" +
                                                        user.ToString() +
                                                        "\"}"))
             .failure == TokenFailure::kBadClaims);
  assert(tokens.VerifyAccessToken(Forge(kHs256Header, "[1,2]")).failure ==
         TokenFailure::kMalformed);

  // Every failure has its own stable name and maps to 401.
  {
    std::set<std::string> names;
    for (const TokenFailure f :
         {TokenFailure::kMissing, TokenFailure::kMalformed,
          TokenFailure::kAlgorithmMismatch, TokenFailure::kBadSignature,
          TokenFailure::kExpired, TokenFailure::kBadClaims}) {
      names.insert(TokenFailureName(f));
      assert(TokenFailureStatus(f) == 401);
    }
    assert(names.size() == 6);
  }

  // Refresh tokens.
  {
    Token a;
    Token b;
    assert(tokens.IssueRefreshToken(a, err));
    assert(tokens.IssueRefreshToken(b, err));
    assert(a.token.size() == 50);
    assert(a.token.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(a.token != b.token);
    assert(a.expires == ToUnixSeconds(clock.Now()) + 720 * 3600);
  }

  {
    SessionTokens session;
    assert(tokens.CreateSessionTokens(user, session, err));
    assert(store.RefreshTokenCount() == 1);
    assert(tokens.VerifyAccessToken(session.access.token).user_id == user);

    std::optional<RefreshToken> record;
    assert(tokens.VerifyRefreshToken(session.refresh.token, user, record, err));
    assert(record.has_value());
    assert(record->user_id == user);
    assert(ToUnixSeconds(record->expires_at) == session.refresh.expires);

    Uuid stranger;
    NewRandomUuid(random, stranger);
    std::optional<RefreshToken> miss;
    assert(tokens.VerifyRefreshToken(session.refresh.token, stranger, miss,
                                     err));
    assert(!miss.has_value());
    assert(tokens.VerifyRefreshToken(session.refresh.token.substr(1), user,
                                     miss, err));
    assert(!miss.has_value());

    Token renewed;
    assert(tokens.RefreshAccessToken(*record, renewed, err));
    assert(tokens.VerifyAccessToken(renewed.token).user_id == user);
    assert(store.RefreshTokenCount() == 1);

    assert(tokens.RevokeRefreshToken(*record, err));
    assert(store.RefreshTokenCount() == 0);
  }

  {
    store.SetFailure("store down");
    SessionTokens session;
    assert(!tokens.CreateSessionTokens(user, session, err));
    assert(err == "store down");
    store.SetFailure("");
  }

  {
    TokenManager unsigned_tokens(&store, &random, Config(""), clock.Fn());
    Token t;
    assert(!unsigned_tokens.IssueAccessToken(user, t, err));
  }

  return 0;
}
