#include <cassert>
#include <chrono>
#include <optional>
#include <string>

#include "auth_service.h"
#include "memory_store.h"
#include "test_support.h"
#include "token_manager.h"
#include "user_service.h"

using sendkey::server::AuthLoginResult;
using sendkey::server::AuthService;
using sendkey::server::CreateUserRequest;
using sendkey::server::CreateUserResult;
using sendkey::server::HashPassword;
using sendkey::server::LoginRequest;
using sendkey::server::LoginResult;
using sendkey::server::MemoryStore;
using sendkey::server::NewRandomUuid;
using sendkey::server::PasswordHashParams;
using sendkey::server::RefreshResult;
using sendkey::server::TokenFailure;
using sendkey::server::TokenManager;
using sendkey::server::TokenManagerConfig;
using sendkey::server::User;
using sendkey::server::UserService;
using sendkey::server::Uuid;
using sendkey::server::VerifyPassword;
using sendkey::server::testing::DeterministicRandom;
using sendkey::server::testing::FailingRandom;
using sendkey::server::testing::HasError;
using sendkey::server::testing::ManualClock;

namespace {

PasswordHashParams FastParams() {
  PasswordHashParams p;
  p.blocks = 8;
  p.passes = 1;
  return p;
}

}  // namespace

int main() {
  std::string err;

  // Password records.
  {
    DeterministicRandom random;
    std::string record;
    assert(HashPassword("hunter2", FastParams(), random, record, err));
    assert(record.rfind("argon2id$8$1$", 0) == 0);
    // 16-byte salt and 32-byte hash, hex encoded.
    assert(record.size() == std::string("argon2id$8$1$").size() + 32 + 1 + 64);

    bool match = false;
    assert(VerifyPassword("hunter2", record, match, err));
    assert(match);
    assert(VerifyPassword("hunter3", record, match, err));
    assert(!match);

    std::string second;
    assert(HashPassword("hunter2", FastParams(), random, second, err));
    assert(second != record);

    assert(!VerifyPassword("hunter2", "plain-text", match, err));
    assert(!VerifyPassword("hunter2", "argon2id$8$1$zz$00", match, err));
    assert(!VerifyPassword("hunter2", "argon2id$999999$1$00$00", match, err));

    PasswordHashParams tiny;
    tiny.blocks = 4;
    tiny.passes = 1;
    assert(!HashPassword("x", tiny, random, record, err));

    FailingRandom broken;
    assert(!HashPassword("x", FastParams(), broken, record, err));
  }

  ManualClock clock;
  DeterministicRandom random;
  MemoryStore store;
  UserService users(&store, &random, FastParams(), clock.Fn());
  TokenManagerConfig token_cfg;
  token_cfg.signing_key = "auth-test-key";
  token_cfg.access_lifetime = std::chrono::minutes(15);
  token_cfg.refresh_lifetime = std::chrono::hours(1);
  TokenManager tokens(&store, &random, token_cfg, clock.Fn());
  AuthService auth(&users, &tokens, clock.Fn());

  // Registration.
  User alice;
  {
    CreateUserResult res;
    CreateUserRequest req;
    assert(users.CreateUser(req, res, err));
    assert(!res.success);
    assert(HasError(res.errors, "An email is required."));
    assert(HasError(res.errors, "A password is required."));

    req.email = "  alice@example.com ";
    req.password = "correct horse";
    req.first_name = "Alice";
    assert(users.CreateUser(req, res, err));
    assert(res.success);
    assert(res.user->email == "alice@example.com");
    assert(res.user->password != req.password);
    assert(!res.user->email_verified);
    alice = *res.user;

    req.email = "alice@example.com";
    assert(users.CreateUser(req, res, err));
    assert(!res.success);
    assert(HasError(res.errors,
                    "An account with the specified email already exists."));

    std::optional<User> found;
    assert(users.FindUser(alice.id, found, err));
    assert(found && found->email == "alice@example.com");
  }

  // Credential checks.
  {
    LoginResult res;
    assert(users.Login({"nobody@example.com", "x"}, res, err));
    assert(HasError(res.errors,
                    "No user could be found with the specified email."));
    assert(users.Login({"alice@example.com", "wrong"}, res, err));
    assert(!res.success);
    assert(HasError(res.errors, "The specified password is invalid."));
    assert(users.Login({" alice@example.com", "correct horse"}, res, err));
    assert(res.success);
    assert(res.user->id == alice.id);
  }

  // Session flow.
  AuthLoginResult session;
  {
    assert(auth.Login({"alice@example.com", "wrong"}, session, err));
    assert(!session.success);
    assert(store.RefreshTokenCount() == 0);

    assert(auth.Login({"alice@example.com", "correct horse"}, session, err));
    assert(session.success);
    assert(session.user->id == alice.id);
    assert(store.RefreshTokenCount() == 1);

    const auto bearer = auth.Authenticate("Bearer " + session.access_token.token);
    assert(bearer.ok());
    assert(bearer.user_id == alice.id);
    assert(auth.Authenticate(session.access_token.token).user_id == alice.id);
    assert(auth.Authenticate("").failure == TokenFailure::kMissing);
    assert(auth.Authenticate("Bearer ").failure == TokenFailure::kMissing);
  }

  {
    RefreshResult res;
    assert(auth.Refresh(Uuid{}, "", res, err));
    assert(!res.success);
    assert(HasError(res.errors, "Invalid userId."));
    assert(HasError(res.errors, "A refresh token is required."));

    assert(auth.Refresh(alice.id, "deadbeef", res, err));
    assert(HasError(res.errors, "Invalid refresh token."));

    Uuid other;
    NewRandomUuid(random, other);
    assert(auth.Refresh(other, session.refresh_token.token, res, err));
    assert(HasError(res.errors, "Invalid refresh token."));

    clock.Advance(std::chrono::minutes(20));
    assert(auth.Authenticate(session.access_token.token).failure ==
           TokenFailure::kExpired);
    assert(auth.Refresh(alice.id, session.refresh_token.token, res, err));
    assert(res.success);
    assert(res.access_token.has_value());
    assert(auth.Authenticate(res.access_token->token).user_id == alice.id);

    // Past the refresh lifetime the record no longer counts.
    clock.Advance(std::chrono::hours(1));
    assert(auth.Refresh(alice.id, session.refresh_token.token, res, err));
    assert(!res.success);
    assert(HasError(res.errors, "Invalid refresh token."));
  }

  {
    bool revoked = true;
    assert(auth.Logout(alice.id, "not-a-token", revoked, err));
    assert(!revoked);
    assert(auth.Logout(alice.id, session.refresh_token.token, revoked, err));
    assert(revoked);
    assert(store.RefreshTokenCount() == 0);
    assert(auth.Logout(alice.id, session.refresh_token.token, revoked, err));
    assert(!revoked);
  }

  {
    store.SetFailure("users offline");
    AuthLoginResult res;
    assert(!auth.Login({"alice@example.com", "correct horse"}, res, err));
    assert(err == "users offline");
    store.SetFailure("");
  }

  return 0;
}
