#ifndef SENDKEY_SERVER_USER_SERVICE_H
#define SENDKEY_SERVER_USER_SERVICE_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "random_source.h"
#include "records.h"
#include "repositories.h"

namespace sendkey::server {

struct PasswordHashParams {
  std::uint32_t blocks{4096};  // 1 KiB each
  std::uint32_t passes{3};
};

constexpr std::uint32_t kMinPasswordBlocks = 8;
constexpr std::uint32_t kMaxPasswordBlocks = 8192;
constexpr std::uint32_t kMaxPasswordPasses = 16;

struct CreateUserRequest {
  std::string email;
  std::string password;
  std::string first_name;
  std::string last_name;
};

struct CreateUserResult {
  bool success{false};
  std::vector<std::string> errors;
  std::optional<User> user;
};

struct LoginRequest {
  std::string email;
  std::string password;
};

struct LoginResult {
  bool success{false};
  std::vector<std::string> errors;
  std::optional<User> user;
};

// Hashes with argon2id and stores
// argon2id$<blocks>$<passes>$<salt_hex>$<hash_hex>.
bool HashPassword(const std::string& password,
                  const PasswordHashParams& params, RandomSource& random,
                  std::string& out_record, std::string& error);

// out_match is false for a wrong password. A record that cannot be parsed
// is an error.
bool VerifyPassword(const std::string& password, const std::string& record,
                    bool& out_match, std::string& error);

class UserService {
 public:
  UserService(UserRepository* users, RandomSource* random,
              PasswordHashParams params, NowFn now = SystemNow);

  bool CreateUser(const CreateUserRequest& req, CreateUserResult& out,
                  std::string& error);
  bool Login(const LoginRequest& req, LoginResult& out, std::string& error);
  bool FindUser(const Uuid& id, std::optional<User>& out, std::string& error);

 private:
  UserRepository* users_;
  RandomSource* random_;
  PasswordHashParams params_;
  NowFn now_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_USER_SERVICE_H
