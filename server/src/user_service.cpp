#include "user_service.h"

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include "constant_time.h"
#include "hex_utils.h"
#include "monocypher.h"
#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "users";
constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kHashBytes = 32;

std::string Trim(const std::string& input) {
  std::size_t start = 0;
  while (start < input.size() &&
         std::isspace(static_cast<unsigned char>(input[start]))) {
    start++;
  }
  std::size_t end = input.size();
  while (end > start &&
         std::isspace(static_cast<unsigned char>(input[end - 1]))) {
    end--;
  }
  return input.substr(start, end - start);
}

bool ParseUint32(std::string_view text, std::uint32_t& out) {
  if (text.empty() || text.size() > 10) {
    return false;
  }
  std::uint64_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<std::uint64_t>(c - '0');
  }
  if (value > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParamsInRange(std::uint32_t blocks, std::uint32_t passes) {
  return blocks >= kMinPasswordBlocks && blocks <= kMaxPasswordBlocks &&
         passes >= 1 && passes <= kMaxPasswordPasses;
}

void DeriveArgon2id(const std::string& password, std::uint32_t blocks,
                    std::uint32_t passes,
                    const std::vector<std::uint8_t>& salt,
                    std::array<std::uint8_t, kHashBytes>& out) {
  std::vector<std::uint8_t> work_area;
  work_area.resize(static_cast<std::size_t>(blocks) * 1024);

  crypto_argon2_config cfg;
  cfg.algorithm = CRYPTO_ARGON2_ID;
  cfg.nb_blocks = blocks;
  cfg.nb_passes = passes;
  cfg.nb_lanes = 1;

  crypto_argon2_inputs in;
  in.pass = reinterpret_cast<const std::uint8_t*>(password.data());
  in.pass_size = static_cast<std::uint32_t>(password.size());
  in.salt = salt.data();
  in.salt_size = static_cast<std::uint32_t>(salt.size());

  crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()),
                work_area.data(), cfg, in, crypto_argon2_no_extras);
  crypto_wipe(work_area.data(), work_area.size());
}

}  // namespace

bool HashPassword(const std::string& password,
                  const PasswordHashParams& params, RandomSource& random,
                  std::string& out_record, std::string& error) {
  error.clear();
  out_record.clear();
  if (!ParamsInRange(params.blocks, params.passes)) {
    error = "argon2id params out of range";
    return false;
  }
  std::vector<std::uint8_t> salt(kSaltBytes);
  if (!random.Fill(salt.data(), salt.size())) {
    error = "password salt generation failed";
    return false;
  }
  std::array<std::uint8_t, kHashBytes> hash{};
  DeriveArgon2id(password, params.blocks, params.passes, salt, hash);

  out_record = "argon2id$" + std::to_string(params.blocks) + "$" +
               std::to_string(params.passes) + "$" +
               sendkey::common::BytesToHex(salt) + "$" +
               sendkey::common::BytesToHex(hash.data(), hash.size());
  crypto_wipe(hash.data(), hash.size());
  return true;
}

bool VerifyPassword(const std::string& password, const std::string& record,
                    bool& out_match, std::string& error) {
  error.clear();
  out_match = false;
  // argon2id$nb_blocks$nb_passes$salt_hex$hash_hex
  std::vector<std::string_view> parts;
  parts.reserve(5);
  const std::string_view sv(record);
  std::size_t start = 0;
  while (true) {
    const auto pos = sv.find('$', start);
    if (pos == std::string_view::npos) {
      parts.push_back(sv.substr(start));
      break;
    }
    parts.push_back(sv.substr(start, pos - start));
    start = pos + 1;
  }
  if (parts.size() != 5 || parts[0] != "argon2id") {
    error = "argon2id format invalid";
    return false;
  }
  std::uint32_t nb_blocks = 0;
  std::uint32_t nb_passes = 0;
  if (!ParseUint32(parts[1], nb_blocks) || !ParseUint32(parts[2], nb_passes)) {
    error = "argon2id params invalid";
    return false;
  }
  if (!ParamsInRange(nb_blocks, nb_passes)) {
    error = "argon2id params out of range";
    return false;
  }
  std::vector<std::uint8_t> salt;
  std::vector<std::uint8_t> expected;
  if (!sendkey::common::HexToBytes(parts[3], salt) ||
      !sendkey::common::HexToBytes(parts[4], expected) || salt.empty() ||
      expected.size() != kHashBytes) {
    error = "argon2id salt/hash invalid";
    return false;
  }

  std::array<std::uint8_t, kHashBytes> actual{};
  DeriveArgon2id(password, nb_blocks, nb_passes, salt, actual);
  out_match = sendkey::common::ConstantTimeEqual(
      actual.data(), actual.size(), expected.data(), expected.size());
  crypto_wipe(actual.data(), actual.size());
  return true;
}

UserService::UserService(UserRepository* users, RandomSource* random,
                         PasswordHashParams params, NowFn now)
    : users_(users),
      random_(random),
      params_(params),
      now_(now ? std::move(now) : NowFn(SystemNow)) {}

bool UserService::CreateUser(const CreateUserRequest& req,
                             CreateUserResult& out, std::string& error) {
  error.clear();
  out = CreateUserResult{};

  const std::string email = Trim(req.email);
  if (email.empty()) {
    out.errors.emplace_back("An email is required.");
  }
  if (req.password.empty()) {
    out.errors.emplace_back("A password is required.");
  }
  if (!out.errors.empty()) {
    return true;
  }

  std::optional<User> existing;
  if (!users_->FindUserByEmail(email, existing, error)) {
    return false;
  }
  if (existing) {
    out.errors.emplace_back(
        "An account with the specified email already exists.");
    return true;
  }

  User user;
  if (!NewRandomUuid(*random_, user.id)) {
    error = "user id generation failed";
    return false;
  }
  if (!HashPassword(req.password, params_, *random_, user.password, error)) {
    return false;
  }
  user.email = email;
  user.first_name = req.first_name;
  user.last_name = req.last_name;
  user.created_at = FromUnixSeconds(ToUnixSeconds(now_()));
  if (!users_->CreateUser(user, error)) {
    return false;
  }

  const std::string id = user.id.ToString();
  pl::Log(pl::Level::kInfo, kLogTag, "user created", {{"user_id", id}});
  out.success = true;
  out.user = std::move(user);
  return true;
}

bool UserService::Login(const LoginRequest& req, LoginResult& out,
                        std::string& error) {
  error.clear();
  out = LoginResult{};

  const std::string email = Trim(req.email);
  if (email.empty()) {
    out.errors.emplace_back("An email is required.");
  }
  if (req.password.empty()) {
    out.errors.emplace_back("A password is required.");
  }
  if (!out.errors.empty()) {
    return true;
  }

  std::optional<User> user;
  if (!users_->FindUserByEmail(email, user, error)) {
    return false;
  }
  if (!user) {
    out.errors.emplace_back("No user could be found with the specified email.");
    return true;
  }

  bool match = false;
  if (!VerifyPassword(req.password, user->password, match, error)) {
    return false;
  }
  if (!match) {
    const std::string id = user->id.ToString();
    pl::Log(pl::Level::kDebug, kLogTag, "login rejected", {{"user_id", id}});
    out.errors.emplace_back("The specified password is invalid.");
    return true;
  }

  out.success = true;
  out.user = std::move(user);
  return true;
}

bool UserService::FindUser(const Uuid& id, std::optional<User>& out,
                           std::string& error) {
  error.clear();
  return users_->FindUser(id, out, error);
}

}  // namespace sendkey::server
