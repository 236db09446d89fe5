#ifndef SENDKEY_SERVER_RECORDS_H
#define SENDKEY_SERVER_RECORDS_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "uuid.h"

namespace sendkey::server {

using Timestamp = std::chrono::system_clock::time_point;
using NowFn = std::function<Timestamp()>;

Timestamp SystemNow();

// Whole seconds since the unix epoch; sub-second precision is dropped the
// same way the store drops it.
std::int64_t ToUnixSeconds(Timestamp t);
Timestamp FromUnixSeconds(std::int64_t seconds);

// 9999-12-31T23:59:59Z, the last second a DATETIME column holds.
constexpr std::int64_t kMaxStoredUnixSeconds = 253402300799;

// Latest deadline that both Timestamp and the store can represent.
std::int64_t MaxDeadlineUnixSeconds();

constexpr std::size_t kEntryNonceBytes = 12;
constexpr std::size_t kEntryTagBytes = 16;
constexpr std::size_t kMaxNameChars = 100;
constexpr std::size_t kMaxEmailChars = 100;
constexpr std::size_t kMaxStoredValueBytes = 2500;
constexpr std::size_t kMaxPlainValueBytes =
    kMaxStoredValueBytes - kEntryTagBytes;
constexpr std::size_t kRefreshTokenBytes = 25;

using EntryNonce = std::array<std::uint8_t, kEntryNonceBytes>;

struct Entry {
  Uuid id;
  std::string name;
  Uuid sent_by_user_id;
  std::string sent_to_email;
  EntryNonce nonce{};
  // ciphertext followed by the 16-byte tag
  std::vector<std::uint8_t> value;
  std::int32_t invalid_attempts{0};
  Timestamp created_at{};
  Timestamp expires_at{};
};

struct ClaimedEntry {
  Uuid entry_id;
  std::string name;
  Uuid sent_by_user_id;
  std::string sent_to_email;
  Timestamp claimed_at{};
};

struct ExpiredEntry {
  Uuid entry_id;
  std::string name;
  Uuid sent_by_user_id;
  std::string sent_to_email;
  bool too_many_attempts{false};
  Timestamp expired_at{};
};

struct RefreshToken {
  Uuid id;
  Uuid user_id;
  std::string token;
  Timestamp created_at{};
  Timestamp expires_at{};
};

struct User {
  Uuid id;
  std::string email;
  bool email_verified{false};
  std::string first_name;
  std::string last_name;
  // argon2id$<blocks>$<passes>$<salt_hex>$<hash_hex>
  std::string password;
  Timestamp created_at{};
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_RECORDS_H
