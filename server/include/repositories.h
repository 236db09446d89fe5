#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "records.h"

namespace sendkey::server {

// Every method returns false only on a store failure and sets `error`.
// "Not found" is a successful call with an empty result.
class EntryRepository {
 public:
  virtual ~EntryRepository() = default;

  virtual bool Find(const Uuid& id, std::optional<Entry>& out,
                    std::string& error) = 0;
  // Oldest first.
  virtual bool FindByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                           std::string& error) = 0;
  virtual bool FindExpired(Timestamp now, std::vector<Entry>& out,
                           std::string& error) = 0;
  virtual bool Create(const Entry& entry, std::string& error) = 0;
  virtual bool Delete(const Uuid& id, std::string& error) = 0;

  // Atomic increment-and-read. out_found is false when the entry no longer
  // exists in active storage.
  virtual bool IncrementInvalidAttempts(const Uuid& id, bool& out_found,
                                        std::int32_t& out_count,
                                        std::string& error) = 0;

  // Write the projection and remove the active row as one unit.
  // out_transitioned is false, and nothing is written, when the active row
  // was already gone.
  virtual bool RecordClaim(const ClaimedEntry& claimed,
                           bool& out_transitioned, std::string& error) = 0;
  virtual bool RecordExpiry(const ExpiredEntry& expired,
                            bool& out_transitioned, std::string& error) = 0;
};

class RefreshTokenRepository {
 public:
  virtual ~RefreshTokenRepository() = default;

  virtual bool CreateRefreshToken(const RefreshToken& token,
                                  std::string& error) = 0;
  virtual bool FindRefreshTokenByValueAndOwner(
      const std::string& value, const Uuid& owner_id,
      std::optional<RefreshToken>& out, std::string& error) = 0;
  virtual bool DeleteRefreshToken(const Uuid& id, std::string& error) = 0;
};

class UserRepository {
 public:
  virtual ~UserRepository() = default;

  virtual bool FindUser(const Uuid& id, std::optional<User>& out,
                        std::string& error) = 0;
  virtual bool FindUserByEmail(const std::string& email,
                               std::optional<User>& out,
                               std::string& error) = 0;
  virtual bool CreateUser(const User& user, std::string& error) = 0;
};

// One backend serving every repository.
class Store : public EntryRepository,
              public RefreshTokenRepository,
              public UserRepository {};

}  // namespace sendkey::server
