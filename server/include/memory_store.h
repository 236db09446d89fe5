#ifndef SENDKEY_SERVER_MEMORY_STORE_H
#define SENDKEY_SERVER_MEMORY_STORE_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "repositories.h"

namespace sendkey::server {

// Process-local store used by demo mode and the tests. One mutex guards
// every table, which makes each repository call atomic.
class MemoryStore final : public Store {
 public:
  MemoryStore() = default;

  bool Find(const Uuid& id, std::optional<Entry>& out,
            std::string& error) override;
  bool FindByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                   std::string& error) override;
  bool FindExpired(Timestamp now, std::vector<Entry>& out,
                   std::string& error) override;
  bool Create(const Entry& entry, std::string& error) override;
  bool Delete(const Uuid& id, std::string& error) override;
  bool IncrementInvalidAttempts(const Uuid& id, bool& out_found,
                                std::int32_t& out_count,
                                std::string& error) override;
  bool RecordClaim(const ClaimedEntry& claimed, bool& out_transitioned,
                   std::string& error) override;
  bool RecordExpiry(const ExpiredEntry& expired, bool& out_transitioned,
                    std::string& error) override;

  bool CreateRefreshToken(const RefreshToken& token,
                          std::string& error) override;
  bool FindRefreshTokenByValueAndOwner(const std::string& value,
                                       const Uuid& owner_id,
                                       std::optional<RefreshToken>& out,
                                       std::string& error) override;
  bool DeleteRefreshToken(const Uuid& id, std::string& error) override;

  bool FindUser(const Uuid& id, std::optional<User>& out,
                std::string& error) override;
  bool FindUserByEmail(const std::string& email, std::optional<User>& out,
                       std::string& error) override;
  bool CreateUser(const User& user, std::string& error) override;

  // Inspection for tests and diagnostics.
  std::size_t ActiveEntryCount() const;
  std::vector<ClaimedEntry> ClaimedEntries() const;
  std::vector<ExpiredEntry> ExpiredEntries() const;
  std::size_t RefreshTokenCount() const;

  // While set, every repository call fails with this message.
  void SetFailure(std::string error);

 private:
  bool CheckFailureLocked(std::string& error) const;

  mutable std::mutex mutex_;
  std::string forced_error_;
  std::map<Uuid, Entry> entries_;
  std::map<Uuid, ClaimedEntry> claimed_;
  std::map<Uuid, ExpiredEntry> expired_;
  std::map<Uuid, RefreshToken> refresh_tokens_;
  std::map<Uuid, User> users_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_MEMORY_STORE_H
