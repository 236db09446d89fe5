#include "memory_store.h"

#include <algorithm>
#include <utility>

namespace sendkey::server {

bool MemoryStore::CheckFailureLocked(std::string& error) const {
  if (forced_error_.empty()) {
    error.clear();
    return true;
  }
  error = forced_error_;
  return false;
}

void MemoryStore::SetFailure(std::string error) {
  std::lock_guard<std::mutex> lock(mutex_);
  forced_error_ = std::move(error);
}

bool MemoryStore::Find(const Uuid& id, std::optional<Entry>& out,
                       std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  const auto it = entries_.find(id);
  if (it != entries_.end()) {
    out = it->second;
  }
  return true;
}

bool MemoryStore::FindByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                              std::string& error) {
  out.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  for (const auto& kv : entries_) {
    if (kv.second.sent_by_user_id == owner_id) {
      out.push_back(kv.second);
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Entry& a, const Entry& b) {
                     return a.created_at < b.created_at;
                   });
  return true;
}

bool MemoryStore::FindExpired(Timestamp now, std::vector<Entry>& out,
                              std::string& error) {
  out.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  for (const auto& kv : entries_) {
    if (kv.second.expires_at <= now) {
      out.push_back(kv.second);
    }
  }
  return true;
}

bool MemoryStore::Create(const Entry& entry, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  if (!entries_.emplace(entry.id, entry).second) {
    error = "duplicate entry id";
    return false;
  }
  return true;
}

bool MemoryStore::Delete(const Uuid& id, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  entries_.erase(id);
  return true;
}

bool MemoryStore::IncrementInvalidAttempts(const Uuid& id, bool& out_found,
                                           std::int32_t& out_count,
                                           std::string& error) {
  out_found = false;
  out_count = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    return true;
  }
  out_found = true;
  out_count = ++it->second.invalid_attempts;
  return true;
}

bool MemoryStore::RecordClaim(const ClaimedEntry& claimed,
                              bool& out_transitioned, std::string& error) {
  out_transitioned = false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  if (entries_.erase(claimed.entry_id) == 0) {
    return true;
  }
  claimed_[claimed.entry_id] = claimed;
  out_transitioned = true;
  return true;
}

bool MemoryStore::RecordExpiry(const ExpiredEntry& expired,
                               bool& out_transitioned, std::string& error) {
  out_transitioned = false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  if (entries_.erase(expired.entry_id) == 0) {
    return true;
  }
  expired_[expired.entry_id] = expired;
  out_transitioned = true;
  return true;
}

bool MemoryStore::CreateRefreshToken(const RefreshToken& token,
                                     std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  if (!refresh_tokens_.emplace(token.id, token).second) {
    error = "duplicate refresh token id";
    return false;
  }
  return true;
}

bool MemoryStore::FindRefreshTokenByValueAndOwner(
    const std::string& value, const Uuid& owner_id,
    std::optional<RefreshToken>& out, std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  for (const auto& kv : refresh_tokens_) {
    if (kv.second.token == value && kv.second.user_id == owner_id) {
      out = kv.second;
      break;
    }
  }
  return true;
}

bool MemoryStore::DeleteRefreshToken(const Uuid& id, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  refresh_tokens_.erase(id);
  return true;
}

bool MemoryStore::FindUser(const Uuid& id, std::optional<User>& out,
                           std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  const auto it = users_.find(id);
  if (it != users_.end()) {
    out = it->second;
  }
  return true;
}

bool MemoryStore::FindUserByEmail(const std::string& email,
                                  std::optional<User>& out,
                                  std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  for (const auto& kv : users_) {
    if (kv.second.email == email) {
      out = kv.second;
      break;
    }
  }
  return true;
}

bool MemoryStore::CreateUser(const User& user, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CheckFailureLocked(error)) {
    return false;
  }
  for (const auto& kv : users_) {
    if (kv.second.email == user.email) {
      error = "duplicate user email";
      return false;
    }
  }
  if (!users_.emplace(user.id, user).second) {
    error = "duplicate user id";
    return false;
  }
  return true;
}

std::size_t MemoryStore::ActiveEntryCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<ClaimedEntry> MemoryStore::ClaimedEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClaimedEntry> out;
  out.reserve(claimed_.size());
  for (const auto& kv : claimed_) {
    out.push_back(kv.second);
  }
  return out;
}

std::vector<ExpiredEntry> MemoryStore::ExpiredEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExpiredEntry> out;
  out.reserve(expired_.size());
  for (const auto& kv : expired_) {
    out.push_back(kv.second);
  }
  return out;
}

std::size_t MemoryStore::RefreshTokenCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refresh_tokens_.size();
}

}  // namespace sendkey::server
