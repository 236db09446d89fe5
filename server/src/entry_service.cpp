#include "entry_service.h"

#include <cctype>
#include <utility>

#include "constant_time.h"
#include "hex_utils.h"
#include "monocypher.h"
#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "entries";

constexpr char kErrSenderRequired[] = "A sender ID is required.";
constexpr char kErrNameRequired[] = "A name is required.";
constexpr char kErrNameTooLong[] = "The name must be 100 characters or fewer.";
constexpr char kErrEmailRequired[] = "A send to email is required.";
constexpr char kErrEmailTooLong[] =
    "The send to email must be 100 characters or fewer.";
constexpr char kErrValueRequired[] = "A value is required.";
constexpr char kErrValueTooLong[] = "The value is too long.";
constexpr char kErrSecretRequired[] = "A secret is required.";
constexpr char kErrDurationInvalid[] = "Duration must be greater than 0.";
constexpr char kErrDurationTooLong[] = "Duration is too long.";

constexpr char kErrInvalidEntry[] = "Invalid entry ID.";
constexpr char kErrInvalidSecret[] = "Invalid secret.";
constexpr char kErrTooManyAttempts[] =
    "Too many attempts have been made, and the entry has been expired.";

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

// Counts UTF-8 code points; continuation bytes do not start a character.
std::size_t Utf8Length(const std::string& text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      count++;
    }
  }
  return count;
}

Timestamp FloorToSeconds(Timestamp t) {
  return FromUnixSeconds(ToUnixSeconds(t));
}

void WipeBytes(std::vector<std::uint8_t>& buf) {
  if (!buf.empty()) {
    crypto_wipe(buf.data(), buf.size());
  }
  buf.clear();
}

}  // namespace

EntryService::EntryService(EntryRepository* entries, EntryNotifier* notifier,
                           RandomSource* random,
                           std::vector<std::uint8_t> master_key,
                           std::int32_t max_attempts, NowFn now)
    : entries_(entries),
      notifier_(notifier),
      random_(random),
      cipher_(std::move(master_key)),
      max_attempts_(max_attempts < 1 ? 1 : max_attempts),
      now_(now ? std::move(now) : NowFn(SystemNow)) {}

bool EntryService::IsPastDeadline(const Entry& entry, Timestamp now) const {
  return now >= entry.expires_at;
}

bool EntryService::ExpireEntry(const Entry& entry, bool too_many_attempts,
                               bool& out_transitioned, std::string& error) {
  out_transitioned = false;
  ExpiredEntry expired;
  expired.entry_id = entry.id;
  expired.name = entry.name;
  expired.sent_by_user_id = entry.sent_by_user_id;
  expired.sent_to_email = entry.sent_to_email;
  expired.too_many_attempts = too_many_attempts;
  expired.expired_at = FloorToSeconds(now_());
  if (!entries_->RecordExpiry(expired, out_transitioned, error)) {
    return false;
  }
  if (out_transitioned) {
    const std::string id = entry.id.ToString();
    pl::Log(pl::Level::kDebug, kLogTag, "entry expired",
            {{"entry_id", id},
             {"reason", too_many_attempts ? "attempts" : "deadline"}});
  }
  return true;
}

bool EntryService::CreateEntry(const CreateEntryRequest& req,
                               CreateEntryResult& out, std::string& error) {
  error.clear();
  out = CreateEntryResult{};
  if (!entries_ || !random_) {
    error = "entry service not configured";
    return false;
  }

  const std::string email = Trim(req.send_to_email);
  const std::int64_t created_unix = ToUnixSeconds(now_());

  if (req.sender_id.IsNil()) {
    out.errors.emplace_back(kErrSenderRequired);
  }
  if (Trim(req.name).empty()) {
    out.errors.emplace_back(kErrNameRequired);
  } else if (Utf8Length(req.name) > kMaxNameChars) {
    out.errors.emplace_back(kErrNameTooLong);
  }
  if (email.empty()) {
    out.errors.emplace_back(kErrEmailRequired);
  } else if (Utf8Length(email) > kMaxEmailChars) {
    out.errors.emplace_back(kErrEmailTooLong);
  }
  if (Trim(req.value).empty()) {
    out.errors.emplace_back(kErrValueRequired);
  } else if (req.value.size() > kMaxPlainValueBytes) {
    out.errors.emplace_back(kErrValueTooLong);
  }
  if (Trim(req.secret).empty()) {
    out.errors.emplace_back(kErrSecretRequired);
  }
  if (req.duration.count() <= 0) {
    out.errors.emplace_back(kErrDurationInvalid);
  } else if (req.duration.count() > MaxDeadlineUnixSeconds() - created_unix) {
    out.errors.emplace_back(kErrDurationTooLong);
  }
  if (!out.errors.empty()) {
    return true;
  }

  Entry entry;
  if (!NewRandomUuid(*random_, entry.id)) {
    error = "entry id generation failed";
    return false;
  }
  if (!random_->Fill(entry.nonce.data(), entry.nonce.size())) {
    error = "entry nonce generation failed";
    return false;
  }
  entry.name = req.name;
  entry.sent_by_user_id = req.sender_id;
  entry.sent_to_email = email;
  entry.invalid_attempts = 0;
  entry.created_at = FromUnixSeconds(created_unix);
  entry.expires_at = FromUnixSeconds(created_unix + req.duration.count());

  std::vector<std::uint8_t> plain(req.value.begin(), req.value.end());
  const bool sealed =
      cipher_.Seal(req.secret, entry.nonce, plain, entry.value, error);
  WipeBytes(plain);
  if (!sealed) {
    return false;
  }

  if (!entries_->Create(entry, error)) {
    return false;
  }

  const std::string id = entry.id.ToString();
  if (notifier_) {
    std::string notify_err;
    if (!notifier_->SendEntry(entry, notify_err)) {
      pl::Log(pl::Level::kWarn, kLogTag, "entry notification failed",
              {{"entry_id", id}, {"error", notify_err}});
      std::string delete_err;
      if (!entries_->Delete(entry.id, delete_err)) {
        pl::Log(pl::Level::kError, kLogTag, "entry rollback failed",
                {{"entry_id", id}, {"error", delete_err}});
      }
      error = "entry notification failed: " + notify_err;
      return false;
    }
  }

  pl::Log(pl::Level::kDebug, kLogTag, "entry created", {{"entry_id", id}});
  out.success = true;
  out.entry = std::move(entry);
  return true;
}

bool EntryService::FindEntry(const Uuid& id, const std::string& nonce_hex,
                             std::optional<Entry>& out, std::string& error) {
  error.clear();
  out.reset();
  std::optional<Entry> found;
  if (!entries_->Find(id, found, error)) {
    return false;
  }
  if (!found) {
    return true;
  }
  if (IsPastDeadline(*found, now_())) {
    bool transitioned = false;
    return ExpireEntry(*found, false, transitioned, error);
  }

  std::vector<std::uint8_t> presented;
  if (!sendkey::common::HexToBytes(nonce_hex, presented)) {
    return true;
  }
  if (!sendkey::common::ConstantTimeEqual(presented.data(), presented.size(),
                                          found->nonce.data(),
                                          found->nonce.size())) {
    return true;
  }
  out = std::move(found);
  return true;
}

bool EntryService::ListByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                               std::string& error) {
  error.clear();
  out.clear();
  std::vector<Entry> owned;
  if (!entries_->FindByOwner(owner_id, owned, error)) {
    return false;
  }
  const Timestamp now = now_();
  out.reserve(owned.size());
  for (auto& entry : owned) {
    if (IsPastDeadline(entry, now)) {
      bool transitioned = false;
      if (!ExpireEntry(entry, false, transitioned, error)) {
        out.clear();
        return false;
      }
      continue;
    }
    out.push_back(std::move(entry));
  }
  return true;
}

bool EntryService::DecryptEntry(const DecryptEntryRequest& req,
                                DecryptEntryResult& out, std::string& error) {
  error.clear();
  out = DecryptEntryResult{};

  std::optional<Entry> entry;
  if (!FindEntry(req.id, req.nonce, entry, error)) {
    return false;
  }
  if (!entry) {
    out.errors.emplace_back(kErrInvalidEntry);
    return true;
  }

  const std::string id = entry->id.ToString();
  std::vector<std::uint8_t> plain;
  std::string open_err;
  if (!cipher_.Open(req.secret, entry->nonce, entry->value, plain,
                    open_err)) {
    out.errors.emplace_back(kErrInvalidSecret);
    bool found = false;
    std::int32_t count = 0;
    if (!entries_->IncrementInvalidAttempts(entry->id, found, count, error)) {
      return false;
    }
    pl::Log(pl::Level::kDebug, kLogTag, "invalid secret",
            {{"entry_id", id}, {"attempts", std::to_string(count)}});
    if (found && count >= max_attempts_) {
      bool transitioned = false;
      if (!ExpireEntry(*entry, true, transitioned, error)) {
        return false;
      }
      if (transitioned) {
        out.expired = true;
        out.errors.emplace_back(kErrTooManyAttempts);
      }
    }
    return true;
  }

  ClaimedEntry claimed;
  claimed.entry_id = entry->id;
  claimed.name = entry->name;
  claimed.sent_by_user_id = entry->sent_by_user_id;
  claimed.sent_to_email = entry->sent_to_email;
  claimed.claimed_at = FloorToSeconds(now_());
  bool transitioned = false;
  if (!entries_->RecordClaim(claimed, transitioned, error)) {
    WipeBytes(plain);
    return false;
  }
  if (!transitioned) {
    // Another caller moved the entry first.
    WipeBytes(plain);
    out.errors.emplace_back(kErrInvalidEntry);
    return true;
  }

  pl::Log(pl::Level::kDebug, kLogTag, "entry claimed", {{"entry_id", id}});
  out.value = std::string(plain.begin(), plain.end());
  WipeBytes(plain);
  entry->value.clear();
  out.entry = std::move(entry);
  out.success = true;
  return true;
}

bool EntryService::SweepExpired(std::size_t& out_count, std::string& error) {
  error.clear();
  out_count = 0;
  std::vector<Entry> expired;
  if (!entries_->FindExpired(now_(), expired, error)) {
    return false;
  }
  for (const auto& entry : expired) {
    bool transitioned = false;
    if (!ExpireEntry(entry, false, transitioned, error)) {
      return false;
    }
    if (transitioned) {
      out_count++;
    }
  }
  if (out_count > 0) {
    pl::Log(pl::Level::kInfo, kLogTag, "expired entries swept",
            {{"count", std::to_string(out_count)}});
  }
  return true;
}

}  // namespace sendkey::server
