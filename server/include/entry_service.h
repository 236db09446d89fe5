#ifndef SENDKEY_SERVER_ENTRY_SERVICE_H
#define SENDKEY_SERVER_ENTRY_SERVICE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "entry_cipher.h"
#include "entry_notifier.h"
#include "random_source.h"
#include "records.h"
#include "repositories.h"

namespace sendkey::server {

struct CreateEntryRequest {
  std::string name;
  Uuid sender_id;
  std::string send_to_email;
  std::string value;
  std::string secret;
  std::chrono::seconds duration{0};
};

struct CreateEntryResult {
  bool success{false};
  std::vector<std::string> errors;
  std::optional<Entry> entry;
};

struct DecryptEntryRequest {
  Uuid id;
  std::string nonce;  // hex
  std::string secret;
};

struct DecryptEntryResult {
  bool success{false};
  std::vector<std::string> errors;
  bool expired{false};
  // Metadata of the claimed entry; its value field is cleared.
  std::optional<Entry> entry;
  std::optional<std::string> value;
};

// Owns the Active -> Claimed / Expired state machine of secret entries.
// Holds no mutable state of its own; every transition goes through the
// repository, which makes each one atomic per entry.
//
// Methods return false only for infrastructure failures (store, RNG,
// notifier). Validation problems, unknown ids, nonce mismatches and wrong
// phrases are reported through the result structs.
class EntryService {
 public:
  EntryService(EntryRepository* entries, EntryNotifier* notifier,
               RandomSource* random, std::vector<std::uint8_t> master_key,
               std::int32_t max_attempts, NowFn now = SystemNow);

  bool CreateEntry(const CreateEntryRequest& req, CreateEntryResult& out,
                   std::string& error);

  // Unknown id, wrong nonce and an entry found past its deadline all give an
  // empty `out`. The last one also records the expiry.
  bool FindEntry(const Uuid& id, const std::string& nonce_hex,
                 std::optional<Entry>& out, std::string& error);

  // Oldest first. Entries found past their deadline are expired and left
  // out.
  bool ListByOwner(const Uuid& owner_id, std::vector<Entry>& out,
                   std::string& error);

  bool DecryptEntry(const DecryptEntryRequest& req, DecryptEntryResult& out,
                    std::string& error);

  // Expires every entry whose deadline has passed, for entries nobody looks
  // up again.
  bool SweepExpired(std::size_t& out_count, std::string& error);

  std::int32_t max_attempts() const { return max_attempts_; }

 private:
  bool ExpireEntry(const Entry& entry, bool too_many_attempts,
                   bool& out_transitioned, std::string& error);
  bool IsPastDeadline(const Entry& entry, Timestamp now) const;

  EntryRepository* entries_;
  EntryNotifier* notifier_;
  RandomSource* random_;
  EntryCipher cipher_;
  std::int32_t max_attempts_;
  NowFn now_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_ENTRY_SERVICE_H
