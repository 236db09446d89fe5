#ifndef SENDKEY_SERVER_ENTRY_NOTIFIER_H
#define SENDKEY_SERVER_ENTRY_NOTIFIER_H

#include <string>

#include "records.h"

namespace sendkey::server {

// Delivers the entry link (id + nonce) to its recipient.
class EntryNotifier {
 public:
  virtual ~EntryNotifier() = default;
  virtual bool SendEntry(const Entry& entry, std::string& error) = 0;
};

// No mail transport is wired in yet; records the delivery request in the
// log without the nonce.
class LogEntryNotifier final : public EntryNotifier {
 public:
  bool SendEntry(const Entry& entry, std::string& error) override;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_ENTRY_NOTIFIER_H
