#include "entry_notifier.h"

#include "platform_log.h"

namespace sendkey::server {

namespace {

namespace pl = sendkey::platform::log;

constexpr char kLogTag[] = "notify";

}  // namespace

bool LogEntryNotifier::SendEntry(const Entry& entry, std::string& error) {
  error.clear();
  const std::string id = entry.id.ToString();
  pl::Log(pl::Level::kInfo, kLogTag, "entry ready for delivery",
          {{"entry_id", id}});
  pl::Log(pl::Level::kDebug, kLogTag, "delivery recipient",
          {{"entry_id", id}, {"recipient", entry.sent_to_email}});
  return true;
}

}  // namespace sendkey::server
