#include "records.h"

namespace sendkey::server {

Timestamp SystemNow() { return std::chrono::system_clock::now(); }

std::int64_t ToUnixSeconds(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch())
      .count();
}

Timestamp FromUnixSeconds(std::int64_t seconds) {
  return Timestamp(std::chrono::seconds(seconds));
}

std::int64_t MaxDeadlineUnixSeconds() {
  const std::int64_t clock_max =
      std::chrono::duration_cast<std::chrono::seconds>(
          Timestamp::max().time_since_epoch())
          .count();
  return clock_max < kMaxStoredUnixSeconds ? clock_max : kMaxStoredUnixSeconds;
}

}  // namespace sendkey::server
