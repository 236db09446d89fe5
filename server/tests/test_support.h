#ifndef SENDKEY_SERVER_TESTS_TEST_SUPPORT_H
#define SENDKEY_SERVER_TESTS_TEST_SUPPORT_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include "crypto.h"
#include "random_source.h"
#include "records.h"

namespace sendkey::server::testing {

// SHA-256 counter stream: reproducible, and never repeats within a run.
class DeterministicRandom final : public RandomSource {
 public:
  explicit DeterministicRandom(std::uint64_t seed = 1) : seed_(seed) {}

  bool Fill(std::uint8_t* out, std::size_t len) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t off = 0;
    while (off < len) {
      std::uint8_t block[16];
      for (int i = 0; i < 8; ++i) {
        block[i] = static_cast<std::uint8_t>(seed_ >> (8 * i));
        block[8 + i] = static_cast<std::uint8_t>(counter_ >> (8 * i));
      }
      counter_++;
      crypto::Sha256Digest d;
      crypto::Sha256(block, sizeof(block), d);
      const std::size_t take = std::min(len - off, d.bytes.size());
      std::memcpy(out + off, d.bytes.data(), take);
      off += take;
    }
    return true;
  }

 private:
  std::mutex mutex_;
  std::uint64_t seed_;
  std::uint64_t counter_{0};
};

class FailingRandom final : public RandomSource {
 public:
  bool Fill(std::uint8_t*, std::size_t) override { return false; }
};

class ManualClock {
 public:
  explicit ManualClock(std::int64_t unix_seconds = 1700000000)
      : now_(FromUnixSeconds(unix_seconds)) {}

  Timestamp Now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }
  void Advance(std::chrono::seconds by) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += by;
  }
  NowFn Fn() {
    return [this] { return Now(); };
  }

 private:
  mutable std::mutex mutex_;
  Timestamp now_;
};

inline std::vector<std::uint8_t> TestMasterKey() {
  std::vector<std::uint8_t> key(32);
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0xA0 + i);
  }
  return key;
}

inline bool HasError(const std::vector<std::string>& errors,
                     const std::string& message) {
  return std::find(errors.begin(), errors.end(), message) != errors.end();
}

}  // namespace sendkey::server::testing

#endif  // SENDKEY_SERVER_TESTS_TEST_SUPPORT_H
