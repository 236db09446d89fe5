#ifndef SENDKEY_CONSTANT_TIME_H
#define SENDKEY_CONSTANT_TIME_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sendkey::common {

inline bool ConstantTimeEqual(std::string_view a, std::string_view b) {
  const std::size_t max_len = a.size() > b.size() ? a.size() : b.size();
  std::size_t diff = a.size() ^ b.size();
  for (std::size_t i = 0; i < max_len; ++i) {
    const std::uint8_t ac =
        i < a.size() ? static_cast<std::uint8_t>(a[i]) : 0;
    const std::uint8_t bc =
        i < b.size() ? static_cast<std::uint8_t>(b[i]) : 0;
    diff |= static_cast<std::size_t>(ac ^ bc);
  }
  return diff == 0;
}

// Length is not secret here; only the contents are compared in constant time.
inline bool ConstantTimeEqual(const std::uint8_t* a, std::size_t a_len,
                              const std::uint8_t* b, std::size_t b_len) {
  if (a_len != b_len || !a || !b) {
    return false;
  }
  std::uint8_t acc = 0;
  for (std::size_t i = 0; i < a_len; ++i) {
    acc |= static_cast<std::uint8_t>(a[i] ^ b[i]);
  }
  return acc == 0;
}

}  // namespace sendkey::common

#endif  // SENDKEY_CONSTANT_TIME_H
