#ifndef SENDKEY_SERVER_UUID_H
#define SENDKEY_SERVER_UUID_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "random_source.h"

namespace sendkey::server {

struct Uuid {
  std::array<std::uint8_t, 16> bytes{};

  bool IsNil() const;
  // 8-4-4-4-12 lowercase form.
  std::string ToString() const;

  static bool Parse(std::string_view text, Uuid& out);
  static bool FromBytes(const std::uint8_t* data, std::size_t len, Uuid& out);
};

bool operator==(const Uuid& a, const Uuid& b);
bool operator!=(const Uuid& a, const Uuid& b);
bool operator<(const Uuid& a, const Uuid& b);

// Version 4 (random) identifier.
bool NewRandomUuid(RandomSource& random, Uuid& out);

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_UUID_H
