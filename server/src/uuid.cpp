#include "uuid.h"

#include <algorithm>
#include <cstring>
#include <vector>

#include "hex_utils.h"

namespace sendkey::server {

namespace {

constexpr std::size_t kDashPositions[] = {8, 13, 18, 23};

}  // namespace

bool Uuid::IsNil() const {
  return std::all_of(bytes.begin(), bytes.end(),
                     [](std::uint8_t b) { return b == 0; });
}

std::string Uuid::ToString() const {
  const std::string hex = common::BytesToHex(bytes.data(), bytes.size());
  std::string out;
  out.reserve(36);
  out.append(hex, 0, 8);
  out.push_back('-');
  out.append(hex, 8, 4);
  out.push_back('-');
  out.append(hex, 12, 4);
  out.push_back('-');
  out.append(hex, 16, 4);
  out.push_back('-');
  out.append(hex, 20, 12);
  return out;
}

bool Uuid::Parse(std::string_view text, Uuid& out) {
  out = Uuid{};
  if (text.size() != 36) {
    return false;
  }
  std::string hex;
  hex.reserve(32);
  for (std::size_t i = 0; i < text.size(); ++i) {
    const bool dash_slot =
        std::find(std::begin(kDashPositions), std::end(kDashPositions), i) !=
        std::end(kDashPositions);
    if (dash_slot) {
      if (text[i] != '-') {
        return false;
      }
      continue;
    }
    hex.push_back(text[i]);
  }
  std::vector<std::uint8_t> raw;
  if (!common::HexToBytes(hex, raw) || raw.size() != out.bytes.size()) {
    return false;
  }
  std::copy(raw.begin(), raw.end(), out.bytes.begin());
  return true;
}

bool Uuid::FromBytes(const std::uint8_t* data, std::size_t len, Uuid& out) {
  out = Uuid{};
  if (!data || len != out.bytes.size()) {
    return false;
  }
  std::memcpy(out.bytes.data(), data, len);
  return true;
}

bool operator==(const Uuid& a, const Uuid& b) { return a.bytes == b.bytes; }

bool operator!=(const Uuid& a, const Uuid& b) { return !(a == b); }

bool operator<(const Uuid& a, const Uuid& b) { return a.bytes < b.bytes; }

bool NewRandomUuid(RandomSource& random, Uuid& out) {
  out = Uuid{};
  if (!random.Fill(out.bytes.data(), out.bytes.size())) {
    return false;
  }
  out.bytes[6] = static_cast<std::uint8_t>((out.bytes[6] & 0x0F) | 0x40);
  out.bytes[8] = static_cast<std::uint8_t>((out.bytes[8] & 0x3F) | 0x80);
  return true;
}

}  // namespace sendkey::server
