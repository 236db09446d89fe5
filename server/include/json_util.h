#ifndef SENDKEY_SERVER_JSON_UTIL_H
#define SENDKEY_SERVER_JSON_UTIL_H

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

#include "records.h"

namespace sendkey::server {

// Writes `value` as a quoted JSON string.
void WriteJsonEscaped(std::ostream& os, std::string_view value);

// 2006-01-02T15:04:05Z
std::string FormatRfc3339(Timestamp t);

struct FlatJsonValue {
  enum class Kind : std::uint8_t { kString, kNumber, kBool, kNull };

  Kind kind{Kind::kNull};
  // Decoded text for strings, the literal token for numbers.
  std::string text;
  bool boolean{false};

  // Integral numbers only.
  bool AsInt64(std::int64_t& out) const;
};

using FlatJsonObject = std::map<std::string, FlatJsonValue>;

// Parses one object whose members are scalars. Nested objects or arrays,
// duplicate keys and trailing data are rejected.
bool ParseFlatJsonObject(std::string_view text, FlatJsonObject& out,
                         std::string& error);

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_JSON_UTIL_H
