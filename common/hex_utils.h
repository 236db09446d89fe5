#ifndef SENDKEY_HEX_UTILS_H
#define SENDKEY_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sendkey::common {

// Lowercase hex, two characters per byte.
std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& data);

// Accepts upper or lower case. Fails on odd length or a non-hex digit.
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);
bool HexToBytes(const std::string& hex, std::vector<std::uint8_t>& out);

}  // namespace sendkey::common

#endif  // SENDKEY_HEX_UTILS_H
