#ifndef SENDKEY_BASE64URL_H
#define SENDKEY_BASE64URL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sendkey::common {

// RFC 4648 section 5 alphabet, no padding (JWS compact form).
std::string Base64UrlEncode(const std::uint8_t* data, std::size_t len);
std::string Base64UrlEncode(std::string_view data);

// Rejects padding, characters outside the url-safe alphabet and a
// dangling single character.
bool Base64UrlDecode(std::string_view in, std::vector<std::uint8_t>& out);
bool Base64UrlDecode(std::string_view in, std::string& out);

}  // namespace sendkey::common

#endif  // SENDKEY_BASE64URL_H
