#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "base64url.h"
#include "constant_time.h"
#include "hex_utils.h"
#include "test_support.h"
#include "uuid.h"

using sendkey::common::Base64UrlDecode;
using sendkey::common::Base64UrlEncode;
using sendkey::common::BytesToHex;
using sendkey::common::ConstantTimeEqual;
using sendkey::common::HexToBytes;
using sendkey::server::NewRandomUuid;
using sendkey::server::Uuid;

int main() {
  {
    const std::vector<std::uint8_t> raw = {0x00, 0xab, 0xff};
    assert(BytesToHex(raw) == "00abff");
    std::vector<std::uint8_t> back;
    assert(HexToBytes(std::string("00ABff"), back));
    assert(back == raw);
    assert(!HexToBytes(std::string("abc"), back));
    assert(!HexToBytes(std::string("zz"), back));
  }

  {
    assert(Base64UrlEncode(std::string_view("")).empty());
    assert(Base64UrlEncode(std::string_view("f")) == "Zg");
    assert(Base64UrlEncode(std::string_view("fo")) == "Zm8");
    assert(Base64UrlEncode(std::string_view("foo")) == "Zm9v");
    assert(Base64UrlEncode(std::string_view("foobar")) == "Zm9vYmFy");
    const std::uint8_t url_chars[] = {0xfb, 0xff};
    assert(Base64UrlEncode(url_chars, sizeof(url_chars)) == "-_8");

    std::string text;
    assert(Base64UrlDecode("Zm9vYmE", text) && text == "fooba");
    std::vector<std::uint8_t> bytes;
    assert(Base64UrlDecode("-_8", bytes));
    assert(bytes.size() == 2 && bytes[0] == 0xfb && bytes[1] == 0xff);
    assert(!Base64UrlDecode("Zg==", text));
    assert(!Base64UrlDecode("Zm9vY", text));
    assert(!Base64UrlDecode("Zm9v+", text));
  }

  {
    Uuid id;
    assert(Uuid::Parse("123e4567-e89b-12d3-a456-426614174000", id));
    assert(id.ToString() == "123e4567-e89b-12d3-a456-426614174000");
    assert(!id.IsNil());
    Uuid upper;
    assert(Uuid::Parse("123E4567-E89B-12D3-A456-426614174000", upper));
    assert(upper == id);
    assert(!Uuid::Parse("123e4567e89b12d3a456426614174000", id));
    assert(!Uuid::Parse("123e4567-e89b-12d3-a456-42661417400g", id));
    assert(Uuid{}.IsNil());

    sendkey::server::testing::DeterministicRandom random;
    Uuid a;
    Uuid b;
    assert(NewRandomUuid(random, a));
    assert(NewRandomUuid(random, b));
    assert(a != b);
    assert((a.bytes[6] & 0xF0) == 0x40);
    assert((a.bytes[8] & 0xC0) == 0x80);

    sendkey::server::testing::FailingRandom failing;
    assert(!NewRandomUuid(failing, a));
  }

  {
    assert(ConstantTimeEqual("nonce", "nonce"));
    assert(!ConstantTimeEqual("nonce", "nonce!"));
    assert(!ConstantTimeEqual("nonce", "nonCe"));
    const std::uint8_t x[] = {1, 2, 3};
    const std::uint8_t y[] = {1, 2, 4};
    assert(ConstantTimeEqual(x, 3, x, 3));
    assert(!ConstantTimeEqual(x, 3, y, 3));
    assert(!ConstantTimeEqual(x, 3, x, 2));
  }

  return 0;
}
