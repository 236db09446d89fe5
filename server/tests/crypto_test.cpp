#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "crypto.h"
#include "hex_utils.h"

using sendkey::server::crypto::HmacSha256;
using sendkey::server::crypto::Sha256;
using sendkey::server::crypto::Sha256Context;
using sendkey::server::crypto::Sha256Digest;

namespace {

std::string ToHex(const Sha256Digest& digest) {
  return sendkey::common::BytesToHex(digest.bytes.data(), digest.bytes.size());
}

void ExpectSha256(const std::string& input, const std::string& expected_hex) {
  Sha256Digest digest;
  Sha256(reinterpret_cast<const std::uint8_t*>(input.data()), input.size(),
         digest);
  assert(ToHex(digest) == expected_hex);
}

void ExpectHmacSha256(const std::string& key, const std::string& message,
                      const std::string& expected_hex) {
  Sha256Digest digest;
  HmacSha256(reinterpret_cast<const std::uint8_t*>(key.data()), key.size(),
             reinterpret_cast<const std::uint8_t*>(message.data()),
             message.size(), digest);
  assert(ToHex(digest) == expected_hex);
}

}  // namespace

int main() {
  ExpectSha256(
      "",
      "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  ExpectSha256(
      "abc",
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  ExpectSha256(
      "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq",
      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

  // Feeding the same input in uneven pieces gives the one-shot digest.
  {
    const std::string input(200, 'x');
    Sha256Digest whole;
    Sha256(reinterpret_cast<const std::uint8_t*>(input.data()), input.size(),
           whole);
    Sha256Context ctx;
    const auto* p = reinterpret_cast<const std::uint8_t*>(input.data());
    ctx.Update(p, 1);
    ctx.Update(p + 1, 63);
    ctx.Update(p + 64, 0);
    ctx.Update(p + 64, 136);
    Sha256Digest pieces;
    ctx.Final(pieces);
    assert(whole.bytes == pieces.bytes);
  }

  ExpectHmacSha256(
      "key", "The quick brown fox jumps over the lazy dog",
      "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
  ExpectHmacSha256(
      "Jefe", "what do ya want for nothing?",
      "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

  return 0;
}
