#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "entry_cipher.h"
#include "test_support.h"

using sendkey::server::EntryCipher;
using sendkey::server::EntryKey;
using sendkey::server::EntryNonce;
using sendkey::server::kEntryTagBytes;
using sendkey::server::kMaxPlainValueBytes;
using sendkey::server::testing::DeterministicRandom;
using sendkey::server::testing::TestMasterKey;

int main() {
  EntryCipher cipher(TestMasterKey());
  DeterministicRandom random;

  // Key derivation depends only on the master key and the phrase.
  {
    EntryKey a{};
    EntryKey b{};
    EntryKey c{};
    cipher.DeriveKey("phrase", a);
    cipher.DeriveKey("phrase", b);
    cipher.DeriveKey("phrase2", c);
    assert(a == b);
    assert(a != c);

    EntryCipher other(std::vector<std::uint8_t>(32, 0x11));
    EntryKey d{};
    other.DeriveKey("phrase", d);
    assert(a != d);
  }

  // Round trip at the boundary sizes.
  for (const std::size_t size : {std::size_t{1}, std::size_t{17},
                                 kMaxPlainValueBytes}) {
    std::vector<std::uint8_t> plain(size);
    assert(random.Fill(plain.data(), plain.size()));
    EntryNonce nonce{};
    assert(random.Fill(nonce.data(), nonce.size()));

    std::vector<std::uint8_t> sealed;
    std::string err;
    assert(cipher.Seal("open sesame", nonce, plain, sealed, err));
    assert(sealed.size() == size + kEntryTagBytes);

    std::vector<std::uint8_t> opened;
    assert(cipher.Open("open sesame", nonce, sealed, opened, err));
    assert(opened == plain);
  }

  {
    const std::string text = "the launch code";
    const std::vector<std::uint8_t> plain(text.begin(), text.end());
    EntryNonce nonce{};
    assert(random.Fill(nonce.data(), nonce.size()));
    std::vector<std::uint8_t> sealed;
    std::string err;
    assert(cipher.Seal("right", nonce, plain, sealed, err));

    std::vector<std::uint8_t> opened;
    std::string wrong_err;
    assert(!cipher.Open("wrong", nonce, sealed, opened, wrong_err));
    assert(opened.empty());

    // Tampering fails the same way as a wrong phrase.
    std::vector<std::uint8_t> tampered = sealed;
    tampered[0] ^= 0x01;
    std::string tamper_err;
    assert(!cipher.Open("right", nonce, tampered, opened, tamper_err));
    assert(tamper_err == wrong_err);

    EntryNonce other_nonce = nonce;
    other_nonce[11] ^= 0x80;
    assert(!cipher.Open("right", other_nonce, sealed, opened, err));

    std::vector<std::uint8_t> short_value(kEntryTagBytes);
    assert(!cipher.Open("right", nonce, short_value, opened, err));
  }

  {
    std::vector<std::uint8_t> sealed;
    std::string err;
    EntryNonce nonce{};
    assert(!cipher.Seal("phrase", nonce, {}, sealed, err));
    assert(!err.empty());
  }

  return 0;
}
