#ifndef SENDKEY_SERVER_ENTRY_CIPHER_H
#define SENDKEY_SERVER_ENTRY_CIPHER_H

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "records.h"

namespace sendkey::server {

using EntryKey = std::array<std::uint8_t, 32>;

// Seals entry values under SHA-256(master_key || secret_phrase) with
// ChaCha20-Poly1305 (IETF, 96-bit nonce) and no associated data. The
// sealed form is ciphertext || 16-byte tag.
class EntryCipher {
 public:
  explicit EntryCipher(std::vector<std::uint8_t> master_key);
  ~EntryCipher();

  EntryCipher(const EntryCipher&) = delete;
  EntryCipher& operator=(const EntryCipher&) = delete;

  void DeriveKey(std::string_view secret_phrase, EntryKey& out_key) const;

  bool Seal(std::string_view secret_phrase, const EntryNonce& nonce,
            const std::vector<std::uint8_t>& plain,
            std::vector<std::uint8_t>& out, std::string& error) const;

  // Fails identically for a wrong phrase and for a damaged value.
  bool Open(std::string_view secret_phrase, const EntryNonce& nonce,
            const std::vector<std::uint8_t>& sealed,
            std::vector<std::uint8_t>& out, std::string& error) const;

 private:
  std::vector<std::uint8_t> master_key_;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_ENTRY_CIPHER_H
