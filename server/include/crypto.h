#ifndef SENDKEY_SERVER_CRYPTO_H
#define SENDKEY_SERVER_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace sendkey::server::crypto {

struct Sha256Digest {
  std::array<std::uint8_t, 32> bytes{};
};

// Incremental SHA-256 (FIPS 180-4).
class Sha256Context {
 public:
  Sha256Context();

  void Update(const std::uint8_t* data, std::size_t len);
  void Final(Sha256Digest& out);

 private:
  void Compress(const std::uint8_t block[64]);

  std::uint32_t state_[8];
  std::uint8_t buffer_[64];
  std::size_t buffered_{0};
  std::uint64_t total_len_{0};
};

void Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out);

void HmacSha256(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha256Digest& out);

}  // namespace sendkey::server::crypto

#endif  // SENDKEY_SERVER_CRYPTO_H
