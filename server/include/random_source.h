#ifndef SENDKEY_SERVER_RANDOM_SOURCE_H
#define SENDKEY_SERVER_RANDOM_SOURCE_H

#include <cstddef>
#include <cstdint>

namespace sendkey::server {

// Entropy for nonces, identifiers, salts and refresh tokens. Owned by the
// application and handed to each component that needs it, so tests can
// substitute a deterministic source.
class RandomSource {
 public:
  virtual ~RandomSource() = default;
  virtual bool Fill(std::uint8_t* out, std::size_t len) = 0;
};

class OsRandomSource final : public RandomSource {
 public:
  bool Fill(std::uint8_t* out, std::size_t len) override;
};

}  // namespace sendkey::server

#endif  // SENDKEY_SERVER_RANDOM_SOURCE_H
