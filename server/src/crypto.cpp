#include "crypto.h"

#include <cstring>

namespace sendkey::server::crypto {

namespace {

constexpr std::uint32_t kInitState[8] = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};

constexpr std::uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1,
    0x923f82a4, 0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786,
    0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147,
    0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
    0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a,
    0x5b9cca4f, 0x682e6ff3, 0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2};

constexpr std::size_t kBlockSize = 64;

inline std::uint32_t RotR(std::uint32_t x, std::uint32_t n) {
  return (x >> n) | (x << (32U - n));
}

inline std::uint32_t LoadBe32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

inline void StoreBe32(std::uint8_t* p, std::uint32_t v) {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

}  // namespace

Sha256Context::Sha256Context() {
  std::memcpy(state_, kInitState, sizeof(state_));
  std::memset(buffer_, 0, sizeof(buffer_));
}

void Sha256Context::Compress(const std::uint8_t block[64]) {
  std::uint32_t w[64];
  for (int i = 0; i < 16; ++i) {
    w[i] = LoadBe32(block + i * 4);
  }
  for (int i = 16; i < 64; ++i) {
    const std::uint32_t s0 =
        RotR(w[i - 15], 7) ^ RotR(w[i - 15], 18) ^ (w[i - 15] >> 3);
    const std::uint32_t s1 =
        RotR(w[i - 2], 17) ^ RotR(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }

  std::uint32_t v[8];
  std::memcpy(v, state_, sizeof(v));
  for (int i = 0; i < 64; ++i) {
    const std::uint32_t e = v[4];
    const std::uint32_t a = v[0];
    const std::uint32_t ch = (e & v[5]) ^ (~e & v[6]);
    const std::uint32_t maj = (a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]);
    const std::uint32_t t1 = v[7] + (RotR(e, 6) ^ RotR(e, 11) ^ RotR(e, 25)) +
                             ch + kRound[i] + w[i];
    const std::uint32_t t2 = (RotR(a, 2) ^ RotR(a, 13) ^ RotR(a, 22)) + maj;
    v[7] = v[6];
    v[6] = v[5];
    v[5] = v[4];
    v[4] = v[3] + t1;
    v[3] = v[2];
    v[2] = v[1];
    v[1] = v[0];
    v[0] = t1 + t2;
  }
  for (int i = 0; i < 8; ++i) {
    state_[i] += v[i];
  }
}

void Sha256Context::Update(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  total_len_ += len;
  if (buffered_ > 0) {
    const std::size_t take =
        (kBlockSize - buffered_) < len ? (kBlockSize - buffered_) : len;
    std::memcpy(buffer_ + buffered_, data, take);
    buffered_ += take;
    data += take;
    len -= take;
    if (buffered_ < kBlockSize) {
      return;
    }
    Compress(buffer_);
    buffered_ = 0;
  }
  while (len >= kBlockSize) {
    Compress(data);
    data += kBlockSize;
    len -= kBlockSize;
  }
  if (len > 0) {
    std::memcpy(buffer_, data, len);
    buffered_ = len;
  }
}

void Sha256Context::Final(Sha256Digest& out) {
  const std::uint64_t bit_len = total_len_ * 8ULL;
  buffer_[buffered_++] = 0x80;
  if (buffered_ > 56) {
    std::memset(buffer_ + buffered_, 0, kBlockSize - buffered_);
    Compress(buffer_);
    buffered_ = 0;
  }
  std::memset(buffer_ + buffered_, 0, 56 - buffered_);
  StoreBe32(buffer_ + 56, static_cast<std::uint32_t>(bit_len >> 32));
  StoreBe32(buffer_ + 60, static_cast<std::uint32_t>(bit_len));
  Compress(buffer_);
  for (int i = 0; i < 8; ++i) {
    StoreBe32(out.bytes.data() + i * 4, state_[i]);
  }
  std::memset(buffer_, 0, sizeof(buffer_));
  buffered_ = 0;
}

void Sha256(const std::uint8_t* data, std::size_t len, Sha256Digest& out) {
  Sha256Context ctx;
  ctx.Update(data, len);
  ctx.Final(out);
}

void HmacSha256(const std::uint8_t* key, std::size_t key_len,
                const std::uint8_t* data, std::size_t data_len,
                Sha256Digest& out) {
  std::uint8_t key_block[kBlockSize];
  std::memset(key_block, 0, sizeof(key_block));
  if (key_len > kBlockSize) {
    Sha256Digest hashed_key;
    Sha256(key, key_len, hashed_key);
    std::memcpy(key_block, hashed_key.bytes.data(), hashed_key.bytes.size());
  } else if (key_len > 0) {
    std::memcpy(key_block, key, key_len);
  }

  std::uint8_t pad[kBlockSize];
  for (std::size_t i = 0; i < kBlockSize; ++i) {
    pad[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x36);
  }
  Sha256Digest inner;
  Sha256Context inner_ctx;
  inner_ctx.Update(pad, sizeof(pad));
  inner_ctx.Update(data, data_len);
  inner_ctx.Final(inner);

  for (std::size_t i = 0; i < kBlockSize; ++i) {
    pad[i] = static_cast<std::uint8_t>(key_block[i] ^ 0x5c);
  }
  Sha256Context outer_ctx;
  outer_ctx.Update(pad, sizeof(pad));
  outer_ctx.Update(inner.bytes.data(), inner.bytes.size());
  outer_ctx.Final(out);

  std::memset(key_block, 0, sizeof(key_block));
  std::memset(pad, 0, sizeof(pad));
}

}  // namespace sendkey::server::crypto
