#include "entry_cipher.h"

#include <cstring>
#include <utility>

#include "crypto.h"
#include "monocypher.h"

namespace sendkey::server {

EntryCipher::EntryCipher(std::vector<std::uint8_t> master_key)
    : master_key_(std::move(master_key)) {}

EntryCipher::~EntryCipher() {
  if (!master_key_.empty()) {
    crypto_wipe(master_key_.data(), master_key_.size());
  }
}

void EntryCipher::DeriveKey(std::string_view secret_phrase,
                            EntryKey& out_key) const {
  crypto::Sha256Context ctx;
  ctx.Update(master_key_.data(), master_key_.size());
  ctx.Update(reinterpret_cast<const std::uint8_t*>(secret_phrase.data()),
             secret_phrase.size());
  crypto::Sha256Digest digest;
  ctx.Final(digest);
  out_key = digest.bytes;
  crypto_wipe(digest.bytes.data(), digest.bytes.size());
}

bool EntryCipher::Seal(std::string_view secret_phrase, const EntryNonce& nonce,
                       const std::vector<std::uint8_t>& plain,
                       std::vector<std::uint8_t>& out,
                       std::string& error) const {
  error.clear();
  out.clear();
  if (plain.empty()) {
    error = "entry value empty";
    return false;
  }
  EntryKey key{};
  DeriveKey(secret_phrase, key);

  out.resize(plain.size() + kEntryTagBytes);
  crypto_aead_ctx ctx;
  crypto_aead_init_ietf(&ctx, key.data(), nonce.data());
  crypto_aead_write(&ctx, out.data(), out.data() + plain.size(), nullptr, 0,
                    plain.data(), plain.size());
  crypto_wipe(&ctx, sizeof(ctx));
  crypto_wipe(key.data(), key.size());
  return true;
}

bool EntryCipher::Open(std::string_view secret_phrase, const EntryNonce& nonce,
                       const std::vector<std::uint8_t>& sealed,
                       std::vector<std::uint8_t>& out,
                       std::string& error) const {
  error.clear();
  out.clear();
  if (sealed.size() <= kEntryTagBytes) {
    error = "entry value decrypt failed";
    return false;
  }
  EntryKey key{};
  DeriveKey(secret_phrase, key);

  const std::size_t text_len = sealed.size() - kEntryTagBytes;
  out.resize(text_len);
  crypto_aead_ctx ctx;
  crypto_aead_init_ietf(&ctx, key.data(), nonce.data());
  const int rc = crypto_aead_read(&ctx, out.data(), sealed.data() + text_len,
                                  nullptr, 0, sealed.data(), text_len);
  crypto_wipe(&ctx, sizeof(ctx));
  crypto_wipe(key.data(), key.size());
  if (rc != 0) {
    out.clear();
    error = "entry value decrypt failed";
    return false;
  }
  return true;
}

}  // namespace sendkey::server
