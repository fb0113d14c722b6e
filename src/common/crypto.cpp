#include "crypto.hpp"
#include <cstring>
#include <sodium.h>

namespace rgtp {

static_assert(sizeof(ChunkNonce) == crypto_aead_xchacha20poly1305_ietf_NPUBBYTES,
              "nonce size");

ChunkNonce chunk_nonce(uint32_t session_id, uint32_t chunk_index) {
  // seed is big-endian on every host
  uint8_t buf[8];
  for (int i = 0; i < 4; i++) {
    buf[i] = (uint8_t)(session_id >> (24 - 8 * i));
    buf[4 + i] = (uint8_t)(chunk_index >> (24 - 8 * i));
  }
  ChunkNonce nonce;
  crypto_generichash(nonce.data(), nonce.size(), buf, sizeof(buf), nullptr, 0);
  return nonce;
}

SodiumAead::SodiumAead() : key_(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0) {}

void SodiumAead::set_key(const std::vector<uint8_t> &key) {
  key_.assign(crypto_aead_xchacha20poly1305_ietf_KEYBYTES, 0);
  if (key.size() == crypto_aead_xchacha20poly1305_ietf_KEYBYTES)
    key_ = key;
  else if (!key.empty())
    crypto_generichash(key_.data(), key_.size(), key.data(), key.size(),
                       nullptr, 0);
}

bool SodiumAead::encrypt(uint32_t session_id, uint32_t chunk_index,
                         std::vector<uint8_t> &inout) {
  ChunkNonce nonce = chunk_nonce(session_id, chunk_index);
  size_t clen = inout.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES;
  std::vector<uint8_t> out(clen);
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt(
          out.data(), &outlen, inout.data(), inout.size(), nullptr, 0, nullptr,
          nonce.data(), key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

bool SodiumAead::decrypt(uint32_t session_id, uint32_t chunk_index,
                         std::vector<uint8_t> &inout) {
  if (inout.size() < crypto_aead_xchacha20poly1305_ietf_ABYTES)
    return false;
  ChunkNonce nonce = chunk_nonce(session_id, chunk_index);
  std::vector<uint8_t> out(inout.size());
  unsigned long long outlen = 0;
  if (crypto_aead_xchacha20poly1305_ietf_decrypt(
          out.data(), &outlen, nullptr, inout.data(), inout.size(), nullptr, 0,
          nonce.data(), key_.data()) != 0)
    return false;
  out.resize((size_t)outlen);
  inout.swap(out);
  return true;
}

size_t SodiumAead::overhead() const {
  return crypto_aead_xchacha20poly1305_ietf_ABYTES;
}

ContentHash content_hash(HashAlgorithm algo, const uint8_t *data, size_t len) {
  static const uint8_t empty = 0;
  if (data == nullptr)
    data = &empty;
  ContentHash out{};
  if (algo == HashAlgorithm::Sha256)
    crypto_hash_sha256(out.data(), data, (unsigned long long)len);
  else
    crypto_generichash(out.data(), out.size(), data, (unsigned long long)len,
                       nullptr, 0);
  return out;
}

uint32_t random_session_id() {
  uint32_t id = 0;
  while (id == 0)
    id = randombytes_random();
  return id;
}

} // namespace rgtp
