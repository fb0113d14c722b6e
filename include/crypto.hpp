#pragma once
#include <array>
#include <cstdint>
#include <vector>
#include "protocol.hpp"

namespace rgtp {

class CryptoProvider {
public:
    virtual ~CryptoProvider() = default;
    virtual void set_key(const std::vector<uint8_t>& key) = 0;
    virtual bool encrypt(uint32_t session_id, uint32_t chunk_index,
                         std::vector<uint8_t>& inout) = 0;
    virtual bool decrypt(uint32_t session_id, uint32_t chunk_index,
                         std::vector<uint8_t>& inout) = 0;
    // Bytes added to a sealed chunk.
    virtual size_t overhead() const = 0;
};

// XChaCha20-Poly1305, nonce bound to (session, chunk index).
class SodiumAead : public CryptoProvider {
public:
    SodiumAead();
    void set_key(const std::vector<uint8_t>& key) override;
    bool encrypt(uint32_t session_id, uint32_t chunk_index,
                 std::vector<uint8_t>& inout) override;
    bool decrypt(uint32_t session_id, uint32_t chunk_index,
                 std::vector<uint8_t>& inout) override;
    size_t overhead() const override;
private:
    std::vector<uint8_t> key_;
};

using ChunkNonce = std::array<uint8_t, 24>;

// BLAKE2b-192 of the big-endian (session id, chunk index) pair.
ChunkNonce chunk_nonce(uint32_t session_id, uint32_t chunk_index);

ContentHash content_hash(HashAlgorithm algo, const uint8_t* data, size_t len);

// Non-zero random identifier for a new exposure.
uint32_t random_session_id();

} // namespace rgtp
