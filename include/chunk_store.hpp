#pragma once
#include <cstdint>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace rgtp {

// One bit per chunk, bit (i % 8) of byte (i / 8).
class ChunkBitmap {
public:
    ChunkBitmap() = default;
    explicit ChunkBitmap(uint32_t chunk_count);

    // Rebuilds a bitmap from its byte form, as kept for a resumed pull.
    static ChunkBitmap from_bytes(uint32_t chunk_count, const std::vector<uint8_t>& bytes,
                                  std::error_code& ec);

    bool test(uint32_t index) const;
    // True when the bit was not set before.
    bool set(uint32_t index);
    void clear();

    uint32_t size() const { return chunk_count_; }
    uint32_t count() const { return set_count_; }
    bool full() const { return set_count_ == chunk_count_; }
    size_t byte_size() const { return bits_.size(); }
    const std::vector<uint8_t>& bytes() const { return bits_; }
    std::vector<uint32_t> missing() const;

private:
    uint32_t chunk_count_{0};
    uint32_t set_count_{0};
    std::vector<uint8_t> bits_;
};

// Flat payload buffer addressed by chunk index.
class ChunkStore {
public:
    ChunkStore() = default;
    // Zeroed buffer of manifest.total_size, filled by write_chunk.
    explicit ChunkStore(const Manifest& manifest);
    // Complete payload on the exposing side.
    ChunkStore(const Manifest& manifest, std::vector<uint8_t> payload);

    uint64_t chunk_offset(uint32_t index) const;
    uint32_t chunk_length(uint32_t index) const;
    const uint8_t* chunk_data(uint32_t index) const;

    void write_chunk(uint32_t index, const uint8_t* data, size_t len, std::error_code& ec);

    // Hands out the payload once every bit in `have` is set and the content
    // hash matches; on mismatch the buffer is dropped and nothing is returned.
    std::vector<uint8_t> reassemble(const ChunkBitmap& have, std::error_code& ec);

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release() { return std::move(data_); }
    const Manifest& manifest() const { return manifest_; }

private:
    Manifest manifest_{};
    std::vector<uint8_t> data_;
};

Manifest build_manifest(const std::vector<uint8_t>& payload, uint32_t chunk_size,
                        uint16_t exposure_mode, uint16_t priority);

std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t>& payload,
                                        uint32_t chunk_size);

std::vector<uint8_t> reassemble(const std::vector<std::vector<uint8_t>>& chunks,
                                const Manifest& manifest, std::error_code& ec);

} // namespace rgtp
