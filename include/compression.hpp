#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rgtp {

// LZ4 block compression of a single chunk. Returns false when the block
// would not shrink; the caller then sends the chunk uncompressed.
bool compress_chunk(const uint8_t* data, size_t len, std::vector<uint8_t>& out);

// Fails unless exactly `expected` bytes are produced.
bool decompress_chunk(const uint8_t* data, size_t len, size_t expected,
                      std::vector<uint8_t>& out);

} // namespace rgtp
