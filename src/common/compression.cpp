#include "compression.hpp"
#include <limits>
#include <lz4.h>

namespace rgtp {

bool compress_chunk(const uint8_t *data, size_t len,
                    std::vector<uint8_t> &out) {
  if (len == 0 || len > (size_t)LZ4_MAX_INPUT_SIZE)
    return false;
  int bound = LZ4_compressBound((int)len);
  out.resize((size_t)bound);
  int n = LZ4_compress_default((const char *)data, (char *)out.data(), (int)len,
                               bound);
  if (n <= 0 || (size_t)n >= len) {
    out.clear();
    return false;
  }
  out.resize((size_t)n);
  return true;
}

bool decompress_chunk(const uint8_t *data, size_t len, size_t expected,
                      std::vector<uint8_t> &out) {
  if (len > (size_t)std::numeric_limits<int>::max() ||
      expected > (size_t)std::numeric_limits<int>::max())
    return false;
  out.resize(expected);
  int n = LZ4_decompress_safe((const char *)data, (char *)out.data(), (int)len,
                              (int)expected);
  if (n < 0 || (size_t)n != expected) {
    out.clear();
    return false;
  }
  return true;
}

} // namespace rgtp
