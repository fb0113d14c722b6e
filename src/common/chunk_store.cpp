#include "chunk_store.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include <algorithm>
#include <cstring>

namespace rgtp {

static uint8_t popcount8(uint8_t v) {
  uint8_t n = 0;
  while (v) {
    v &= (uint8_t)(v - 1);
    n++;
  }
  return n;
}

ChunkBitmap::ChunkBitmap(uint32_t chunk_count)
    : chunk_count_(chunk_count), bits_((chunk_count + 7) / 8, 0) {}

ChunkBitmap ChunkBitmap::from_bytes(uint32_t chunk_count,
                                    const std::vector<uint8_t> &bytes,
                                    std::error_code &ec) {
  ChunkBitmap bm(chunk_count);
  if (bytes.size() != bm.bits_.size()) {
    ec = make_error_code(errc::invalid_argument);
    return ChunkBitmap{};
  }
  bm.bits_ = bytes;
  // bits past chunk_count are padding
  if (chunk_count % 8 != 0 && !bm.bits_.empty())
    bm.bits_.back() &= (uint8_t)((1u << (chunk_count % 8)) - 1);
  for (uint8_t b : bm.bits_)
    bm.set_count_ += popcount8(b);
  ec.clear();
  return bm;
}

bool ChunkBitmap::test(uint32_t index) const {
  if (index >= chunk_count_)
    return false;
  return (bits_[index / 8] & (1u << (index % 8))) != 0;
}

bool ChunkBitmap::set(uint32_t index) {
  if (index >= chunk_count_ || test(index))
    return false;
  bits_[index / 8] |= (uint8_t)(1u << (index % 8));
  set_count_++;
  return true;
}

void ChunkBitmap::clear() {
  std::fill(bits_.begin(), bits_.end(), 0);
  set_count_ = 0;
}

std::vector<uint32_t> ChunkBitmap::missing() const {
  std::vector<uint32_t> out;
  out.reserve(chunk_count_ - set_count_);
  for (uint32_t i = 0; i < chunk_count_; i++)
    if (!test(i))
      out.push_back(i);
  return out;
}

ChunkStore::ChunkStore(const Manifest &manifest)
    : manifest_(manifest), data_((size_t)manifest.total_size, 0) {}

ChunkStore::ChunkStore(const Manifest &manifest, std::vector<uint8_t> payload)
    : manifest_(manifest), data_(std::move(payload)) {
  data_.resize((size_t)manifest.total_size);
}

uint64_t ChunkStore::chunk_offset(uint32_t index) const {
  return (uint64_t)index * manifest_.optimal_chunk_size;
}

uint32_t ChunkStore::chunk_length(uint32_t index) const {
  if (index >= manifest_.chunk_count)
    return 0;
  uint64_t start = chunk_offset(index);
  uint64_t end = std::min<uint64_t>(start + manifest_.optimal_chunk_size,
                                    manifest_.total_size);
  return (uint32_t)(end - start);
}

const uint8_t *ChunkStore::chunk_data(uint32_t index) const {
  if (index >= manifest_.chunk_count)
    return nullptr;
  return data_.data() + chunk_offset(index);
}

void ChunkStore::write_chunk(uint32_t index, const uint8_t *data, size_t len,
                             std::error_code &ec) {
  if (index >= manifest_.chunk_count || len != chunk_length(index)) {
    ec = make_error_code(errc::malformed_frame);
    return;
  }
  std::memcpy(data_.data() + chunk_offset(index), data, len);
  ec.clear();
}

std::vector<uint8_t> ChunkStore::reassemble(const ChunkBitmap &have,
                                            std::error_code &ec) {
  if (have.size() != manifest_.chunk_count || !have.full()) {
    ec = make_error_code(errc::pull_failure);
    return {};
  }
  ContentHash h =
      content_hash(manifest_.hash_algorithm(), data_.data(), data_.size());
  if (h != manifest_.content_hash) {
    data_.assign((size_t)manifest_.total_size, 0);
    ec = make_error_code(errc::checksum_mismatch);
    return {};
  }
  ec.clear();
  return std::move(data_);
}

Manifest build_manifest(const std::vector<uint8_t> &payload,
                        uint32_t chunk_size, uint16_t exposure_mode,
                        uint16_t priority) {
  Manifest m;
  m.total_size = payload.size();
  m.optimal_chunk_size = chunk_size;
  m.chunk_count = (uint32_t)chunk_count_for(m.total_size, chunk_size);
  m.exposure_mode = exposure_mode;
  m.priority = priority;
  m.content_hash =
      content_hash(m.hash_algorithm(), payload.data(), payload.size());
  return m;
}

std::vector<std::vector<uint8_t>> split(const std::vector<uint8_t> &payload,
                                        uint32_t chunk_size) {
  std::vector<std::vector<uint8_t>> chunks;
  if (chunk_size == 0)
    return chunks;
  chunks.reserve(chunk_count_for(payload.size(), chunk_size));
  size_t offset = 0;
  while (offset < payload.size()) {
    size_t n = std::min<size_t>(chunk_size, payload.size() - offset);
    chunks.emplace_back(payload.begin() + offset, payload.begin() + offset + n);
    offset += n;
  }
  return chunks;
}

std::vector<uint8_t> reassemble(const std::vector<std::vector<uint8_t>> &chunks,
                                const Manifest &manifest, std::error_code &ec) {
  if (chunks.size() != manifest.chunk_count) {
    ec = make_error_code(errc::pull_failure);
    return {};
  }
  ChunkStore store(manifest);
  ChunkBitmap have(manifest.chunk_count);
  for (uint32_t i = 0; i < manifest.chunk_count; i++) {
    store.write_chunk(i, chunks[i].data(), chunks[i].size(), ec);
    if (ec)
      return {};
    have.set(i);
  }
  return store.reassemble(have, ec);
}

} // namespace rgtp
