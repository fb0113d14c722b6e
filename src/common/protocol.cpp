#include "protocol.hpp"
#include "error.hpp"
#include <cstring>

namespace rgtp {

namespace {

void put_u16(uint8_t *p, uint16_t v) {
  p[0] = (uint8_t)(v >> 8);
  p[1] = (uint8_t)(v & 0xFF);
}

void put_u32(uint8_t *p, uint32_t v) {
  p[0] = (uint8_t)(v >> 24);
  p[1] = (uint8_t)(v >> 16);
  p[2] = (uint8_t)(v >> 8);
  p[3] = (uint8_t)(v & 0xFF);
}

void put_u64(uint8_t *p, uint64_t v) {
  put_u32(p, (uint32_t)(v >> 32));
  put_u32(p + 4, (uint32_t)(v & 0xFFFFFFFFu));
}

uint16_t get_u16(const uint8_t *p) { return (uint16_t)((p[0] << 8) | p[1]); }

uint32_t get_u32(const uint8_t *p) {
  return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
         ((uint32_t)p[2] << 8) | (uint32_t)p[3];
}

uint64_t get_u64(const uint8_t *p) {
  return ((uint64_t)get_u32(p) << 32) | (uint64_t)get_u32(p + 4);
}

uint32_t checksum_of(const ChecksumFunction &fn, const uint8_t *data,
                     size_t len) {
  return fn ? fn(data, len) : crc32(data, len);
}

} // namespace

RateMode Manifest::rate_mode() const {
  return (exposure_mode & 0xFF) == (uint16_t)RateMode::Fixed
             ? RateMode::Fixed
             : RateMode::Adaptive;
}

HashAlgorithm Manifest::hash_algorithm() const {
  uint8_t id = (uint8_t)((exposure_mode >> 8) & 0x0F);
  return id == (uint8_t)HashAlgorithm::Sha256 ? HashAlgorithm::Sha256
                                              : HashAlgorithm::Blake2b256;
}

bool Manifest::encrypted() const { return (exposure_mode & 0x1000) != 0; }

bool Manifest::compression() const { return (exposure_mode & 0x2000) != 0; }

bool operator==(const Manifest &a, const Manifest &b) {
  return a.total_size == b.total_size && a.chunk_count == b.chunk_count &&
         a.optimal_chunk_size == b.optimal_chunk_size &&
         a.exposure_mode == b.exposure_mode && a.priority == b.priority &&
         a.content_hash == b.content_hash;
}

bool operator!=(const Manifest &a, const Manifest &b) { return !(a == b); }

uint16_t make_exposure_mode(RateMode rate, HashAlgorithm hash, bool encrypted,
                            bool compression) {
  uint16_t mode = (uint16_t)rate;
  mode |= (uint16_t)(((uint16_t)hash & 0x0F) << 8);
  if (encrypted)
    mode |= 0x1000;
  if (compression)
    mode |= 0x2000;
  return mode;
}

uint64_t chunk_count_for(uint64_t total_size, uint32_t chunk_size) {
  if (chunk_size == 0 || total_size == 0)
    return 0;
  return total_size / chunk_size + (total_size % chunk_size != 0);
}

void encode_header(const Header &h, uint8_t *out) {
  out[0] = h.version;
  out[1] = h.type;
  put_u16(out + 2, h.flags);
  put_u32(out + 4, h.session_id);
  put_u32(out + 8, h.sequence);
  put_u32(out + 12, h.chunk_size);
  put_u32(out + 16, h.checksum);
}

Header decode_header(const uint8_t *data, size_t len, std::error_code &ec) {
  if (data == nullptr || len < kHeaderSize || data[0] != kVersion) {
    ec = make_error_code(errc::malformed_frame);
    return Header{};
  }
  Header h;
  h.version = data[0];
  h.type = data[1];
  h.flags = get_u16(data + 2);
  h.session_id = get_u32(data + 4);
  h.sequence = get_u32(data + 8);
  h.chunk_size = get_u32(data + 12);
  h.checksum = get_u32(data + 16);
  ec.clear();
  return h;
}

void encode_manifest(const Manifest &m, uint8_t *out) {
  put_u64(out, m.total_size);
  put_u32(out + 8, m.chunk_count);
  put_u32(out + 12, m.optimal_chunk_size);
  put_u16(out + 16, m.exposure_mode);
  put_u16(out + 18, m.priority);
  std::memcpy(out + 20, m.content_hash.data(), kHashSize);
}

Manifest decode_manifest(const uint8_t *data, size_t len,
                         std::error_code &ec) {
  if (data == nullptr || len < kManifestSize) {
    ec = make_error_code(errc::malformed_frame);
    return Manifest{};
  }
  Manifest m;
  m.total_size = get_u64(data);
  m.chunk_count = get_u32(data + 8);
  m.optimal_chunk_size = get_u32(data + 12);
  m.exposure_mode = get_u16(data + 16);
  m.priority = get_u16(data + 18);
  std::memcpy(m.content_hash.data(), data + 20, kHashSize);
  uint64_t expected = chunk_count_for(m.total_size, m.optimal_chunk_size);
  if ((m.total_size > 0 && m.optimal_chunk_size == 0) ||
      expected > UINT32_MAX || m.chunk_count != expected) {
    ec = make_error_code(errc::malformed_frame);
    return Manifest{};
  }
  ec.clear();
  return m;
}

std::vector<uint8_t> serialize_frame(Frame &f, const ChecksumFunction &checksum) {
  f.hdr.chunk_size = (uint32_t)f.payload.size();
  f.hdr.checksum = checksum_of(checksum, f.payload.data(), f.payload.size());
  std::vector<uint8_t> buf(kHeaderSize + f.payload.size());
  encode_header(f.hdr, buf.data());
  if (!f.payload.empty())
    std::memcpy(buf.data() + kHeaderSize, f.payload.data(), f.payload.size());
  return buf;
}

Frame parse_frame(const uint8_t *data, size_t len, std::error_code &ec) {
  Header h = decode_header(data, len, ec);
  if (ec)
    return Frame{};
  if (h.chunk_size != len - kHeaderSize) {
    ec = make_error_code(errc::malformed_frame);
    return Frame{};
  }
  Frame f;
  f.hdr = h;
  f.payload.assign(data + kHeaderSize, data + len);
  return f;
}

bool verify_checksum(const Frame &f, const ChecksumFunction &checksum) {
  return checksum_of(checksum, f.payload.data(), f.payload.size()) ==
         f.hdr.checksum;
}

std::vector<uint8_t> encode_pressure(uint32_t pressure) {
  std::vector<uint8_t> out(kPressureSize);
  put_u32(out.data(), pressure);
  return out;
}

uint32_t decode_pressure(const std::vector<uint8_t> &payload,
                         std::error_code &ec) {
  if (payload.size() != kPressureSize) {
    ec = make_error_code(errc::malformed_frame);
    return 0;
  }
  ec.clear();
  return get_u32(payload.data());
}

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

} // namespace rgtp
