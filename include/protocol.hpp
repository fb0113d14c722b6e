#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <system_error>
#include <vector>

namespace rgtp {

constexpr uint8_t  kVersion = 1;
constexpr size_t   kHeaderSize = 20;
constexpr size_t   kManifestSize = 52;
constexpr size_t   kHashSize = 32;
constexpr size_t   kPressureSize = 4;
constexpr uint16_t kDefaultPriority = 100;

enum class PacketType : uint8_t {
    ExposeAnnounce   = 1,
    Manifest         = 2,
    PullRequest      = 3,
    ChunkData        = 4,
    ExposureComplete = 5,
    ManifestRequest  = 6,
    PullComplete     = 7
};

enum HeaderFlags : uint16_t {
    HF_RETRANSMIT = 0x0001,
    HF_ENCRYPTED  = 0x0002,
    HF_COMPRESSED = 0x0004
};

// Low byte of Manifest::exposure_mode.
enum class RateMode : uint8_t { Fixed = 0, Adaptive = 1 };

// Bits 8-11 of Manifest::exposure_mode.
enum class HashAlgorithm : uint8_t { Blake2b256 = 1, Sha256 = 2 };

using ContentHash = std::array<uint8_t, kHashSize>;
using ChecksumFunction = std::function<uint32_t(const uint8_t*, size_t)>;

// Every multi-byte field travels in network byte order.
struct Header {
    uint8_t  version{kVersion};
    uint8_t  type{0};
    uint16_t flags{0};
    uint32_t session_id{0};
    uint32_t sequence{0};
    uint32_t chunk_size{0};
    uint32_t checksum{0};
};

struct Manifest {
    uint64_t    total_size{0};
    uint32_t    chunk_count{0};
    uint32_t    optimal_chunk_size{0};
    uint16_t    exposure_mode{0};
    uint16_t    priority{kDefaultPriority};
    ContentHash content_hash{};

    RateMode rate_mode() const;
    HashAlgorithm hash_algorithm() const;
    bool encrypted() const;
    bool compression() const;
};

bool operator==(const Manifest& a, const Manifest& b);
bool operator!=(const Manifest& a, const Manifest& b);

struct Frame {
    Header hdr{};
    std::vector<uint8_t> payload;
};

uint16_t make_exposure_mode(RateMode rate, HashAlgorithm hash, bool encrypted,
                            bool compression);

// ceil(total_size / chunk_size); zero for an empty payload.
uint64_t chunk_count_for(uint64_t total_size, uint32_t chunk_size);

void encode_header(const Header& h, uint8_t* out);
Header decode_header(const uint8_t* data, size_t len, std::error_code& ec);

void encode_manifest(const Manifest& m, uint8_t* out);
Manifest decode_manifest(const uint8_t* data, size_t len, std::error_code& ec);

// Fills hdr.chunk_size and hdr.checksum from the payload.
std::vector<uint8_t> serialize_frame(Frame& f, const ChecksumFunction& checksum);

// Structural parse only, the checksum is checked by verify_checksum.
Frame parse_frame(const uint8_t* data, size_t len, std::error_code& ec);
bool verify_checksum(const Frame& f, const ChecksumFunction& checksum);

// PULL_REQUEST payload: pull pressure as a 4-byte integer.
std::vector<uint8_t> encode_pressure(uint32_t pressure);
uint32_t decode_pressure(const std::vector<uint8_t>& payload, std::error_code& ec);

uint32_t crc32(const uint8_t* data, size_t len);

} // namespace rgtp
