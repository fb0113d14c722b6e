#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>
#include "congestion.hpp"
#include "protocol.hpp"

namespace rgtp {

using ProgressCallback = std::function<void(uint64_t bytes_transferred, uint64_t total_bytes)>;
using ErrorCallback = std::function<void(const std::error_code& ec, const std::string& message)>;
// Reorders the chunk indices a pull is about to request.
using RequestOrderHook = std::function<void(const Manifest& manifest, std::vector<uint32_t>& indices)>;

struct Config {
    uint32_t chunk_size{0};            // 0 = sized from the payload
    uint32_t exposure_rate{1000};      // datagrams per second
    bool adaptive_mode{true};
    bool enable_compression{false};
    bool enable_encryption{false};
    uint16_t port{0};
    int timeout_ms{30000};
    ProgressCallback on_progress;
    ErrorCallback on_error;

    std::vector<uint8_t> encryption_key;
    HashAlgorithm hash_algorithm{HashAlgorithm::Blake2b256};
    ChecksumFunction checksum;         // empty = crc32
    uint32_t max_attempts_per_chunk{5};
    // Largest manifest a pull accepts, whatever buffer it is given.
    uint64_t max_pull_size{uint64_t(4) << 30};
    // Pullers served at once; idle ones are dropped after timeout_ms.
    uint32_t max_peers{256};
    uint16_t priority{kDefaultPriority};
    CongestionParams congestion;
    RequestOrderHook order_requests;
};

Config default_config();
Config for_lan();
Config for_wan();
Config for_mobile();
Config for_satellite();

// Looks a preset up by name ("default", "lan", "wan", "mobile", "satellite").
bool preset_by_name(const std::string& name, Config& out);

std::error_code validate(const Config& cfg);

// Chunk size for a payload, clamped so one chunk plus framing fits in a
// single datagram of `max_datagram` bytes.
uint32_t choose_chunk_size(const Config& cfg, uint64_t total_size, size_t max_datagram);

} // namespace rgtp
