#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include "chunk_store.hpp"
#include "config.hpp"
#include "congestion.hpp"
#include "protocol.hpp"
#include "stats.hpp"
#include "transport.hpp"

namespace rgtp {

enum class Role : uint8_t { Exposer, Puller };

// One exposure or one pull. The bitmap tracks chunks exposed at least once on
// the exposing side and chunks received on the pulling side. Counters are
// written by the owning worker only and may be read from any thread.
class Surface {
public:
    using clock = std::chrono::steady_clock;

    Surface(Role role, uint32_t session_id, const Manifest& manifest, ChunkStore store,
            ChunkBitmap bitmap, const Config& cfg, DatagramTransport& transport,
            Endpoint peer);

    Role role() const { return role_; }
    uint32_t session_id() const { return session_id_; }
    const Manifest& manifest() const { return manifest_; }
    const ChunkBitmap& bitmap() const { return bitmap_; }
    ChunkBitmap& bitmap() { return bitmap_; }
    size_t bitmap_size() const { return bitmap_.byte_size(); }
    ChunkStore& store() { return store_; }
    const ChunkStore& store() const { return store_; }
    CongestionController& congestion() { return congestion_; }
    const CongestionController& congestion() const { return congestion_; }
    DatagramTransport& transport() { return transport_; }
    const Endpoint& peer() const { return peer_; }
    void set_peer(const Endpoint& peer) { peer_ = peer; }

    // A chunk reached its bitmap bit for the first time.
    void record_chunk(uint32_t bytes);
    void record_retransmission();

    uint64_t bytes_exposed() const { return bytes_exposed_.load(std::memory_order_relaxed); }
    uint64_t bytes_pulled() const { return bytes_pulled_.load(std::memory_order_relaxed); }
    uint32_t retransmissions() const { return retransmissions_.load(std::memory_order_relaxed); }
    uint32_t chunks_transferred() const { return chunks_.load(std::memory_order_relaxed); }

    Stats stats() const;

    void close() { closed_ = true; }
    bool closed() const { return closed_; }

private:
    Role role_;
    uint32_t session_id_;
    Manifest manifest_;
    ChunkStore store_;
    ChunkBitmap bitmap_;
    CongestionController congestion_;
    DatagramTransport& transport_;
    Endpoint peer_;

    std::atomic<uint64_t> bytes_exposed_{0};
    std::atomic<uint64_t> bytes_pulled_{0};
    std::atomic<uint32_t> retransmissions_{0};
    std::atomic<uint32_t> chunks_{0};
    std::atomic<uint64_t> recent_bps_{0};
    std::atomic<bool> closed_{false};
    clock::time_point started_;
    // worker-only sampling state
    clock::time_point window_start_;
    uint64_t window_bytes_{0};
};

} // namespace rgtp
