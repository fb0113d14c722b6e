#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <vector>
#include "chunk_store.hpp"
#include "config.hpp"
#include "crypto.hpp"
#include "protocol.hpp"
#include "stats.hpp"
#include "surface.hpp"
#include "transport.hpp"

namespace rgtp {

// What a pull leaves behind when it stops short. Handing it to the next pull
// of the same exposure requests only the chunks still missing.
struct PullState {
    uint32_t session_id{0};
    Manifest manifest{};
    ChunkBitmap bitmap;
    std::vector<uint8_t> data;

    bool empty() const { return session_id == 0; }
    void reset() { *this = PullState{}; }
};

// Pulling side of one surface, driven on the calling thread.
class Puller {
public:
    using clock = std::chrono::steady_clock;

    Puller(DatagramTransport& transport, const Config& cfg);

    // Pulls the exposure at `source`. On failure `state` holds what arrived
    // so far; on success it is reset. Payloads above `capacity` bytes fail
    // with errc::buffer_too_small.
    std::vector<uint8_t> pull(const Endpoint& source, PullState& state, size_t capacity,
                              std::error_code& ec);

    // Safe from any thread.
    Stats stats() const;
    bool has_surface() const;

    void set_progress(ProgressCallback cb) { progress_ = std::move(cb); }

private:
    struct InFlight {
        clock::time_point sent;
        clock::time_point deadline;
        bool retransmit{false};
    };

    Manifest fetch_manifest(const Endpoint& source, uint32_t& sid_out, std::error_code& ec);
    void request(uint32_t index, bool retransmit, std::error_code& ec);
    void on_datagram(const uint8_t* data, size_t n, const Endpoint& from, std::error_code& ec);
    void on_chunk(const Frame& f);
    void lose(uint32_t index, const std::error_code& cause);
    void expire(clock::time_point now);
    uint32_t pressure() const;
    void send_control(PacketType type, uint32_t session_id, const Endpoint& to,
                      std::error_code& ec);
    void save(PullState& state);

    DatagramTransport& transport_;
    Config cfg_;
    std::unique_ptr<CryptoProvider> crypto_;
    ProgressCallback progress_;
    std::vector<uint8_t> rxbuf_;

    mutable std::mutex surface_mtx_;
    std::unique_ptr<Surface> surface_;

    // per-pull bookkeeping, worker only
    std::deque<uint32_t> pending_;
    std::deque<uint32_t> retry_;
    std::map<uint32_t, InFlight> inflight_;
    std::map<uint32_t, uint32_t> attempts_;
    std::map<uint32_t, std::error_code> last_cause_;
    clock::time_point last_progress_;
    std::error_code fatal_;
};

// Raw primitive: pulls the exposure at `source` into `buffer` and returns the
// number of bytes written.
size_t pull(DatagramTransport& transport, const Endpoint& source, uint8_t* buffer,
            size_t capacity, const Config& cfg, std::error_code& ec);

} // namespace rgtp
