#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <system_error>
#include <vector>
#include "chunk_store.hpp"
#include "config.hpp"
#include "congestion.hpp"
#include "crypto.hpp"
#include "protocol.hpp"
#include "surface.hpp"
#include "transport.hpp"

namespace rgtp {

// Exposing side of one surface. Not thread-safe: one worker drives serve().
class Exposer {
public:
    using clock = std::chrono::steady_clock;

    Exposer(DatagramTransport& transport, const Config& cfg);

    // Builds the manifest and the surface. The payload is owned from here on.
    void expose(std::vector<uint8_t> payload, std::error_code& ec);

    // Pushes EXPOSE_ANNOUNCE and MANIFEST to a peer that has not asked yet.
    void announce(const Endpoint& dest, std::error_code& ec);

    // Waits up to `timeout` for requests and answers whatever arrived.
    // Returns the number of datagrams handled.
    size_t serve(std::chrono::milliseconds timeout, std::error_code& ec);

    // Tells peers that have not finished that the exposure is going away.
    void finish(std::error_code& ec);

    Surface* surface() { return surface_.get(); }
    const Surface* surface() const { return surface_.get(); }
    bool complete() const { return complete_; }
    size_t peer_count() const { return peers_.size(); }

private:
    struct Peer {
        ChunkBitmap sent;
        bool done{false};
        clock::time_point last_seen;
    };

    struct WireChunk {
        bool ready{false};
        uint16_t flags{0};
        std::vector<uint8_t> bytes;
    };

    // nullptr once max_peers pullers are live
    Peer* peer_for(const Endpoint& from);
    void drop_idle_peers(clock::time_point now);
    void handle(const Frame& f, const Endpoint& from, std::error_code& ec);
    void on_manifest_request(const Endpoint& from, std::error_code& ec);
    void on_pull_request(const Frame& f, const Endpoint& from, std::error_code& ec);
    void on_pull_complete(const Endpoint& from);
    void send_frame(Frame& f, const Endpoint& to, std::error_code& ec);
    const WireChunk* wire_chunk(uint32_t index, std::error_code& ec);
    void pace();
    void check_complete(const Peer& p);

    DatagramTransport& transport_;
    Config cfg_;
    std::unique_ptr<CryptoProvider> crypto_;
    std::unique_ptr<Surface> surface_;
    std::map<Endpoint, Peer> peers_;
    std::vector<WireChunk> wire_;
    Pacer pacer_;
    std::vector<uint8_t> rxbuf_;
    bool complete_{false};
};

// Raw primitive: exposes `data` on an already bound transport and announces it
// to `dest` when one is given. The caller drives the returned exposer with
// serve().
std::unique_ptr<Exposer> expose(DatagramTransport& transport, std::vector<uint8_t> data,
                                const Endpoint* dest, const Config& cfg,
                                std::error_code& ec);

} // namespace rgtp
