#pragma once
#include <cstdint>
#include <string>

namespace rgtp {

struct Stats {
    uint64_t bytes_transferred{0};
    uint64_t total_bytes{0};
    double throughput_mbps{0.0};        // MB/s over the last sampling window
    double avg_throughput_mbps{0.0};    // MB/s since the surface was created
    uint32_t chunks_transferred{0};
    uint32_t total_chunks{0};
    uint32_t retransmissions{0};
    double completion_percent{0.0};
    int64_t elapsed_ms{0};
    int64_t estimated_remaining_ms{0};

    double efficiency_percent() const;
};

std::string to_string(const Stats& s);

} // namespace rgtp
