#pragma once
#include <chrono>
#include <cstdint>

namespace rgtp {

struct CongestionParams {
    uint32_t initial_window{10};
    uint32_t max_window{256};
    uint32_t additive_increase{1};
    // Window multiplier on loss, in percent.
    uint32_t decrease_percent{50};
    uint32_t min_rate{10};
    uint32_t max_rate{100000};
    // Pull pressure thresholds, 0..100.
    uint32_t high_pressure{50};
    uint32_t low_pressure{10};
    uint32_t initial_rto_ms{300};
    uint32_t min_rto_ms{100};
    uint32_t max_rto_ms{5000};
};

// AIMD window plus a pressure-driven exposure rate. With adaptive mode off the
// window and rate stay at their configured values; the retransmission
// timeout still follows measured round trips.
class CongestionController {
public:
    CongestionController(const CongestionParams& params, uint32_t exposure_rate,
                         bool adaptive);

    void on_delivery();
    void on_loss();
    void on_pull_pressure(uint32_t pressure);
    void on_rtt_sample(std::chrono::microseconds rtt);

    uint32_t window() const { return window_; }
    uint32_t exposure_rate() const { return rate_; }
    uint32_t pull_pressure() const { return pressure_; }
    bool adaptive() const { return adaptive_; }
    std::chrono::milliseconds retransmit_timeout() const;

private:
    CongestionParams params_;
    bool adaptive_;
    uint32_t window_;
    uint32_t rate_;
    uint32_t pressure_{0};
    uint32_t delivered_in_window_{0};
    bool have_rtt_{false};
    double srtt_us_{0};
    double rttvar_us_{0};
};

// Token bucket limiting datagrams per second.
class Pacer {
public:
    using clock = std::chrono::steady_clock;

    Pacer();
    // Time to wait before the next datagram may leave; consumes a token
    // when the answer is zero.
    std::chrono::microseconds acquire(uint32_t rate, uint32_t burst, clock::time_point now);

private:
    double tokens_;
    clock::time_point last_;
};

} // namespace rgtp
