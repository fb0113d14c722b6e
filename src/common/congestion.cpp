#include "congestion.hpp"
#include <algorithm>
#include <cmath>

namespace rgtp {

CongestionController::CongestionController(const CongestionParams &params,
                                           uint32_t exposure_rate,
                                           bool adaptive)
    : params_(params), adaptive_(adaptive),
      window_(std::max<uint32_t>(1, params.initial_window)),
      rate_(std::max<uint32_t>(1, exposure_rate)) {
  if (params_.max_window < window_)
    params_.max_window = window_;
}

void CongestionController::on_delivery() {
  if (!adaptive_)
    return;
  if (++delivered_in_window_ >= window_) {
    window_ = std::min(params_.max_window, window_ + params_.additive_increase);
    delivered_in_window_ = 0;
  }
}

void CongestionController::on_loss() {
  delivered_in_window_ = 0;
  if (!adaptive_)
    return;
  uint32_t pct = std::min<uint32_t>(params_.decrease_percent, 100);
  window_ = std::max<uint32_t>(1, (uint32_t)((uint64_t)window_ * pct / 100));
}

void CongestionController::on_pull_pressure(uint32_t pressure) {
  pressure_ = std::min<uint32_t>(pressure, 100);
  if (!adaptive_)
    return;
  if (pressure_ >= params_.high_pressure)
    rate_ = (uint32_t)((uint64_t)rate_ * 9 / 10);
  else if (pressure_ <= params_.low_pressure)
    rate_ = (uint32_t)((uint64_t)rate_ * 11 / 10 + 1);
  rate_ = std::max(params_.min_rate, std::min(params_.max_rate, rate_));
}

void CongestionController::on_rtt_sample(std::chrono::microseconds rtt) {
  double r = (double)rtt.count();
  if (!have_rtt_) {
    srtt_us_ = r;
    rttvar_us_ = r / 2;
    have_rtt_ = true;
    return;
  }
  rttvar_us_ = 0.75 * rttvar_us_ + 0.25 * std::fabs(srtt_us_ - r);
  srtt_us_ = 0.875 * srtt_us_ + 0.125 * r;
}

std::chrono::milliseconds CongestionController::retransmit_timeout() const {
  uint32_t ms = params_.initial_rto_ms;
  if (have_rtt_)
    ms = (uint32_t)((srtt_us_ + 4 * rttvar_us_) / 1000.0);
  ms = std::max(params_.min_rto_ms, std::min(params_.max_rto_ms, ms));
  return std::chrono::milliseconds(ms);
}

Pacer::Pacer() : tokens_(1.0), last_(clock::now()) {}

std::chrono::microseconds Pacer::acquire(uint32_t rate, uint32_t burst,
                                         clock::time_point now) {
  rate = std::max<uint32_t>(1, rate);
  double cap = (double)std::max<uint32_t>(1, burst);
  double elapsed =
      std::chrono::duration<double>(now - last_).count();
  if (elapsed > 0) {
    tokens_ = std::min(cap, tokens_ + elapsed * rate);
    last_ = now;
  }
  if (tokens_ >= 1.0) {
    tokens_ -= 1.0;
    return std::chrono::microseconds(0);
  }
  double wait_s = (1.0 - tokens_) / rate;
  return std::chrono::microseconds((int64_t)std::ceil(wait_s * 1e6));
}

} // namespace rgtp
