#include "surface.hpp"

namespace rgtp {

static constexpr auto kSampleWindow = std::chrono::milliseconds(500);

Surface::Surface(Role role, uint32_t session_id, const Manifest &manifest,
                 ChunkStore store, ChunkBitmap bitmap, const Config &cfg,
                 DatagramTransport &transport, Endpoint peer)
    : role_(role), session_id_(session_id), manifest_(manifest),
      store_(std::move(store)), bitmap_(std::move(bitmap)),
      congestion_(cfg.congestion, cfg.exposure_rate, cfg.adaptive_mode),
      transport_(transport), peer_(std::move(peer)), started_(clock::now()),
      window_start_(started_) {
  // a resumed pull starts with chunks already in hand
  uint64_t have = 0;
  for (uint32_t i = 0; i < bitmap_.size(); i++)
    if (bitmap_.test(i))
      have += store_.chunk_length(i);
  chunks_ = bitmap_.count();
  if (role_ == Role::Puller)
    bytes_pulled_ = have;
  else
    bytes_exposed_ = have;
}

void Surface::record_chunk(uint32_t bytes) {
  if (role_ == Role::Puller)
    bytes_pulled_.fetch_add(bytes, std::memory_order_relaxed);
  else
    bytes_exposed_.fetch_add(bytes, std::memory_order_relaxed);
  chunks_.fetch_add(1, std::memory_order_relaxed);

  auto now = clock::now();
  window_bytes_ += bytes;
  auto dt = now - window_start_;
  if (dt >= kSampleWindow) {
    double secs = std::chrono::duration<double>(dt).count();
    recent_bps_.store((uint64_t)(window_bytes_ / secs),
                      std::memory_order_relaxed);
    window_bytes_ = 0;
    window_start_ = now;
  }
}

void Surface::record_retransmission() {
  retransmissions_.fetch_add(1, std::memory_order_relaxed);
}

Stats Surface::stats() const {
  Stats s;
  s.bytes_transferred = role_ == Role::Puller ? bytes_pulled() : bytes_exposed();
  s.total_bytes = manifest_.total_size;
  s.chunks_transferred = chunks_transferred();
  s.total_chunks = manifest_.chunk_count;
  s.retransmissions = retransmissions();
  s.completion_percent =
      s.total_chunks == 0
          ? 100.0
          : (double)s.chunks_transferred / (double)s.total_chunks * 100.0;
  auto elapsed = clock::now() - started_;
  s.elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
  double secs = std::chrono::duration<double>(elapsed).count();
  if (secs > 0)
    s.avg_throughput_mbps = (double)s.bytes_transferred / secs / 1e6;
  s.throughput_mbps =
      (double)recent_bps_.load(std::memory_order_relaxed) / 1e6;
  if (s.throughput_mbps == 0.0)
    s.throughput_mbps = s.avg_throughput_mbps;
  uint64_t remaining = s.total_bytes > s.bytes_transferred
                           ? s.total_bytes - s.bytes_transferred
                           : 0;
  if (remaining > 0 && s.avg_throughput_mbps > 0)
    s.estimated_remaining_ms =
        (int64_t)((double)remaining / (s.avg_throughput_mbps * 1e6) * 1000.0);
  return s;
}

} // namespace rgtp
