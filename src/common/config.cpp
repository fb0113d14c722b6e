#include "config.hpp"
#include "error.hpp"
#include <algorithm>

namespace rgtp {

// One MTU worth of chunk payload: 1500 - IPv4 header - RGTP header.
static constexpr uint32_t kMtuChunk = 1500 - 20 - (uint32_t)kHeaderSize;
// AEAD tag room reserved whether or not encryption is on.
static constexpr uint32_t kSealOverhead = 16;

Config default_config() {
  Config c;
  c.chunk_size = 0;
  c.exposure_rate = 1000;
  c.adaptive_mode = true;
  c.timeout_ms = 30000;
  return c;
}

Config for_lan() {
  Config c = default_config();
  c.chunk_size = 1024 * 1024;
  c.exposure_rate = 10000;
  c.timeout_ms = 30000;
  c.congestion.initial_window = 32;
  c.congestion.max_window = 1024;
  c.congestion.initial_rto_ms = 100;
  c.congestion.min_rto_ms = 30;
  c.congestion.max_rto_ms = 1000;
  return c;
}

Config for_wan() {
  Config c = default_config();
  c.chunk_size = 64 * 1024;
  c.exposure_rate = 1000;
  c.timeout_ms = 60000;
  c.congestion.initial_rto_ms = 500;
  c.congestion.min_rto_ms = 200;
  c.congestion.max_rto_ms = 5000;
  return c;
}

Config for_mobile() {
  Config c = default_config();
  c.chunk_size = 16 * 1024;
  c.exposure_rate = 100;
  c.timeout_ms = 120000;
  c.congestion.initial_window = 4;
  c.congestion.max_window = 64;
  c.congestion.initial_rto_ms = 1000;
  c.congestion.min_rto_ms = 300;
  c.congestion.max_rto_ms = 8000;
  return c;
}

Config for_satellite() {
  Config c = default_config();
  c.chunk_size = 32 * 1024;
  c.exposure_rate = 200;
  c.timeout_ms = 300000;
  c.congestion.initial_window = 64;
  c.congestion.max_window = 2048;
  c.congestion.initial_rto_ms = 2000;
  c.congestion.min_rto_ms = 800;
  c.congestion.max_rto_ms = 15000;
  return c;
}

bool preset_by_name(const std::string &name, Config &out) {
  if (name == "default")
    out = default_config();
  else if (name == "lan")
    out = for_lan();
  else if (name == "wan")
    out = for_wan();
  else if (name == "mobile")
    out = for_mobile();
  else if (name == "satellite")
    out = for_satellite();
  else
    return false;
  return true;
}

std::error_code validate(const Config &cfg) {
  if (cfg.exposure_rate == 0 || cfg.timeout_ms <= 0 ||
      cfg.max_attempts_per_chunk == 0 || cfg.max_pull_size == 0 ||
      cfg.max_peers == 0)
    return make_error_code(errc::invalid_argument);
  if (cfg.enable_encryption && cfg.encryption_key.empty())
    return make_error_code(errc::invalid_argument);
  return std::error_code();
}

uint32_t choose_chunk_size(const Config &cfg, uint64_t total_size,
                           size_t max_datagram) {
  uint32_t size = cfg.chunk_size;
  if (size == 0) {
    if (total_size < 64 * 1024)
      size = kMtuChunk;
    else if (total_size < 1024 * 1024)
      size = kMtuChunk * 4;
    else
      size = kMtuChunk * 16;
  }
  size_t limit = max_datagram > kHeaderSize + kSealOverhead
                     ? max_datagram - kHeaderSize - kSealOverhead
                     : 1;
  return (uint32_t)std::max<size_t>(1, std::min<size_t>(size, limit));
}

} // namespace rgtp
