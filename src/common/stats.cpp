#include "stats.hpp"
#include "util.hpp"
#include <cstdio>

namespace rgtp {

double Stats::efficiency_percent() const {
  if (chunks_transferred == 0)
    return 100.0;
  return (double)chunks_transferred /
         (double)(chunks_transferred + retransmissions) * 100.0;
}

std::string to_string(const Stats &s) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
                "%s / %s (%.1f%%) chunks %u/%u retx %u eff %.1f%% %s elapsed %s",
                format_size(s.bytes_transferred).c_str(),
                format_size(s.total_bytes).c_str(), s.completion_percent,
                s.chunks_transferred, s.total_chunks, s.retransmissions,
                s.efficiency_percent(),
                format_throughput(s.avg_throughput_mbps).c_str(),
                format_duration(s.elapsed_ms).c_str());
  return buf;
}

} // namespace rgtp
