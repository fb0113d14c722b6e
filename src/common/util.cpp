#include "util.hpp"
#include "error.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

namespace rgtp {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    unsigned int v;
    std::stringstream ss;
    ss << std::hex << hex.substr(i, 2);
    if (!(ss >> v))
      return {};
    out.push_back((uint8_t)v);
  }
  return out;
}

std::string format_size(uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double v = (double)bytes;
  int u = 0;
  while (v >= 1024.0 && u < 4) {
    v /= 1024.0;
    u++;
  }
  char buf[32];
  if (u == 0)
    std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
  else
    std::snprintf(buf, sizeof(buf), "%.2f %s", v, units[u]);
  return buf;
}

std::string format_duration(int64_t ms) {
  char buf[32];
  if (ms < 1000)
    std::snprintf(buf, sizeof(buf), "%lldms", (long long)ms);
  else if (ms < 60000)
    std::snprintf(buf, sizeof(buf), "%.1fs", ms / 1000.0);
  else if (ms < 3600000)
    std::snprintf(buf, sizeof(buf), "%lldm %llds", (long long)(ms / 60000),
                  (long long)((ms % 60000) / 1000));
  else
    std::snprintf(buf, sizeof(buf), "%lldh %lldm", (long long)(ms / 3600000),
                  (long long)((ms % 3600000) / 60000));
  return buf;
}

std::string format_throughput(double mbps) {
  char buf[32];
  if (mbps >= 1000.0)
    std::snprintf(buf, sizeof(buf), "%.2f GB/s", mbps / 1000.0);
  else if (mbps >= 1.0)
    std::snprintf(buf, sizeof(buf), "%.2f MB/s", mbps);
  else
    std::snprintf(buf, sizeof(buf), "%.2f KB/s", mbps * 1000.0);
  return buf;
}

std::vector<uint8_t> read_file(const std::string &path, std::error_code &ec) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
    return {};
  }
  std::streamsize size = in.tellg();
  in.seekg(0, std::ios::beg);
  std::vector<uint8_t> data(size > 0 ? (size_t)size : 0);
  if (size > 0 && !in.read((char *)data.data(), size)) {
    ec = std::make_error_code(std::errc::io_error);
    return {};
  }
  ec.clear();
  return data;
}

void write_file_atomic(const std::string &path, const std::vector<uint8_t> &data,
                       std::error_code &ec) {
  std::string tmp = path + ".rgtp-part";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      ec = std::make_error_code(std::errc::permission_denied);
      return;
    }
    if (!data.empty())
      out.write((const char *)data.data(), (std::streamsize)data.size());
    out.flush();
    if (!out) {
      out.close();
      std::remove(tmp.c_str());
      ec = std::make_error_code(std::errc::io_error);
      return;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    ec = std::make_error_code(std::errc::io_error);
    return;
  }
  ec.clear();
}

} // namespace rgtp
