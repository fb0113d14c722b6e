#pragma once
#include <string>
#include <cstdint>
#include <system_error>
#include <vector>

namespace rgtp {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

std::string format_size(uint64_t bytes);
std::string format_duration(int64_t milliseconds);
std::string format_throughput(double mbps);

std::vector<uint8_t> read_file(const std::string& path, std::error_code& ec);
// Writes to a sibling temporary file and renames it into place.
void write_file_atomic(const std::string& path, const std::vector<uint8_t>& data,
                       std::error_code& ec);

} // namespace rgtp
