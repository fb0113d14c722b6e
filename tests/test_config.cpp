#include <cmath>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "common/test_check.hpp"
#include "config.hpp"
#include "context.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "stats.hpp"
#include "util.hpp"

using namespace rgtp;

// -----------------------------------------------------------------------------
// Test: presets populate distinct, valid defaults
// -----------------------------------------------------------------------------
void test_presets() {
    std::cout << "[TEST] config presets\n";
    Config d = default_config();
    Config lan = for_lan();
    Config wan = for_wan();
    Config mob = for_mobile();
    Config sat = for_satellite();
    for (const Config* c : {&d, &lan, &wan, &mob, &sat}) {
        TEST_CHECK(!validate(*c));
        TEST_CHECK(c->exposure_rate > 0);
        TEST_CHECK(c->timeout_ms > 0);
        TEST_CHECK(!c->enable_encryption);
    }
    TEST_CHECK(d.chunk_size == 0);
    TEST_CHECK(lan.chunk_size > wan.chunk_size);
    TEST_CHECK(wan.chunk_size > mob.chunk_size);
    TEST_CHECK(lan.exposure_rate > wan.exposure_rate);
    TEST_CHECK(wan.exposure_rate > mob.exposure_rate);
    TEST_CHECK(mob.timeout_ms > wan.timeout_ms);
    TEST_CHECK(sat.timeout_ms > mob.timeout_ms);

    Config c;
    TEST_CHECK(preset_by_name("mobile", c));
    TEST_CHECK(c.chunk_size == mob.chunk_size);
    TEST_CHECK(preset_by_name("satellite", c));
    TEST_CHECK(c.timeout_ms == sat.timeout_ms);
    TEST_CHECK(!preset_by_name("carrier-pigeon", c));
    std::cout << "[TEST] OK\n";
}

void test_validate() {
    std::cout << "[TEST] config validate\n";
    Config c = default_config();
    c.exposure_rate = 0;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c = default_config();
    c.timeout_ms = 0;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c = default_config();
    c.max_attempts_per_chunk = 0;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c = default_config();
    c.max_pull_size = 0;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c = default_config();
    c.max_peers = 0;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c = default_config();
    c.enable_encryption = true;
    TEST_CHECK(validate(c) == errc::invalid_argument);
    c.encryption_key = std::vector<uint8_t>(32, 1);
    TEST_CHECK(!validate(c));
    std::cout << "[TEST] OK\n";
}

void test_chunk_sizing() {
    std::cout << "[TEST] config chunk sizing\n";
    Config c = default_config();
    uint32_t small = choose_chunk_size(c, 1000, 65507);
    uint32_t mid = choose_chunk_size(c, 500 * 1024, 65507);
    uint32_t big = choose_chunk_size(c, 100 * 1024 * 1024, 65507);
    TEST_CHECK(small == 1500 - 20 - 20);
    TEST_CHECK(mid == small * 4);
    TEST_CHECK(big == small * 16);

    c.chunk_size = 65536;
    TEST_CHECK(choose_chunk_size(c, 1 << 20, 1 << 20) == 65536);
    // clamped to one datagram
    uint32_t clamped = choose_chunk_size(c, 1 << 20, 65507);
    TEST_CHECK(clamped < 65536);
    TEST_CHECK(clamped + kHeaderSize + 16 <= 65507);

    c = for_lan();
    TEST_CHECK(choose_chunk_size(c, 1 << 30, 65507) + kHeaderSize <= 65507);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: derived statistics
// -----------------------------------------------------------------------------
void test_efficiency() {
    std::cout << "[TEST] stats efficiency\n";
    Stats s;
    TEST_CHECK(s.efficiency_percent() == 100.0);
    s.retransmissions = 5;
    TEST_CHECK(s.efficiency_percent() == 100.0);
    s.chunks_transferred = 16;
    s.retransmissions = 2;
    TEST_CHECK(std::fabs(s.efficiency_percent() - 88.888) < 0.01);
    s.retransmissions = 0;
    TEST_CHECK(s.efficiency_percent() == 100.0);
    s.chunks_transferred = 1;
    s.retransmissions = 1;
    TEST_CHECK(s.efficiency_percent() == 50.0);
    TEST_CHECK(!to_string(s).empty());
    std::cout << "[TEST] OK\n";
}

void test_formatting() {
    std::cout << "[TEST] util formatting\n";
    TEST_CHECK(format_size(512) == "512 B");
    TEST_CHECK(format_size(1536) == "1.50 KB");
    TEST_CHECK(format_size(1048576) == "1.00 MB");
    TEST_CHECK(format_duration(250) == "250ms");
    TEST_CHECK(format_duration(1500) == "1.5s");
    TEST_CHECK(format_duration(125000) == "2m 5s");
    TEST_CHECK(format_duration(3600000 + 120000) == "1h 2m");
    TEST_CHECK(format_throughput(0.5) == "500.00 KB/s");
    TEST_CHECK(format_throughput(12.25) == "12.25 MB/s");
    TEST_CHECK(format_throughput(2500) == "2.50 GB/s");
    std::cout << "[TEST] OK\n";
}

void test_host_port() {
    std::cout << "[TEST] util host:port\n";
    std::string host;
    uint16_t port = 0;
    TEST_CHECK(parse_host_port("127.0.0.1:9000", host, port));
    TEST_CHECK(host == "127.0.0.1" && port == 9000);
    TEST_CHECK(parse_host_port("[::1]:443", host, port));
    TEST_CHECK(host == "::1" && port == 443);
    TEST_CHECK(!parse_host_port("nohost", host, port));
    TEST_CHECK(!parse_host_port("h:99999", host, port));
    TEST_CHECK(!parse_host_port("h:x", host, port));

    TEST_CHECK(hex_to_bytes("00ff10") == std::vector<uint8_t>({0x00, 0xff, 0x10}));
    TEST_CHECK(hex_to_bytes("abc").empty());
    TEST_CHECK(hex_to_bytes("zz").empty());
    std::cout << "[TEST] OK\n";
}

void test_file_io() {
    std::cout << "[TEST] util atomic file write\n";
    std::string path = "rgtp_test_config_file.bin";
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    std::error_code ec;
    write_file_atomic(path, data, ec);
    TEST_CHECK(!ec);
    TEST_CHECK(read_file(path, ec) == data);
    TEST_CHECK(!ec);
    // no temporary left behind
    std::FILE* tmp = std::fopen((path + ".rgtp-part").c_str(), "rb");
    TEST_CHECK(tmp == nullptr);
    std::remove(path.c_str());

    read_file("rgtp_does_not_exist.bin", ec);
    TEST_CHECK(ec);
    write_file_atomic("rgtp_no_such_dir/x.bin", data, ec);
    TEST_CHECK(ec);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: logger levels and sink
// -----------------------------------------------------------------------------
void test_logging() {
    std::cout << "[TEST] logging sink\n";
    LogLevel lvl;
    TEST_CHECK(parse_log_level("DEBUG", lvl) && lvl == LogLevel::DEBUG);
    TEST_CHECK(parse_log_level("warning", lvl) && lvl == LogLevel::WARN);
    TEST_CHECK(parse_log_level("off", lvl) && lvl == LogLevel::OFF);
    TEST_CHECK(!parse_log_level("loud", lvl));

    std::vector<std::string> lines;
    Logger& log = Logger::instance();
    log.set_sink([&](LogLevel, const std::string& line) { lines.push_back(line); });
    log.set_level(LogLevel::WARN);
    log.log(LogLevel::INFO, "hidden %d", 1);
    log.log(LogLevel::ERROR, "shown %d", 2);
    TEST_CHECK(lines.size() == 1);
    TEST_CHECK(lines[0].find("shown 2") != std::string::npos);
    log.set_sink(Logger::Sink());
    log.set_level(LogLevel::INFO);
    std::cout << "[TEST] OK\n";
}

void test_context() {
    std::cout << "[TEST] context lifecycle\n";
    Context ctx;
    std::error_code ec;
    ctx.create_socket(ec);
    TEST_CHECK(ec == errc::init_failure);
    ctx.init(ec);
    TEST_CHECK(!ec && ctx.initialized());
    ctx.init(ec);
    TEST_CHECK(!ec);
    TEST_CHECK(Context::version() == "1.0.0");
    TEST_CHECK(Context::build_info().find("libsodium") != std::string::npos);
    ctx.cleanup();
    ctx.cleanup();
    TEST_CHECK(!ctx.initialized());
    std::cout << "[TEST] OK\n";
}

int main() {
    test_presets();
    test_validate();
    test_chunk_sizing();
    test_efficiency();
    test_formatting();
    test_host_port();
    test_file_io();
    test_logging();
    test_context();
    std::cout << "\n[ALL CONFIG TESTS PASSED]\n";
    return 0;
}
