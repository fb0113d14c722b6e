#include <cstring>
#include <iostream>
#include <vector>

#include "common/test_check.hpp"
#include "error.hpp"
#include "protocol.hpp"

using namespace rgtp;

// -----------------------------------------------------------------------------
// Test: header fields land in network byte order at fixed offsets
// -----------------------------------------------------------------------------
void test_header_layout() {
    std::cout << "[TEST] protocol header layout\n";
    Header h;
    h.type = (uint8_t)PacketType::ChunkData;
    h.flags = HF_RETRANSMIT | HF_COMPRESSED;
    h.session_id = 0x01020304;
    h.sequence = 0x0A0B0C0D;
    h.chunk_size = 65536;
    h.checksum = 0xDEADBEEF;

    uint8_t buf[kHeaderSize];
    encode_header(h, buf);
    TEST_CHECK(buf[0] == kVersion);
    TEST_CHECK(buf[1] == 4);
    TEST_CHECK(buf[2] == 0x00 && buf[3] == 0x05);
    TEST_CHECK(buf[4] == 0x01 && buf[7] == 0x04);
    TEST_CHECK(buf[8] == 0x0A && buf[11] == 0x0D);
    TEST_CHECK(buf[12] == 0x00 && buf[13] == 0x01 && buf[14] == 0x00 && buf[15] == 0x00);
    TEST_CHECK(buf[16] == 0xDE && buf[19] == 0xEF);

    std::error_code ec;
    Header d = decode_header(buf, sizeof(buf), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(d.type == h.type && d.flags == h.flags);
    TEST_CHECK(d.session_id == h.session_id && d.sequence == h.sequence);
    TEST_CHECK(d.chunk_size == h.chunk_size && d.checksum == h.checksum);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a truncated header is rejected without touching the output
// -----------------------------------------------------------------------------
void test_short_header_rejected() {
    std::cout << "[TEST] protocol short header\n";
    uint8_t buf[kHeaderSize];
    Header h;
    h.session_id = 7;
    encode_header(h, buf);

    for (size_t len = 0; len < kHeaderSize; len++) {
        std::error_code ec;
        Header d = decode_header(buf, len, ec);
        TEST_CHECK(ec == errc::malformed_frame);
        TEST_CHECK(d.session_id == 0 && d.type == 0);

        Frame f = parse_frame(buf, len, ec);
        TEST_CHECK(ec == errc::malformed_frame);
        TEST_CHECK(f.payload.empty());
    }
    std::cout << "[TEST] OK\n";
}

void test_bad_version_rejected() {
    std::cout << "[TEST] protocol unsupported version\n";
    uint8_t buf[kHeaderSize];
    encode_header(Header{}, buf);
    buf[0] = kVersion + 1;
    std::error_code ec;
    decode_header(buf, sizeof(buf), ec);
    TEST_CHECK(ec == errc::malformed_frame);
    std::cout << "[TEST] OK\n";
}

void test_manifest_layout() {
    std::cout << "[TEST] protocol manifest layout\n";
    Manifest m;
    m.total_size = 1048576;
    m.optimal_chunk_size = 65536;
    m.chunk_count = chunk_count_for(m.total_size, m.optimal_chunk_size);
    m.exposure_mode = make_exposure_mode(RateMode::Adaptive, HashAlgorithm::Sha256, true, false);
    m.priority = 7;
    for (size_t i = 0; i < kHashSize; i++)
        m.content_hash[i] = (uint8_t)i;

    uint8_t buf[kManifestSize];
    encode_manifest(m, buf);
    TEST_CHECK(buf[5] == 0x10);    // 2^20, big-endian u64
    TEST_CHECK(buf[11] == 16);     // chunk_count
    TEST_CHECK(buf[18] == 0 && buf[19] == 7);
    TEST_CHECK(buf[20] == 0 && buf[51] == 31);

    std::error_code ec;
    Manifest d = decode_manifest(buf, sizeof(buf), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(d == m);
    TEST_CHECK(d.chunk_count == 16);
    TEST_CHECK(d.rate_mode() == RateMode::Adaptive);
    TEST_CHECK(d.hash_algorithm() == HashAlgorithm::Sha256);
    TEST_CHECK(d.encrypted());
    TEST_CHECK(!d.compression());

    decode_manifest(buf, kManifestSize - 1, ec);
    TEST_CHECK(ec == errc::malformed_frame);
    std::cout << "[TEST] OK\n";
}

void test_manifest_inconsistent_count() {
    std::cout << "[TEST] protocol manifest chunk count\n";
    Manifest m;
    m.total_size = 100;
    m.optimal_chunk_size = 30;
    m.chunk_count = 3;    // ceil(100 / 30) is 4
    uint8_t buf[kManifestSize];
    encode_manifest(m, buf);
    std::error_code ec;
    decode_manifest(buf, sizeof(buf), ec);
    TEST_CHECK(ec == errc::malformed_frame);

    // 2^48 one-byte chunks does not fit a 32-bit count, truncated or not
    m.total_size = uint64_t(1) << 48;
    m.optimal_chunk_size = 1;
    m.chunk_count = 0;
    encode_manifest(m, buf);
    decode_manifest(buf, sizeof(buf), ec);
    TEST_CHECK(ec == errc::malformed_frame);
    m.chunk_count = UINT32_MAX;
    encode_manifest(m, buf);
    decode_manifest(buf, sizeof(buf), ec);
    TEST_CHECK(ec == errc::malformed_frame);

    TEST_CHECK(chunk_count_for(uint64_t(1) << 48, 1) == uint64_t(1) << 48);
    TEST_CHECK(chunk_count_for(UINT32_MAX, 1) == UINT32_MAX);

    // the largest count that still fits is accepted
    m.total_size = UINT32_MAX;
    m.chunk_count = UINT32_MAX;
    encode_manifest(m, buf);
    Manifest d = decode_manifest(buf, sizeof(buf), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(d.chunk_count == UINT32_MAX);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: checksum covers the payload only
// -----------------------------------------------------------------------------
void test_frame_checksum() {
    std::cout << "[TEST] protocol frame checksum\n";
    Frame f;
    f.hdr.type = (uint8_t)PacketType::ChunkData;
    f.hdr.session_id = 42;
    f.hdr.sequence = 3;
    f.payload = {'c', 'h', 'u', 'n', 'k'};
    auto wire = serialize_frame(f, ChecksumFunction());
    TEST_CHECK(wire.size() == kHeaderSize + 5);
    TEST_CHECK(f.hdr.chunk_size == 5);
    TEST_CHECK(f.hdr.checksum == crc32(f.payload.data(), f.payload.size()));

    std::error_code ec;
    Frame p = parse_frame(wire.data(), wire.size(), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(verify_checksum(p, ChecksumFunction()));
    TEST_CHECK(p.payload == f.payload);

    // header changes leave the checksum valid
    wire[11] ^= 0x01;
    p = parse_frame(wire.data(), wire.size(), ec);
    TEST_CHECK(!ec && verify_checksum(p, ChecksumFunction()));
    TEST_CHECK(p.hdr.sequence == 2);

    wire.back() ^= 0x01;
    p = parse_frame(wire.data(), wire.size(), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(!verify_checksum(p, ChecksumFunction()));

    // declared length must match what arrived
    wire.push_back(0);
    parse_frame(wire.data(), wire.size(), ec);
    TEST_CHECK(ec == errc::malformed_frame);
    std::cout << "[TEST] OK\n";
}

void test_pluggable_checksum() {
    std::cout << "[TEST] protocol pluggable checksum\n";
    ChecksumFunction sum = [](const uint8_t* d, size_t n) {
        uint32_t s = 0;
        for (size_t i = 0; i < n; i++)
            s += d[i];
        return s;
    };
    Frame f;
    f.payload = {1, 2, 3};
    auto wire = serialize_frame(f, sum);
    TEST_CHECK(f.hdr.checksum == 6);
    std::error_code ec;
    Frame p = parse_frame(wire.data(), wire.size(), ec);
    TEST_CHECK(verify_checksum(p, sum));
    TEST_CHECK(!verify_checksum(p, ChecksumFunction()));
    std::cout << "[TEST] OK\n";
}

void test_crc32_reference() {
    std::cout << "[TEST] protocol crc32\n";
    const char* s = "123456789";
    TEST_CHECK(crc32((const uint8_t*)s, std::strlen(s)) == 0xCBF43926u);
    TEST_CHECK(crc32(nullptr, 0) == 0);
    std::cout << "[TEST] OK\n";
}

void test_pressure_payload() {
    std::cout << "[TEST] protocol pull pressure\n";
    auto p = encode_pressure(73);
    TEST_CHECK(p.size() == kPressureSize);
    std::error_code ec;
    TEST_CHECK(decode_pressure(p, ec) == 73 && !ec);
    p.pop_back();
    decode_pressure(p, ec);
    TEST_CHECK(ec == errc::malformed_frame);
    std::cout << "[TEST] OK\n";
}

void test_error_category() {
    std::cout << "[TEST] error category\n";
    std::error_code ec = errc::host_resolution_failure;
    TEST_CHECK(std::string(ec.category().name()) == "rgtp");
    TEST_CHECK(ec != make_error_code(errc::transport_failure));
    TEST_CHECK(!error_string(ec).empty());
    TEST_CHECK(error_string(std::error_code()) == "success");
    std::cout << "[TEST] OK\n";
}

int main() {
    test_header_layout();
    test_short_header_rejected();
    test_bad_version_rejected();
    test_manifest_layout();
    test_manifest_inconsistent_count();
    test_frame_checksum();
    test_pluggable_checksum();
    test_crc32_reference();
    test_pressure_payload();
    test_error_category();
    std::cout << "\n[ALL PROTOCOL TESTS PASSED]\n";
    return 0;
}
