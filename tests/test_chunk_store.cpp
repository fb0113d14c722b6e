#include <iostream>
#include <string>
#include <vector>

#include "chunk_store.hpp"
#include "common/test_check.hpp"
#include "compression.hpp"
#include "context.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "util.hpp"

using namespace rgtp;

static std::vector<uint8_t> make_payload(size_t n, uint32_t seed) {
    std::vector<uint8_t> v(n);
    uint32_t x = seed;
    for (size_t i = 0; i < n; i++) {
        x = x * 1103515245u + 12345u;
        v[i] = (uint8_t)(x >> 16);
    }
    return v;
}

static uint16_t default_mode() {
    return make_exposure_mode(RateMode::Adaptive, HashAlgorithm::Blake2b256, false, false);
}

// -----------------------------------------------------------------------------
// Test: chunk count and chunk lengths over a spread of sizes
// -----------------------------------------------------------------------------
void test_split_sizes() {
    std::cout << "[TEST] chunk_store split sizes\n";
    const size_t sizes[] = {1, 7, 64, 100, 1000, 4096, 65535, 65536, 65537, 1048576};
    const uint32_t chunks[] = {1, 3, 64, 1000, 1400, 65536};
    for (size_t s : sizes) {
        auto payload = make_payload(s, (uint32_t)s);
        for (uint32_t c : chunks) {
            auto parts = split(payload, c);
            TEST_CHECK(parts.size() == (s + c - 1) / c);
            TEST_CHECK(parts.size() == chunk_count_for(s, c));
            size_t sum = 0;
            for (size_t i = 0; i < parts.size(); i++) {
                if (i + 1 < parts.size())
                    TEST_CHECK(parts[i].size() == c);
                sum += parts[i].size();
            }
            TEST_CHECK(sum == s);
            size_t tail = s % c == 0 ? c : s % c;
            TEST_CHECK(parts.back().size() == tail);
        }
    }
    std::cout << "[TEST] OK\n";
}

void test_reassemble_roundtrip() {
    std::cout << "[TEST] chunk_store reassemble\n";
    for (size_t s : {size_t(1), size_t(999), size_t(1048576)}) {
        auto payload = make_payload(s, 99);
        Manifest m = build_manifest(payload, 65536, default_mode(), kDefaultPriority);
        TEST_CHECK(m.chunk_count == chunk_count_for(s, 65536));
        TEST_CHECK(m.content_hash == content_hash(HashAlgorithm::Blake2b256, payload.data(), s));

        std::error_code ec;
        auto out = reassemble(split(payload, 65536), m, ec);
        TEST_CHECK(!ec);
        TEST_CHECK(out == payload);
    }
    std::cout << "[TEST] OK\n";
}

void test_reassemble_hash_mismatch() {
    std::cout << "[TEST] chunk_store hash mismatch\n";
    auto payload = make_payload(5000, 1);
    Manifest m = build_manifest(payload, 1024, default_mode(), kDefaultPriority);
    auto parts = split(payload, 1024);
    parts[2][10] ^= 0x40;
    std::error_code ec;
    auto out = reassemble(parts, m, ec);
    TEST_CHECK(ec == errc::checksum_mismatch);
    TEST_CHECK(out.empty());
    std::cout << "[TEST] OK\n";
}

void test_reassemble_requires_every_chunk() {
    std::cout << "[TEST] chunk_store missing chunk\n";
    auto payload = make_payload(4096, 3);
    Manifest m = build_manifest(payload, 1024, default_mode(), kDefaultPriority);
    ChunkStore store(m);
    ChunkBitmap have(m.chunk_count);
    std::error_code ec;
    for (uint32_t i = 0; i < 3; i++) {
        store.write_chunk(i, payload.data() + store.chunk_offset(i), store.chunk_length(i), ec);
        TEST_CHECK(!ec);
        have.set(i);
    }
    auto out = store.reassemble(have, ec);
    TEST_CHECK(ec == errc::pull_failure);
    TEST_CHECK(out.empty());

    store.write_chunk(3, payload.data(), 100, ec);
    TEST_CHECK(ec == errc::malformed_frame);
    store.write_chunk(4, payload.data(), 1024, ec);
    TEST_CHECK(ec == errc::malformed_frame);
    std::cout << "[TEST] OK\n";
}

void test_sha256_manifest() {
    std::cout << "[TEST] chunk_store sha256 content hash\n";
    auto payload = make_payload(3000, 5);
    uint16_t mode = make_exposure_mode(RateMode::Fixed, HashAlgorithm::Sha256, false, false);
    Manifest m = build_manifest(payload, 1000, mode, kDefaultPriority);
    TEST_CHECK(m.content_hash == content_hash(HashAlgorithm::Sha256, payload.data(), payload.size()));
    TEST_CHECK(m.content_hash != content_hash(HashAlgorithm::Blake2b256, payload.data(), payload.size()));
    std::error_code ec;
    TEST_CHECK(reassemble(split(payload, 1000), m, ec) == payload);
    TEST_CHECK(!ec);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: bitmap bookkeeping
// -----------------------------------------------------------------------------
void test_bitmap() {
    std::cout << "[TEST] chunk_store bitmap\n";
    ChunkBitmap bm(13);
    TEST_CHECK(bm.byte_size() == 2);
    TEST_CHECK(bm.count() == 0 && !bm.full());
    TEST_CHECK(bm.set(0));
    TEST_CHECK(bm.set(12));
    TEST_CHECK(!bm.set(12));
    TEST_CHECK(!bm.set(13));
    TEST_CHECK(bm.count() == 2);
    TEST_CHECK(bm.bytes()[0] == 0x01 && bm.bytes()[1] == 0x10);
    TEST_CHECK(bm.missing().size() == 11);
    TEST_CHECK(bm.missing().front() == 1);

    std::error_code ec;
    ChunkBitmap copy = ChunkBitmap::from_bytes(13, bm.bytes(), ec);
    TEST_CHECK(!ec);
    TEST_CHECK(copy.count() == 2 && copy.test(12) && !copy.test(11));

    ChunkBitmap::from_bytes(13, std::vector<uint8_t>(3, 0), ec);
    TEST_CHECK(ec == errc::invalid_argument);

    // padding bits are ignored
    ChunkBitmap padded = ChunkBitmap::from_bytes(13, {0xFF, 0xFF}, ec);
    TEST_CHECK(!ec && padded.count() == 13 && padded.full());

    bm.clear();
    TEST_CHECK(bm.count() == 0 && bm.missing().size() == 13);

    ChunkBitmap empty(0);
    TEST_CHECK(empty.full() && empty.byte_size() == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: chunk compression and sealing
// -----------------------------------------------------------------------------
void test_compression() {
    std::cout << "[TEST] chunk compression\n";
    std::vector<uint8_t> text;
    for (int i = 0; i < 200; i++)
        for (char c : std::string("exposure and pull "))
            text.push_back((uint8_t)c);
    std::vector<uint8_t> packed;
    TEST_CHECK(compress_chunk(text.data(), text.size(), packed));
    TEST_CHECK(packed.size() < text.size());
    std::vector<uint8_t> plain;
    TEST_CHECK(decompress_chunk(packed.data(), packed.size(), text.size(), plain));
    TEST_CHECK(plain == text);
    TEST_CHECK(!decompress_chunk(packed.data(), packed.size(), text.size() - 1, plain));

    auto noise = make_payload(4096, 77);
    TEST_CHECK(!compress_chunk(noise.data(), noise.size(), packed));
    std::cout << "[TEST] OK\n";
}

void test_sealing() {
    std::cout << "[TEST] chunk sealing\n";
    SodiumAead a;
    a.set_key(std::vector<uint8_t>(32, 0x11));
    auto chunk = make_payload(1000, 8);
    auto sealed = chunk;
    TEST_CHECK(a.encrypt(9, 4, sealed));
    TEST_CHECK(sealed.size() == chunk.size() + a.overhead());

    auto opened = sealed;
    TEST_CHECK(a.decrypt(9, 4, opened));
    TEST_CHECK(opened == chunk);

    // nonce is bound to the chunk index
    opened = sealed;
    TEST_CHECK(!a.decrypt(9, 5, opened));

    SodiumAead b;
    b.set_key({'p', 'a', 's', 's'});
    opened = sealed;
    TEST_CHECK(!b.decrypt(9, 4, opened));

    TEST_CHECK(random_session_id() != 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: chunk nonces do not depend on host byte order
// -----------------------------------------------------------------------------
void test_chunk_nonce_layout() {
    std::cout << "[TEST] chunk nonce layout\n";
    // BLAKE2b-192 over 01 02 03 04 00 00 00 05
    auto expected = hex_to_bytes("b61d7d9d6ded684e364ee09da7f1f4adf5d2ece42a7f4d69");
    ChunkNonce n = chunk_nonce(0x01020304u, 5);
    TEST_CHECK(expected.size() == n.size());
    TEST_CHECK(std::vector<uint8_t>(n.begin(), n.end()) == expected);
    TEST_CHECK(chunk_nonce(0x01020304u, 6) != n);
    TEST_CHECK(chunk_nonce(0x04030201u, 5) != n);
    std::cout << "[TEST] OK\n";
}

int main() {
    Context ctx;
    std::error_code ec;
    ctx.init(ec);
    TEST_CHECK(!ec);

    test_split_sizes();
    test_reassemble_roundtrip();
    test_reassemble_hash_mismatch();
    test_reassemble_requires_every_chunk();
    test_sha256_manifest();
    test_bitmap();
    test_compression();
    test_sealing();
    test_chunk_nonce_layout();
    std::cout << "\n[ALL CHUNK STORE TESTS PASSED]\n";
    return 0;
}
