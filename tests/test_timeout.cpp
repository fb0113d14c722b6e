#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "client.hpp"
#include "common/memory_transport.hpp"
#include "common/test_check.hpp"
#include "context.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "session.hpp"

using namespace rgtp;
using namespace std::chrono;

namespace {

TransportFactory memory_factory(std::shared_ptr<test::MemoryNetwork> net) {
    return [net](std::error_code& ec) {
        std::unique_ptr<DatagramTransport> t(new test::MemoryTransport(net));
        t->bind(0, ec);
        return t;
    };
}

} // namespace

// -----------------------------------------------------------------------------
// Test: a pull from a port nobody listens on ends with a timeout
// -----------------------------------------------------------------------------
void test_pull_nobody_listening(Context& ctx) {
    std::cout << "[TEST] timeout nobody listening\n";
    auto net = std::make_shared<test::MemoryNetwork>();
    Config cfg = default_config();
    cfg.timeout_ms = 1;

    std::vector<std::error_code> errors;
    cfg.on_error = [&](const std::error_code& ec, const std::string&) { errors.push_back(ec); };

    Client client(ctx, cfg, memory_factory(net));
    auto started = steady_clock::now();
    std::error_code ec;
    auto out = client.pull_data("127.0.0.1", 9, ec);
    auto elapsed = steady_clock::now() - started;

    TEST_CHECK(ec == errc::timeout);
    TEST_CHECK(out.empty());
    TEST_CHECK(client.state() == ClientState::TimedOut);
    TEST_CHECK(elapsed < seconds(2));
    TEST_CHECK(errors.size() == 1);
    TEST_CHECK(errors[0] == errc::timeout);
    TEST_CHECK(client.resume_state().empty());
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a puller that loses the exposer mid-transfer times out on inactivity
// -----------------------------------------------------------------------------
void test_pull_stalls(Context& ctx) {
    std::cout << "[TEST] timeout stalled exposer\n";
    auto net = std::make_shared<test::MemoryNetwork>();
    net->set_filter([&](const Endpoint&, const Endpoint&, const std::vector<uint8_t>& d) {
        Header h = test::peek_header(d);
        if (h.type == (uint8_t)PacketType::ChunkData && h.sequence >= 2)
            return test::Verdict::Drop;
        return test::Verdict::Deliver;
    });

    Config cfg = default_config();
    cfg.chunk_size = 1024;
    cfg.exposure_rate = 100000;
    cfg.timeout_ms = 400;
    cfg.max_attempts_per_chunk = 1000;
    cfg.congestion.initial_rto_ms = 100;
    cfg.congestion.min_rto_ms = 50;
    cfg.congestion.max_rto_ms = 200;

    Session session(ctx, cfg, std::unique_ptr<DatagramTransport>(new test::MemoryTransport(net)));
    std::error_code ec;
    session.expose_data(std::vector<uint8_t>(8 * 1024, 0x5a), ec);
    TEST_CHECK(!ec);

    Client client(ctx, cfg, memory_factory(net));
    auto started = steady_clock::now();
    auto out = client.pull_data("127.0.0.1", session.local_port(), ec);
    auto elapsed = steady_clock::now() - started;
    TEST_CHECK(ec == errc::timeout);
    TEST_CHECK(out.empty());
    TEST_CHECK(client.state() == ClientState::TimedOut);
    TEST_CHECK(elapsed >= milliseconds(400));
    TEST_CHECK(elapsed < seconds(5));

    PullState st = client.resume_state();
    TEST_CHECK(!st.empty());
    TEST_CHECK(st.bitmap.count() == 2);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: wait_complete gives up after its own timeout
// -----------------------------------------------------------------------------
void test_wait_complete_timeout(Context& ctx) {
    std::cout << "[TEST] timeout wait_complete\n";
    auto net = std::make_shared<test::MemoryNetwork>();
    Session session(ctx, default_config(),
                    std::unique_ptr<DatagramTransport>(new test::MemoryTransport(net)));
    std::error_code ec;
    session.expose_data(std::vector<uint8_t>(4096, 1), ec);
    TEST_CHECK(!ec);

    auto started = steady_clock::now();
    session.wait_complete(milliseconds(100), ec);
    TEST_CHECK(ec == errc::timeout);
    TEST_CHECK(steady_clock::now() - started >= milliseconds(100));
    TEST_CHECK(session.state() == SessionState::Exposing);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: cancel from another thread
// -----------------------------------------------------------------------------
void test_cancel(Context& ctx) {
    std::cout << "[TEST] timeout cancel\n";
    auto net = std::make_shared<test::MemoryNetwork>();
    Config cfg = default_config();
    cfg.timeout_ms = 60000;

    Client client(ctx, cfg, memory_factory(net));
    std::error_code pec;
    std::thread t([&]() { client.pull_data("127.0.0.1", 9, pec); });
    while (client.state() != ClientState::Pulling)
        std::this_thread::sleep_for(milliseconds(5));
    std::this_thread::sleep_for(milliseconds(50));
    auto started = steady_clock::now();
    client.cancel();
    t.join();
    TEST_CHECK(steady_clock::now() - started < seconds(2));
    TEST_CHECK(pec == errc::cancelled);
    TEST_CHECK(client.state() == ClientState::Failed);

    Session session(ctx, cfg, std::unique_ptr<DatagramTransport>(new test::MemoryTransport(net)));
    std::error_code ec;
    session.expose_data(std::vector<uint8_t>(2048, 7), ec);
    TEST_CHECK(!ec);
    std::error_code wec;
    std::thread w([&]() { session.wait_complete(wec); });
    std::this_thread::sleep_for(milliseconds(50));
    session.cancel();
    w.join();
    TEST_CHECK(wec == errc::cancelled);
    TEST_CHECK(session.state() == SessionState::Failed);
    std::cout << "[TEST] OK\n";
}

int main() {
    Logger::instance().set_level(LogLevel::WARN);
    Context ctx;
    std::error_code ec;
    ctx.init(ec);
    TEST_CHECK(!ec);

    test_pull_nobody_listening(ctx);
    test_pull_stalls(ctx);
    test_wait_complete_timeout(ctx);
    test_cancel(ctx);

    std::cout << "\n[ALL TIMEOUT TESTS PASSED]\n";
    return 0;
}
