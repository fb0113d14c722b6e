#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "config.hpp"
#include "context.hpp"
#include "exposer.hpp"
#include "stats.hpp"
#include "transport.hpp"

namespace rgtp {

enum class SessionState { Init, Exposing, Complete, Failed };

const char* to_string(SessionState s);

// Exposes one payload and serves pullers from a worker thread until closed.
// Complete is reached when the first puller has been sent every chunk; the
// session keeps serving late pullers afterwards.
class Session {
public:
    Session(Context& ctx, Config cfg = default_config());
    // Uses `transport` instead of a UDP socket from the context.
    Session(Context& ctx, Config cfg, std::unique_ptr<DatagramTransport> transport);
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void expose_data(std::vector<uint8_t> data, std::error_code& ec);
    void expose_file(const std::string& path, std::error_code& ec);

    // errc::timeout when the exposure is still running after `timeout`.
    void wait_complete(std::chrono::milliseconds timeout, std::error_code& ec);
    void wait_complete(std::error_code& ec);

    Stats get_stats(std::error_code& ec) const;

    // Queues a push-style start towards host:port.
    void announce(const std::string& host, uint16_t port, std::error_code& ec);

    // Stops serving; the session ends up Failed unless it already completed.
    void cancel();
    // Stops serving, releases the socket and silences callbacks.
    void close();

    SessionState state() const;
    uint16_t local_port() const;
    uint32_t session_id() const;
    Manifest manifest() const;

private:
    void run();
    void stop_worker(bool cancel_transport);
    void set_state(SessionState s, std::error_code ec = std::error_code());
    void notify_progress();
    void notify_error(const std::error_code& ec, const std::string& message);

    Context& ctx_;
    Config cfg_;
    std::unique_ptr<DatagramTransport> transport_;
    std::unique_ptr<Exposer> exposer_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> closed_{false};

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    SessionState state_{SessionState::Init};
    std::error_code failure_;
    std::vector<Endpoint> announce_q_;

    std::recursive_mutex cb_mtx_;
    uint64_t reported_bytes_{0};
};

// Exposes a file on `port` and blocks until the first puller completes or
// `timeout` runs out.
void send_file(Context& ctx, const std::string& path, uint16_t port,
               std::chrono::milliseconds timeout, std::error_code& ec);

} // namespace rgtp
