#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "config.hpp"
#include "context.hpp"
#include "puller.hpp"
#include "stats.hpp"
#include "transport.hpp"

namespace rgtp {

enum class ClientState { Init, Pulling, Complete, TimedOut, Failed };

const char* to_string(ClientState s);

// Creates the transport for one pull; bound and ready to send.
using TransportFactory = std::function<std::unique_ptr<DatagramTransport>(std::error_code&)>;

// Pulls exposures on the calling thread. An unfinished pull is remembered and
// the next pull of the same exposure resumes it.
class Client {
public:
    Client(Context& ctx, Config cfg = default_config());
    Client(Context& ctx, Config cfg, TransportFactory factory);
    ~Client();
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // The file only appears once the pull completed and verified.
    void pull_to_file(const std::string& host, uint16_t port, const std::string& path,
                      std::error_code& ec);
    std::vector<uint8_t> pull_data(const std::string& host, uint16_t port,
                                   size_t capacity, std::error_code& ec);
    std::vector<uint8_t> pull_data(const std::string& host, uint16_t port,
                                   std::error_code& ec);
    // Pulls with an explicit starting state, updated in place on failure.
    std::vector<uint8_t> pull(const std::string& host, uint16_t port, PullState& resume,
                              size_t capacity, std::error_code& ec);

    PullState resume_state() const;
    Stats get_stats(std::error_code& ec) const;

    // Aborts a running pull from another thread.
    void cancel();
    void close();

    ClientState state() const;

private:
    void set_state(ClientState s);
    void notify_error(const std::error_code& ec, const std::string& message);

    Context& ctx_;
    Config cfg_;
    TransportFactory factory_;

    // held for the duration of a pull
    std::mutex op_mtx_;
    mutable std::mutex mtx_;
    ClientState state_{ClientState::Init};
    std::unique_ptr<DatagramTransport> transport_;
    std::unique_ptr<Puller> puller_;
    PullState resume_;
    std::atomic<bool> closed_{false};
    std::thread::id pull_thread_;
    std::recursive_mutex cb_mtx_;
};

// Pulls host:port into `path` with the default configuration.
void receive_file(Context& ctx, const std::string& host, uint16_t port,
                  const std::string& path, std::error_code& ec);

} // namespace rgtp
