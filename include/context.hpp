#pragma once
#include <memory>
#include <string>
#include <system_error>
#include "transport.hpp"

namespace rgtp {

// Process-wide library state. Construct one, init() it, and pass it to every
// Session and Client.
class Context {
public:
    Context() = default;
    ~Context();
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    void init(std::error_code& ec);
    // Safe to call more than once.
    void cleanup();
    bool initialized() const { return initialized_; }

    // Opened, unbound UDP socket.
    std::unique_ptr<DatagramTransport> create_socket(std::error_code& ec,
                                                     Endpoint::Family family = Endpoint::Family::V4);

    static std::string version();
    static std::string build_info();

private:
    bool initialized_{false};
};

// Raw primitive: binds `transport` to `port` (0 for an ephemeral port).
void bind(DatagramTransport& transport, uint16_t port, std::error_code& ec);

} // namespace rgtp
