#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>

namespace rgtp {

struct Endpoint {
    enum class Family : uint8_t { V4, V6 };
    std::string address;
    uint16_t port{0};
    Family family{Family::V4};

    std::string to_string() const;
};

bool operator==(const Endpoint& a, const Endpoint& b);
bool operator!=(const Endpoint& a, const Endpoint& b);
bool operator<(const Endpoint& a, const Endpoint& b);

// Connectionless endpoint. Engines only talk to the network through this.
class DatagramTransport {
public:
    virtual ~DatagramTransport() = default;
    virtual void bind(uint16_t port, std::error_code& ec) = 0;
    virtual uint16_t local_port() const = 0;
    // host_resolution_failure is kept apart from transport errors.
    virtual Endpoint resolve(const std::string& host, uint16_t port, std::error_code& ec) = 0;
    virtual void send_to(const uint8_t* data, size_t len, const Endpoint& to,
                         std::error_code& ec) = 0;
    // Writes at most `cap` bytes. Reports errc::timeout when nothing arrived
    // and errc::cancelled once cancel() was called.
    virtual size_t receive_from(uint8_t* buf, size_t cap, Endpoint& from,
                                std::chrono::milliseconds timeout, std::error_code& ec) = 0;
    // Safe from any thread; wakes a blocked receive_from. Sticky.
    virtual void cancel() = 0;
    virtual void close() = 0;
    virtual size_t max_datagram_size() const = 0;
};

class UdpTransport : public DatagramTransport {
public:
    using udp = asio::ip::udp;
    explicit UdpTransport(Endpoint::Family family = Endpoint::Family::V4);
    ~UdpTransport() override;

    void open(std::error_code& ec);
    void bind(uint16_t port, std::error_code& ec) override;
    uint16_t local_port() const override;
    Endpoint resolve(const std::string& host, uint16_t port, std::error_code& ec) override;
    void send_to(const uint8_t* data, size_t len, const Endpoint& to,
                 std::error_code& ec) override;
    size_t receive_from(uint8_t* buf, size_t cap, Endpoint& from,
                        std::chrono::milliseconds timeout, std::error_code& ec) override;
    void cancel() override;
    void close() override;
    size_t max_datagram_size() const override;

private:
    asio::io_context io_;
    udp::socket sock_;
    Endpoint::Family family_;
    std::atomic<bool> cancelled_{false};
};

} // namespace rgtp
