#include "transport.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <tuple>

namespace rgtp {

static Endpoint to_endpoint(const asio::ip::udp::endpoint &ep) {
  Endpoint out;
  asio::ip::address addr = ep.address();
  if (addr.is_v6() && addr.to_v6().is_v4_mapped())
    addr = asio::ip::make_address_v4(asio::ip::v4_mapped, addr.to_v6());
  out.address = addr.to_string();
  out.port = ep.port();
  out.family = addr.is_v6() ? Endpoint::Family::V6 : Endpoint::Family::V4;
  return out;
}

std::string Endpoint::to_string() const {
  if (family == Family::V6)
    return "[" + address + "]:" + std::to_string(port);
  return address + ":" + std::to_string(port);
}

bool operator==(const Endpoint &a, const Endpoint &b) {
  return a.family == b.family && a.port == b.port && a.address == b.address;
}

bool operator!=(const Endpoint &a, const Endpoint &b) { return !(a == b); }

bool operator<(const Endpoint &a, const Endpoint &b) {
  return std::tie(a.family, a.address, a.port) <
         std::tie(b.family, b.address, b.port);
}

UdpTransport::UdpTransport(Endpoint::Family family)
    : sock_(io_), family_(family) {}

UdpTransport::~UdpTransport() { close(); }

void UdpTransport::open(std::error_code &ec) {
  sock_.open(family_ == Endpoint::Family::V6 ? udp::v6() : udp::v4(), ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "socket open failed: %s",
                           ec.message().c_str());
    ec = make_error_code(errc::socket_create_failure);
    return;
  }
  std::error_code ig;
  sock_.set_option(asio::socket_base::reuse_address(true), ig);
  // large buffers keep bursts of chunk datagrams from overflowing
  sock_.set_option(asio::socket_base::receive_buffer_size(2 * 1024 * 1024), ig);
  sock_.set_option(asio::socket_base::send_buffer_size(2 * 1024 * 1024), ig);
}

void UdpTransport::bind(uint16_t port, std::error_code &ec) {
  if (!sock_.is_open()) {
    open(ec);
    if (ec)
      return;
  }
  udp::endpoint ep(family_ == Endpoint::Family::V6 ? udp::v6() : udp::v4(),
                   port);
  sock_.bind(ep, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "bind to port %u failed: %s",
                           (unsigned)port, ec.message().c_str());
    ec = make_error_code(errc::bind_failure);
    return;
  }
  ec.clear();
}

uint16_t UdpTransport::local_port() const {
  std::error_code ec;
  auto ep = sock_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

Endpoint UdpTransport::resolve(const std::string &host, uint16_t port,
                               std::error_code &ec) {
  if (host.empty()) {
    ec = make_error_code(errc::host_resolution_failure);
    return Endpoint{};
  }
  udp::resolver resolver(io_);
  auto results = resolver.resolve(host, std::to_string(port), ec);
  if (ec || results.empty()) {
    Logger::instance().log(LogLevel::WARN, "resolve %s failed: %s",
                           host.c_str(),
                           ec ? ec.message().c_str() : "no results");
    ec = make_error_code(errc::host_resolution_failure);
    return Endpoint{};
  }
  bool want_v6 = family_ == Endpoint::Family::V6;
  for (const auto &r : results) {
    if (r.endpoint().address().is_v6() == want_v6) {
      ec.clear();
      return to_endpoint(r.endpoint());
    }
  }
  ec.clear();
  return to_endpoint(results.begin()->endpoint());
}

void UdpTransport::send_to(const uint8_t *data, size_t len, const Endpoint &to,
                           std::error_code &ec) {
  if (cancelled_) {
    ec = make_error_code(errc::cancelled);
    return;
  }
  if (!sock_.is_open()) {
    open(ec);
    if (ec)
      return;
  }
  asio::ip::address addr = asio::ip::make_address(to.address, ec);
  if (ec) {
    ec = make_error_code(errc::invalid_argument);
    return;
  }
  sock_.send_to(asio::buffer(data, len), udp::endpoint(addr, to.port), 0, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "send to %s failed: %s",
                           to.to_string().c_str(), ec.message().c_str());
    ec = make_error_code(errc::transport_failure);
    return;
  }
  ec.clear();
}

size_t UdpTransport::receive_from(uint8_t *buf, size_t cap, Endpoint &from,
                                  std::chrono::milliseconds timeout,
                                  std::error_code &ec) {
  if (cancelled_) {
    ec = make_error_code(errc::cancelled);
    return 0;
  }
  if (!sock_.is_open()) {
    ec = make_error_code(errc::closed_resource);
    return 0;
  }
  std::error_code rec_ec = asio::error::would_block;
  size_t n = 0;
  udp::endpoint sender;
  sock_.async_receive_from(asio::buffer(buf, cap), sender,
                           [&](const std::error_code &e, std::size_t len) {
                             rec_ec = e;
                             n = len;
                           });
  io_.restart();
  io_.run_for(timeout);
  if (!io_.stopped()) {
    std::error_code ig;
    sock_.cancel(ig);
    io_.run();
  }
  if (cancelled_) {
    ec = make_error_code(errc::cancelled);
    return 0;
  }
  if (rec_ec == asio::error::operation_aborted ||
      rec_ec == asio::error::would_block) {
    ec = make_error_code(errc::timeout);
    return 0;
  }
  if (rec_ec == asio::error::connection_refused ||
      rec_ec == asio::error::connection_reset) {
    // ICMP unreachable surfaced on a connectionless socket
    Logger::instance().log(LogLevel::TRACE, "ignoring %s",
                           rec_ec.message().c_str());
    ec = make_error_code(errc::timeout);
    return 0;
  }
  if (rec_ec) {
    Logger::instance().log(LogLevel::WARN, "receive failed: %s",
                           rec_ec.message().c_str());
    ec = make_error_code(errc::transport_failure);
    return 0;
  }
  from = to_endpoint(sender);
  ec.clear();
  return n;
}

void UdpTransport::cancel() {
  cancelled_ = true;
  asio::post(io_, [this]() {
    std::error_code ig;
    sock_.cancel(ig);
  });
}

void UdpTransport::close() {
  std::error_code ig;
  if (sock_.is_open())
    sock_.close(ig);
}

size_t UdpTransport::max_datagram_size() const {
  return family_ == Endpoint::Family::V6 ? 65527 : 65507;
}

} // namespace rgtp
