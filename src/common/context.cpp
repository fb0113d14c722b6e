#include "context.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <lz4.h>
#include <sodium.h>

namespace rgtp {

Context::~Context() { cleanup(); }

void Context::init(std::error_code &ec) {
  if (initialized_) {
    ec.clear();
    return;
  }
  if (sodium_init() < 0) {
    Logger::instance().log(LogLevel::ERROR, "libsodium init failed");
    ec = make_error_code(errc::init_failure);
    return;
  }
  initialized_ = true;
  Logger::instance().log(LogLevel::DEBUG, "rgtp %s initialized",
                         version().c_str());
  ec.clear();
}

void Context::cleanup() {
  if (!initialized_)
    return;
  initialized_ = false;
  Logger::instance().log(LogLevel::DEBUG, "rgtp context released");
}

std::unique_ptr<DatagramTransport>
Context::create_socket(std::error_code &ec, Endpoint::Family family) {
  if (!initialized_) {
    ec = make_error_code(errc::init_failure);
    return nullptr;
  }
  std::unique_ptr<UdpTransport> t(new UdpTransport(family));
  t->open(ec);
  if (ec)
    return nullptr;
  return std::unique_ptr<DatagramTransport>(std::move(t));
}

std::string Context::version() { return "1.0.0"; }

std::string Context::build_info() {
  std::string s = "rgtp " + version();
  s += " (libsodium ";
  s += sodium_version_string();
  s += ", asio " + std::to_string(ASIO_VERSION / 100000) + "." +
       std::to_string(ASIO_VERSION / 100 % 1000) + "." +
       std::to_string(ASIO_VERSION % 100);
  s += ", lz4 ";
  s += LZ4_versionString();
  s += ")";
  return s;
}

void bind(DatagramTransport &transport, uint16_t port, std::error_code &ec) {
  transport.bind(port, ec);
}

} // namespace rgtp
