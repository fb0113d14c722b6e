#include "error.hpp"

namespace rgtp {

namespace {

class RgtpCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "rgtp"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::init_failure:
      return "process context initialization failed";
    case errc::socket_create_failure:
      return "failed to create datagram socket";
    case errc::bind_failure:
      return "failed to bind datagram socket";
    case errc::host_resolution_failure:
      return "host name could not be resolved";
    case errc::transport_failure:
      return "datagram transport error";
    case errc::expose_failure:
      return "exposure failed";
    case errc::pull_failure:
      return "pull failed";
    case errc::timeout:
      return "operation timed out";
    case errc::checksum_mismatch:
      return "checksum mismatch";
    case errc::malformed_frame:
      return "malformed frame";
    case errc::closed_resource:
      return "operation on a closed session or client";
    case errc::cancelled:
      return "operation cancelled";
    case errc::invalid_argument:
      return "invalid argument";
    case errc::buffer_too_small:
      return "destination buffer too small for exposed payload";
    case errc::decrypt_failure:
      return "chunk decryption failed";
    }
    return "unknown rgtp error";
  }
};

} // namespace

const std::error_category &rgtp_category() noexcept {
  static RgtpCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) noexcept {
  return std::error_code(static_cast<int>(e), rgtp_category());
}

std::string error_string(const std::error_code &ec) {
  if (!ec)
    return "success";
  return ec.message();
}

} // namespace rgtp
