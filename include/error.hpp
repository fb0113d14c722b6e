#pragma once
#include <string>
#include <system_error>

namespace rgtp {

enum class errc {
    init_failure = 1,
    socket_create_failure,
    bind_failure,
    host_resolution_failure,
    transport_failure,
    expose_failure,
    pull_failure,
    timeout,
    checksum_mismatch,
    malformed_frame,
    closed_resource,
    cancelled,
    invalid_argument,
    buffer_too_small,
    decrypt_failure
};

const std::error_category& rgtp_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

// Human readable message for any error code, "success" for an empty one.
std::string error_string(const std::error_code& ec);

} // namespace rgtp

namespace std {
template <> struct is_error_code_enum<rgtp::errc> : true_type {};
} // namespace std
