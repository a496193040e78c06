#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

/**
 * Error kinds reported by the packet codec and the UDP transports.
 *
 * Values live in the "silence.transport" category so callers can compare
 * a std::error_code against the enumerators directly.
 */
enum class transport_errc {
    bind_failure = 1,
    connect_failure,
    encode_failure,
    oversize_frame,
    decode_failure,
    truncated_frame,
};

const std::error_category& transport_category() noexcept;

std::error_code make_error_code(transport_errc e) noexcept;

namespace std {
template <>
struct is_error_code_enum<transport_errc> : true_type {};
}  // namespace std

/**
 * Thrown when a transport cannot be constructed (bind, resolve or connect).
 * Carries the transport-level kind as its code and the OS error as cause().
 */
class TransportError : public std::system_error {
public:
    TransportError(transport_errc kind, const std::error_code& cause,
                   const std::string& what);

    [[nodiscard]] const std::error_code& cause() const noexcept { return cause_; }

private:
    std::error_code cause_;
};
