/**
 * Transport error category.
 */

#include "network/transport_error.h"

namespace {

class TransportCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "silence.transport"; }

    std::string message(int ev) const override {
        switch (static_cast<transport_errc>(ev)) {
        case transport_errc::bind_failure:
            return "failed to bind local socket";
        case transport_errc::connect_failure:
            return "failed to connect to remote address";
        case transport_errc::encode_failure:
            return "failed to encode voip header";
        case transport_errc::oversize_frame:
            return "frame exceeds the maximum transmission unit";
        case transport_errc::decode_failure:
            return "failed to decode voip header";
        case transport_errc::truncated_frame:
            return "datagram shorter than its declared length";
        }
        return "unknown transport error";
    }
};

}  // namespace

const std::error_category& transport_category() noexcept {
    static const TransportCategory category;
    return category;
}

std::error_code make_error_code(transport_errc e) noexcept {
    return {static_cast<int>(e), transport_category()};
}

TransportError::TransportError(transport_errc kind, const std::error_code& cause,
                               const std::string& what)
    : std::system_error(make_error_code(kind), what + ": " + cause.message()),
      cause_(cause) {}
