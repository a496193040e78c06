/**
 * PeerId - Random identifiers for peers taking part in a session.
 */

#include "identity/peer_id.h"

#include <mutex>
#include <random>

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_dash_position(std::size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

PeerId generate_peer_id() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    PeerId id{};
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        for (std::size_t i = 0; i < id.size(); i += 8) {
            std::uint64_t bits = rng();
            for (std::size_t b = 0; b < 8; ++b) {
                id[i + b] = static_cast<std::uint8_t>(bits >> (b * 8));
            }
        }
    }

    id[6] = static_cast<std::uint8_t>((id[6] & 0x0F) | 0x40);  // version 4
    id[8] = static_cast<std::uint8_t>((id[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return id;
}

std::string format_peer_id(const PeerId& id) {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHexDigits[id[i] >> 4]);
        out.push_back(kHexDigits[id[i] & 0x0F]);
    }
    return out;
}

std::optional<PeerId> parse_peer_id(const std::string& text) {
    if (text.size() != 36) return std::nullopt;

    PeerId id{};
    std::size_t byte = 0;
    for (std::size_t i = 0; i < text.size();) {
        if (is_dash_position(i)) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        id[byte++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}
