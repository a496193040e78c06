#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

/// 128-bit peer identifier in RFC 4122 byte order.
using PeerId = std::array<std::uint8_t, 16>;

/// Generate a random (version 4) identifier.
PeerId generate_peer_id();

/// Canonical lowercase 8-4-4-4-12 form.
std::string format_peer_id(const PeerId& id);

/// Parse the 8-4-4-4-12 form; std::nullopt if malformed.
std::optional<PeerId> parse_peer_id(const std::string& text);
