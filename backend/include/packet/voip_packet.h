#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "identity/peer_id.h"

/// Maximum size of a frame on the wire, chosen so datagrams are not fragmented.
constexpr std::size_t kMtuMaxPacketSize = 1300;

/// Size of the big-endian length prefix that starts every frame.
constexpr std::size_t kLengthPrefixSize = 8;

enum class VoipMessageType : std::uint8_t {
    voice,
    video,
};

/**
 * Header describing one voip message: what kind of media it carries,
 * how many payload bytes follow it, and which peer produced it.
 */
class VoipHeader {
public:
    VoipHeader() = default;
    VoipHeader(VoipMessageType type, std::uint64_t payload_length, const PeerId& author);

    [[nodiscard]] VoipMessageType message_type() const { return type_; }
    [[nodiscard]] std::uint64_t payload_length() const { return payload_length_; }
    [[nodiscard]] const PeerId& author() const { return author_; }

    /// MessagePack encoding of this header; empty with ec set on failure.
    std::vector<std::uint8_t> serialize(std::error_code& ec) const;

    /// Parse a header from the front of [data, data + size). Trailing bytes are ignored.
    /// On success, header_size receives the length of the canonical encoding.
    static std::optional<VoipHeader> deserialize(const std::uint8_t* data, std::size_t size,
                                                 std::size_t& header_size,
                                                 std::error_code& ec);

    bool operator==(const VoipHeader& other) const;
    bool operator!=(const VoipHeader& other) const { return !(*this == other); }

private:
    VoipMessageType type_ = VoipMessageType::voice;
    std::uint64_t payload_length_ = 0;
    PeerId author_{};
};

/**
 * A fully framed message: length prefix, serialized header and payload,
 * ready to be written as a single datagram.
 */
class VoipFrame {
public:
    VoipFrame() = default;
    explicit VoipFrame(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const { return bytes_; }
    [[nodiscard]] std::size_t size() const { return bytes_.size(); }
    [[nodiscard]] bool fits_mtu() const { return bytes_.size() <= kMtuMaxPacketSize; }

private:
    std::vector<std::uint8_t> bytes_;
};

/// A header together with the payload bytes it describes.
struct VoipMessage {
    VoipHeader header;
    std::vector<std::uint8_t> payload;
};

/**
 * Build the frame for header + payload.
 * The header's declared payload length must match payload.size().
 * The MTU is not enforced here; check VoipFrame::fits_mtu() before sending.
 */
VoipFrame encode_frame(const VoipHeader& header, const std::vector<std::uint8_t>& payload,
                       std::error_code& ec);
VoipFrame encode_frame(const VoipHeader& header, const std::vector<std::uint8_t>& payload);

/**
 * Parse one complete datagram. Errors: transport_errc::truncated_frame,
 * transport_errc::oversize_frame, transport_errc::decode_failure.
 */
std::optional<VoipMessage> decode_frame(const std::uint8_t* data, std::size_t size,
                                        std::error_code& ec);

/// Largest payload that keeps a frame with this header's author and type within the MTU.
std::size_t max_payload_size(VoipMessageType type, const PeerId& author);
