#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "identity/peer_id.h"
#include "packet/voip_packet.h"

/**
 * Cuts an encoded media buffer (the codec's output) into payloads small
 * enough that each framed message stays within kMtuMaxPacketSize.
 */
class PayloadSlicer {
public:
    PayloadSlicer(VoipMessageType type, const PeerId& author);

    /// Payload size limit for this type/author combination.
    [[nodiscard]] std::size_t max_payload() const { return max_payload_; }

    /// Consecutive slices, in order, each at most max_payload() bytes.
    [[nodiscard]] std::vector<std::vector<std::uint8_t>> slice(
        const std::vector<std::uint8_t>& encoded) const;

    /// slice() followed by encode_frame() for each slice.
    [[nodiscard]] std::vector<VoipFrame> frames(const std::vector<std::uint8_t>& encoded) const;

private:
    VoipMessageType type_;
    PeerId author_;
    std::size_t max_payload_;
};
