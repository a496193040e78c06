/**
 * PayloadSlicer - Cuts an encoded media buffer into frames that fit the MTU.
 */

#include "media/payload_slicer.h"

#include <algorithm>

PayloadSlicer::PayloadSlicer(VoipMessageType type, const PeerId& author)
    : type_(type), author_(author), max_payload_(max_payload_size(type, author)) {}

std::vector<std::vector<std::uint8_t>> PayloadSlicer::slice(
    const std::vector<std::uint8_t>& encoded) const {
    std::vector<std::vector<std::uint8_t>> slices;

    if (encoded.empty() || max_payload_ == 0) return slices;

    std::size_t total = (encoded.size() + max_payload_ - 1) / max_payload_;
    slices.reserve(total);

    for (std::size_t i = 0; i < total; ++i) {
        std::size_t offset = i * max_payload_;
        std::size_t len = std::min(max_payload_, encoded.size() - offset);
        slices.emplace_back(encoded.begin() + offset, encoded.begin() + offset + len);
    }

    return slices;
}

std::vector<VoipFrame> PayloadSlicer::frames(const std::vector<std::uint8_t>& encoded) const {
    std::vector<VoipFrame> out;
    for (auto& payload : slice(encoded)) {
        out.push_back(encode_frame(VoipHeader(type_, payload.size(), author_), payload));
    }
    return out;
}
