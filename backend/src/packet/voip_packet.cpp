/**
 * VoipPacket - Wire framing for voice and video messages.
 *
 * Frame layout (one frame per datagram):
 *   [ length prefix : 8 bytes, big-endian ]
 *   [ MessagePack header : variable       ]
 *   [ payload : declared payload length   ]
 *
 * The header is encoded as [ { "<VoiceMessage|VideoMessage>": length }, bin(author) ].
 */

#include "packet/voip_packet.h"

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>

#include "network/transport_error.h"

using json = nlohmann::json;

namespace {

constexpr const char* kVoiceTag = "VoiceMessage";
constexpr const char* kVideoTag = "VideoMessage";

const char* tag_name(VoipMessageType type) {
    switch (type) {
    case VoipMessageType::voice:
        return kVoiceTag;
    case VoipMessageType::video:
        return kVideoTag;
    }
    return nullptr;
}

std::uint64_t read_be64(const std::uint8_t* data) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

void write_be64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (std::size_t i = kLengthPrefixSize; i-- > 0;) {
        out.push_back(static_cast<std::uint8_t>(value >> (i * 8)));
    }
}

json header_to_json(const char* tag, std::uint64_t payload_length, const PeerId& author) {
    json variant = json::object();
    variant[tag] = payload_length;
    return json::array({variant, json::binary(std::vector<std::uint8_t>(author.begin(), author.end()))});
}

}  // namespace

VoipHeader::VoipHeader(VoipMessageType type, std::uint64_t payload_length, const PeerId& author)
    : type_(type), payload_length_(payload_length), author_(author) {}

std::vector<std::uint8_t> VoipHeader::serialize(std::error_code& ec) const {
    const char* tag = tag_name(type_);
    if (tag == nullptr) {
        ec = transport_errc::encode_failure;
        return {};
    }
    ec.clear();
    return json::to_msgpack(header_to_json(tag, payload_length_, author_));
}

std::optional<VoipHeader> VoipHeader::deserialize(const std::uint8_t* data, std::size_t size,
                                                  std::size_t& header_size,
                                                  std::error_code& ec) {
    ec = transport_errc::decode_failure;

    // strict = false: the payload follows the header in the same buffer.
    json parsed = json::from_msgpack(data, data + size, false, false);
    if (parsed.is_discarded() || !parsed.is_array() || parsed.size() != 2) {
        return std::nullopt;
    }

    const json& variant = parsed[0];
    const json& author = parsed[1];
    if (!variant.is_object() || variant.size() != 1 || !author.is_binary() ||
        author.get_binary().size() != PeerId{}.size()) {
        return std::nullopt;
    }

    auto entry = variant.begin();
    VoipMessageType type;
    if (entry.key() == kVoiceTag) {
        type = VoipMessageType::voice;
    } else if (entry.key() == kVideoTag) {
        type = VoipMessageType::video;
    } else {
        return std::nullopt;
    }
    if (!entry.value().is_number_unsigned()) {
        return std::nullopt;
    }

    PeerId id{};
    std::copy(author.get_binary().begin(), author.get_binary().end(), id.begin());

    VoipHeader header(type, entry.value().get<std::uint64_t>(), id);

    // The encoding is canonical, so its length is what the sender wrote.
    header_size = json::to_msgpack(parsed).size();
    if (header_size > size) {
        return std::nullopt;
    }

    ec.clear();
    return header;
}

bool VoipHeader::operator==(const VoipHeader& other) const {
    return type_ == other.type_ && payload_length_ == other.payload_length_ &&
           author_ == other.author_;
}

VoipFrame encode_frame(const VoipHeader& header, const std::vector<std::uint8_t>& payload,
                       std::error_code& ec) {
    if (header.payload_length() != payload.size()) {
        ec = transport_errc::encode_failure;
        return {};
    }

    std::vector<std::uint8_t> serialized = header.serialize(ec);
    if (ec) {
        return {};
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(kLengthPrefixSize + serialized.size() + payload.size());
    write_be64(buffer, serialized.size() + payload.size());
    buffer.insert(buffer.end(), serialized.begin(), serialized.end());
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return VoipFrame(std::move(buffer));
}

VoipFrame encode_frame(const VoipHeader& header, const std::vector<std::uint8_t>& payload) {
    std::error_code ec;
    VoipFrame frame = encode_frame(header, payload, ec);
    if (ec) {
        throw std::system_error(ec, "encode_frame");
    }
    return frame;
}

std::optional<VoipMessage> decode_frame(const std::uint8_t* data, std::size_t size,
                                        std::error_code& ec) {
    if (size < kLengthPrefixSize) {
        ec = transport_errc::truncated_frame;
        return std::nullopt;
    }
    if (size > kMtuMaxPacketSize) {
        ec = transport_errc::oversize_frame;
        return std::nullopt;
    }

    std::uint64_t body_length = read_be64(data);
    if (body_length > kMtuMaxPacketSize) {
        ec = transport_errc::oversize_frame;
        return std::nullopt;
    }
    if (body_length > size - kLengthPrefixSize) {
        ec = transport_errc::truncated_frame;
        return std::nullopt;
    }

    const std::uint8_t* body = data + kLengthPrefixSize;
    std::size_t header_size = 0;
    std::optional<VoipHeader> header =
        VoipHeader::deserialize(body, static_cast<std::size_t>(body_length), header_size, ec);
    if (!header) {
        return std::nullopt;
    }

    std::size_t remaining = static_cast<std::size_t>(body_length) - header_size;
    if (header->payload_length() > remaining) {
        ec = transport_errc::truncated_frame;
        return std::nullopt;
    }
    if (header->payload_length() < remaining) {
        // length prefix and declared payload length disagree
        ec = transport_errc::decode_failure;
        return std::nullopt;
    }

    const std::uint8_t* payload = body + header_size;
    VoipMessage message{*header, std::vector<std::uint8_t>(payload, payload + remaining)};
    ec.clear();
    return message;
}

std::size_t max_payload_size(VoipMessageType type, const PeerId& author) {
    const char* tag = tag_name(type);
    if (tag == nullptr) {
        return 0;
    }

    auto header_size = [&](std::uint64_t length) {
        return json::to_msgpack(header_to_json(tag, length, author)).size();
    };

    std::size_t budget = kMtuMaxPacketSize - kLengthPrefixSize;
    std::size_t length = budget - header_size(0);
    // Larger lengths take more bytes to encode; shrink until the frame fits.
    while (length > 0 && header_size(length) + length > budget) {
        --length;
    }
    return length;
}
