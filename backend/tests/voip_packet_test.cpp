#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "network/transport_error.h"
#include "packet/voip_packet.h"

namespace {

PeerId test_author() {
    PeerId id{};
    for (std::size_t i = 0; i < id.size(); ++i) id[i] = static_cast<std::uint8_t>(0xA0 + i);
    return id;
}

std::uint64_t length_prefix(const VoipFrame& frame) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) value = (value << 8) | frame.bytes()[i];
    return value;
}

void set_length_prefix(std::vector<std::uint8_t>& bytes, std::uint64_t value) {
    for (std::size_t i = 0; i < kLengthPrefixSize; ++i) {
        bytes[kLengthPrefixSize - 1 - i] = static_cast<std::uint8_t>(value >> (i * 8));
    }
}

}  // namespace

TEST(VoipPacketTest, VoiceMessageRoundTrip) {
    VoipHeader header(VoipMessageType::voice, 3, test_author());
    VoipFrame frame = encode_frame(header, {1, 2, 3});

    std::error_code ec;
    auto decoded = decode_frame(frame.bytes().data(), frame.size(), ec);
    ASSERT_TRUE(decoded) << ec.message();
    EXPECT_FALSE(ec);
    EXPECT_EQ(decoded->header, header);
    EXPECT_EQ(decoded->payload, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST(VoipPacketTest, LargestVideoPayloadRoundTrips) {
    const PeerId author = test_author();
    const std::size_t max = max_payload_size(VoipMessageType::video, author);
    ASSERT_GT(max, 1200u);

    std::vector<std::uint8_t> payload(max, 0x5A);
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::video, max, author), payload);
    EXPECT_TRUE(frame.fits_mtu());

    std::error_code ec;
    auto decoded = decode_frame(frame.bytes().data(), frame.size(), ec);
    ASSERT_TRUE(decoded) << ec.message();
    EXPECT_EQ(decoded->header.message_type(), VoipMessageType::video);
    EXPECT_EQ(decoded->header.payload_length(), max);
    EXPECT_EQ(decoded->payload, payload);

    payload.push_back(0x5A);
    VoipFrame too_big = encode_frame(VoipHeader(VoipMessageType::video, max + 1, author), payload);
    EXPECT_FALSE(too_big.fits_mtu());
}

TEST(VoipPacketTest, LengthPrefixCoversHeaderAndPayload) {
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 4, test_author()),
                                   {9, 9, 9, 9});
    EXPECT_EQ(length_prefix(frame), frame.size() - kLengthPrefixSize);
}

TEST(VoipPacketTest, HeaderUsesCanonicalMessagePackLayout) {
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 1, PeerId{}), {1});

    std::vector<std::uint8_t> expected = {0, 0, 0, 0, 0, 0, 0, 35,  // length prefix
                                          0x92,                      // array(2)
                                          0x81,                      // map(1)
                                          0xAC};                     // str(12)
    const std::string tag = "VoiceMessage";
    expected.insert(expected.end(), tag.begin(), tag.end());
    expected.push_back(0x01);        // payload length
    expected.push_back(0xC4);        // bin8
    expected.push_back(0x10);        // 16 bytes
    expected.insert(expected.end(), 16, 0x00);
    expected.push_back(0x01);        // payload

    EXPECT_EQ(frame.bytes(), expected);
}

TEST(VoipPacketTest, OversizeFrameIsDetectableBeforeSending) {
    std::vector<std::uint8_t> payload(kMtuMaxPacketSize, 0);
    VoipFrame frame =
        encode_frame(VoipHeader(VoipMessageType::voice, payload.size(), test_author()), payload);
    EXPECT_GT(frame.size(), kMtuMaxPacketSize);
    EXPECT_FALSE(frame.fits_mtu());
}

TEST(VoipPacketTest, EncodeRejectsMismatchedPayloadLength) {
    std::error_code ec;
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 5, test_author()), {1, 2}, ec);
    EXPECT_EQ(ec, transport_errc::encode_failure);
    EXPECT_EQ(frame.size(), 0u);
}

TEST(VoipPacketTest, EncodeRejectsUnknownMessageType) {
    VoipHeader header(static_cast<VoipMessageType>(9), 0, test_author());

    std::error_code ec;
    encode_frame(header, {}, ec);
    EXPECT_EQ(ec, transport_errc::encode_failure);

    EXPECT_THROW(encode_frame(header, {}), std::system_error);
}

TEST(VoipPacketTest, DecodeRejectsDatagramShorterThanPrefix) {
    std::vector<std::uint8_t> bytes = {0, 0, 0, 1};
    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::truncated_frame);
}

TEST(VoipPacketTest, DecodeRejectsOversizeLengthPrefix) {
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 1, test_author()), {7});
    std::vector<std::uint8_t> bytes = frame.bytes();
    set_length_prefix(bytes, 5000);

    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::oversize_frame);
}

TEST(VoipPacketTest, DecodeRejectsOversizeDatagram) {
    std::vector<std::uint8_t> bytes(kMtuMaxPacketSize + 100, 0);
    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::oversize_frame);
}

TEST(VoipPacketTest, DecodeRejectsGarbageHeader) {
    std::vector<std::uint8_t> bytes = {0, 0, 0, 0, 0, 0, 0, 4, 0xC1, 0xC1, 0xC1, 0xC1};
    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::decode_failure);
}

TEST(VoipPacketTest, DecodeRejectsUnknownTag) {
    const PeerId author = test_author();
    nlohmann::json variant;
    variant["AudioMessage"] = 1;
    auto header = nlohmann::json::to_msgpack(nlohmann::json::array(
        {variant, nlohmann::json::binary(std::vector<std::uint8_t>(author.begin(), author.end()))}));

    std::vector<std::uint8_t> bytes(kLengthPrefixSize, 0);
    bytes.insert(bytes.end(), header.begin(), header.end());
    bytes.push_back(1);
    set_length_prefix(bytes, header.size() + 1);

    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::decode_failure);
}

TEST(VoipPacketTest, DecodeRejectsDatagramShorterThanLengthPrefix) {
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 10, test_author()),
                                   std::vector<std::uint8_t>(10, 3));
    std::vector<std::uint8_t> bytes = frame.bytes();
    bytes.resize(bytes.size() - 4);

    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::truncated_frame);
}

TEST(VoipPacketTest, DecodeRejectsPayloadShorterThanDeclared) {
    VoipFrame frame = encode_frame(VoipHeader(VoipMessageType::voice, 10, test_author()),
                                   std::vector<std::uint8_t>(10, 3));
    std::vector<std::uint8_t> bytes = frame.bytes();
    bytes.resize(bytes.size() - 4);
    set_length_prefix(bytes, bytes.size() - kLengthPrefixSize);

    std::error_code ec;
    EXPECT_FALSE(decode_frame(bytes.data(), bytes.size(), ec));
    EXPECT_EQ(ec, transport_errc::truncated_frame);
}

TEST(VoipPacketTest, HeaderDeserializeReportsCanonicalSize) {
    VoipHeader header(VoipMessageType::video, 300, test_author());
    std::error_code ec;
    std::vector<std::uint8_t> bytes = header.serialize(ec);
    ASSERT_FALSE(ec);
    const std::size_t encoded_size = bytes.size();
    bytes.insert(bytes.end(), {1, 2, 3});

    std::size_t header_size = 0;
    auto parsed = VoipHeader::deserialize(bytes.data(), bytes.size(), header_size, ec);
    ASSERT_TRUE(parsed) << ec.message();
    EXPECT_EQ(*parsed, header);
    EXPECT_EQ(header_size, encoded_size);
}
