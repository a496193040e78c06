#include <gtest/gtest.h>

#include "identity/peer_id.h"

TEST(PeerIdTest, GeneratedIdsAreVersionFourAndDistinct) {
    PeerId a = generate_peer_id();
    PeerId b = generate_peer_id();
    EXPECT_NE(a, b);
    EXPECT_EQ(a[6] >> 4, 4);
    EXPECT_EQ(a[8] & 0xC0, 0x80);
}

TEST(PeerIdTest, FormatAndParseAgree) {
    PeerId id = generate_peer_id();
    std::string text = format_peer_id(id);
    EXPECT_EQ(text.size(), 36u);
    EXPECT_EQ(text[8], '-');

    auto parsed = parse_peer_id(text);
    ASSERT_TRUE(parsed);
    EXPECT_EQ(*parsed, id);
}

TEST(PeerIdTest, ParsesUppercase) {
    auto parsed = parse_peer_id("67E55044-10B1-426F-9247-BB680E5FE0C8");
    ASSERT_TRUE(parsed);
    EXPECT_EQ((*parsed)[0], 0x67);
    EXPECT_EQ((*parsed)[15], 0xC8);
    EXPECT_EQ(format_peer_id(*parsed), "67e55044-10b1-426f-9247-bb680e5fe0c8");
}

TEST(PeerIdTest, RejectsMalformedText) {
    EXPECT_FALSE(parse_peer_id(""));
    EXPECT_FALSE(parse_peer_id("67e55044-10b1-426f-9247-bb680e5fe0c"));
    EXPECT_FALSE(parse_peer_id("67e55044x10b1-426f-9247-bb680e5fe0c8"));
    EXPECT_FALSE(parse_peer_id("67e55044-10b1-426f-9247-bb680e5fe0cz"));
}
