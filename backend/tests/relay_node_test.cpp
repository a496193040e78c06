#include <gtest/gtest.h>

#include <memory>

#include "node/relay_node.h"
#include "test_support.h"

using Endpoint = asio::ip::udp::endpoint;

class RelayNodeTest : public ::testing::Test {
protected:
    void TearDown() override {
        // Stop the relay while the io_context still runs its handlers.
        server_.shutdown();
        EXPECT_TRUE(wait_until([&] { return server_.stopped(); }));
        if (node_) {
            EXPECT_TRUE(wait_until([&] { return !node_->running(); }));
        }
    }

    RelayNode& start_relay(RelayNode::Options options = {}) {
        node_ = std::make_unique<RelayNode>(server_, options);
        server_.start();
        node_->start();
        return *node_;
    }

    Endpoint server_address() const { return loopback(server_.local_endpoint()); }

    asio::io_context io_;
    IoThread runner_{io_};
    PeerServer server_{io_, 0, asio::ip::udp::v4()};
    PeerId author_ = generate_peer_id();
    std::unique_ptr<RelayNode> node_;
};

TEST_F(RelayNodeTest, FirstMessageRegistersAndEchoes) {
    RelayNode& node = start_relay();

    RawPeer peer;
    const VoipFrame frame = make_voice_frame(author_, {1});
    peer.send_to(frame.bytes(), server_address());

    auto echoed = peer.receive();
    ASSERT_TRUE(echoed);
    EXPECT_EQ(*echoed, frame.bytes());
    EXPECT_TRUE(server_.registry()->contains(peer.endpoint()));
    EXPECT_TRUE(wait_until([&] { return node.relayed() == 1; }));

    // A second message does not register the address twice.
    peer.send_to(frame.bytes(), server_address());
    EXPECT_TRUE(peer.receive());
    EXPECT_EQ(server_.registry()->size(), 1u);
}

TEST_F(RelayNodeTest, RelaysBetweenPeers) {
    server_.set_broadcast_policy(PeerServer::BroadcastPolicy::exclude_origin);
    RelayNode& node = start_relay();

    RawPeer alice;
    RawPeer bob;
    alice.send_to(make_voice_frame(author_, {}).bytes(), server_address());
    ASSERT_TRUE(wait_until([&] { return node.relayed() == 1; }));
    bob.send_to(make_voice_frame(author_, {}).bytes(), server_address());
    ASSERT_TRUE(wait_until([&] { return node.relayed() == 2; }));

    // Bob's registration frame reached Alice only.
    EXPECT_TRUE(alice.receive());
    EXPECT_FALSE(bob.receive(100ms));

    const VoipFrame voice = make_voice_frame(author_, {5, 6, 7});
    alice.send_to(voice.bytes(), server_address());
    auto got = bob.receive();
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, voice.bytes());
    EXPECT_FALSE(alice.receive(100ms));
}

TEST_F(RelayNodeTest, DropsPeersWhoseSendFailed) {
    RelayNode::Options options;
    options.drop_failed_peers = true;
    const Endpoint unreachable(asio::ip::address_v4::loopback(), 0);
    server_.registry()->insert(unreachable);
    start_relay(options);

    RawPeer peer;
    peer.send_to(make_voice_frame(author_, {1}).bytes(), server_address());
    EXPECT_TRUE(peer.receive());
    EXPECT_TRUE(wait_until([&] { return !server_.registry()->contains(unreachable); }));
    EXPECT_TRUE(server_.registry()->contains(peer.endpoint()));
}

TEST_F(RelayNodeTest, RegistrationCanBeLeftToTheApplication) {
    RelayNode::Options options;
    options.register_on_first_message = false;
    RelayNode& node = start_relay(options);

    RawPeer peer;
    peer.send_to(make_voice_frame(author_, {1}).bytes(), server_address());
    ASSERT_TRUE(wait_until([&] { return node.relayed() == 1; }));
    EXPECT_EQ(server_.registry()->size(), 0u);
    EXPECT_FALSE(peer.receive(100ms));

    server_.registry()->insert(peer.endpoint());
    peer.send_to(make_voice_frame(author_, {2}).bytes(), server_address());
    EXPECT_TRUE(peer.receive());
}

TEST_F(RelayNodeTest, StopsWithTheServer) {
    RelayNode& node = start_relay();
    EXPECT_TRUE(node.running());

    server_.shutdown();
    EXPECT_TRUE(wait_until([&] { return !node.running(); }));
}
