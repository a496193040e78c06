#pragma once

#include <atomic>
#include <cstdint>

#include "network/peer_server.h"

/**
 * Relay policy running on top of a PeerServer.
 *
 * Every decoded message is re-framed and broadcast to the registered
 * clients. With register_on_first_message, the sender of the first valid
 * message from an address is added to the registry before the broadcast.
 * With drop_failed_peers, addresses whose send failed are removed.
 *
 * Runs entirely on the server's io_context; the node must outlive it.
 */
class RelayNode {
public:
    struct Options {
        bool register_on_first_message = true;
        bool drop_failed_peers = false;
    };

    RelayNode(PeerServer& server, Options options);

    RelayNode(const RelayNode&) = delete;
    RelayNode& operator=(const RelayNode&) = delete;

    /// Start consuming the server's inbound queue.
    void start();

    [[nodiscard]] std::uint64_t relayed() const { return relayed_.load(); }
    [[nodiscard]] bool running() const { return running_.load(); }

private:
    void do_next();
    void on_message(PeerServer::InboundMessage message);
    void on_broadcast_done(const PeerServer::BroadcastReport& report);

    PeerServer& server_;
    Options options_;
    std::atomic<std::uint64_t> relayed_{0};
    std::atomic<bool> running_{false};
};
