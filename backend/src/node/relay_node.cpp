/**
 * RelayNode - Server-side session logic.
 *
 * Owns no sockets: it reads from the PeerServer inbound queue, decides who
 * is registered, and hands frames back to the server for broadcast. The
 * next inbound message is only read once the broadcast request is queued.
 */

#include "node/relay_node.h"

#include <spdlog/spdlog.h>

RelayNode::RelayNode(PeerServer& server, Options options)
    : server_(server), options_(options) {}

void RelayNode::start() {
    if (running_.exchange(true)) {
        return;
    }
    do_next();
}

void RelayNode::do_next() {
    server_.async_dequeue_inbound(
        [this](const asio::error_code& ec, PeerServer::InboundMessage message) {
            if (ec) {
                spdlog::info("Relay stopped: {}", ec.message());
                running_.store(false);
                return;
            }
            on_message(std::move(message));
        });
}

void RelayNode::on_message(PeerServer::InboundMessage message) {
    auto registry = server_.registry();
    if (options_.register_on_first_message && registry->insert(message.sender)) {
        spdlog::info("Registered peer {} ({}), {} clients", format_endpoint(message.sender),
                     format_peer_id(message.header.author()), registry->size());
    }

    std::error_code ec;
    VoipFrame frame = encode_frame(message.header, message.payload, ec);
    if (ec) {
        spdlog::error("Cannot re-frame message from {}: {}", format_endpoint(message.sender),
                      ec.message());
        do_next();
        return;
    }

    PeerServer::BroadcastRequest request{
        std::move(frame), message.sender,
        [this](const PeerServer::BroadcastReport& report) { on_broadcast_done(report); }};

    server_.async_broadcast(std::move(request), [this](const asio::error_code& send_ec) {
        if (send_ec) {
            spdlog::info("Relay stopped: {}", send_ec.message());
            running_.store(false);
            return;
        }
        ++relayed_;
        do_next();
    });
}

void RelayNode::on_broadcast_done(const PeerServer::BroadcastReport& report) {
    if (!options_.drop_failed_peers) {
        return;
    }
    auto registry = server_.registry();
    for (const auto& failure : report.failed) {
        if (registry->remove(failure.first)) {
            spdlog::warn("Dropped peer {}: {}", format_endpoint(failure.first),
                         failure.second.message());
        }
    }
}
