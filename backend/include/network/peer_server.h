#pragma once

#include <asio.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include "network/client_registry.h"
#include "network/peer_client.h"
#include "packet/voip_packet.h"

/**
 * UDP relay server: receives voip frames from any peer and broadcasts
 * frames to every address in its ClientRegistry.
 *
 * Who gets registered is the application's decision; the server only
 * exposes the registry. A broadcast goes to a snapshot of the registry taken
 * when the pump picks the request up, and a failed send to one address does
 * not affect the others.
 */
class PeerServer {
public:
    using Endpoint = asio::ip::udp::endpoint;

    enum class BroadcastPolicy {
        include_origin,  ///< every registered address, the sender included
        exclude_origin,  ///< skip the request's origin address
    };

    struct InboundMessage {
        VoipHeader header;
        std::vector<std::uint8_t> payload;
        Endpoint sender;
    };

    struct BroadcastReport {
        std::vector<Endpoint> sent;
        std::vector<std::pair<Endpoint, std::error_code>> failed;
    };

    using BroadcastHandler = std::function<void(const BroadcastReport&)>;
    using DatagramErrorCallback = PeerClient::DatagramErrorCallback;

    struct BroadcastRequest {
        VoipFrame frame;
        std::optional<Endpoint> origin;
        BroadcastHandler on_done;
    };

    using InboundChannel =
        asio::experimental::concurrent_channel<void(asio::error_code, InboundMessage)>;
    using BroadcastChannel =
        asio::experimental::concurrent_channel<void(asio::error_code, BroadcastRequest)>;

    /// Binds the wildcard address of `protocol` on `port` (0 picks a free port).
    /// IPv6 sockets are dual-stack. Throws TransportError(bind_failure).
    PeerServer(asio::io_context& io, std::uint16_t port,
               const asio::ip::udp& protocol = asio::ip::udp::v6());
    ~PeerServer();

    PeerServer(const PeerServer&) = delete;
    PeerServer& operator=(const PeerServer&) = delete;

    void start();
    void shutdown();
    [[nodiscard]] bool stopped() const;

    [[nodiscard]] Endpoint local_endpoint() const;

    /// Shared handle; stays valid after the server is gone.
    [[nodiscard]] std::shared_ptr<ClientRegistry> registry() const { return registry_; }

    /// Both must be set before start().
    void set_on_datagram_error(DatagramErrorCallback cb);
    void set_broadcast_policy(BroadcastPolicy policy);

    [[nodiscard]] BroadcastPolicy broadcast_policy() const;

    /// Queue a frame for every registered client, blocking while the queue is full.
    /// Throws std::system_error(transport_errc::oversize_frame) for frames above the MTU.
    void broadcast(VoipFrame frame, BroadcastHandler on_done = {});

    /// Same as broadcast(), remembering which peer the frame came from so the
    /// exclude_origin policy can skip it.
    void broadcast_from(VoipFrame frame, const Endpoint& origin, BroadcastHandler on_done = {});

    template <typename CompletionToken>
    auto async_broadcast(BroadcastRequest request, CompletionToken&& token) {
        return broadcast_channel().async_send(asio::error_code{}, std::move(request),
                                              std::forward<CompletionToken>(token));
    }

    /// Next decoded message and its sender, blocking until one arrives.
    InboundMessage dequeue_inbound();

    template <typename CompletionToken>
    auto async_dequeue_inbound(CompletionToken&& token) {
        return inbound_channel().async_receive(std::forward<CompletionToken>(token));
    }

private:
    struct Pump;

    InboundChannel& inbound_channel();
    BroadcastChannel& broadcast_channel();
    void enqueue_broadcast(BroadcastRequest request);

    std::shared_ptr<ClientRegistry> registry_;
    std::shared_ptr<Pump> pump_;
};
