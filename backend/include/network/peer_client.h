#pragma once

#include <asio.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "identity/peer_id.h"
#include "packet/voip_packet.h"

/// Capacity of every queue between the application and a transport pump.
constexpr std::size_t kQueueCapacity = 255;

/**
 * UDP client exchanging voip frames with a single remote peer.
 *
 * The socket is bound to an ephemeral local port and connected to the peer,
 * so the OS only delivers datagrams coming from it. After start() a pump
 * running on the io_context owns the socket: it decodes every received
 * datagram into the inbound queue and writes every queued frame as one
 * datagram. Malformed datagrams are logged and dropped; they never stop the
 * pump.
 *
 * The blocking calls (enqueue_outbound, dequeue_inbound) must not be made from
 * a thread that is running the io_context; use the async_ forms there.
 */
class PeerClient {
public:
    using Endpoint = asio::ip::udp::endpoint;

    /// Result of the socket send issued for one frame.
    using SendHandler = std::function<void(const std::error_code&)>;

    /// Invoked on the pump for every datagram it had to discard.
    using DatagramErrorCallback =
        std::function<void(const std::error_code& ec, const Endpoint& from)>;

    struct OutboundRequest {
        VoipFrame frame;
        SendHandler on_sent;
    };

    using InboundChannel =
        asio::experimental::concurrent_channel<void(asio::error_code, VoipMessage)>;
    using OutboundChannel =
        asio::experimental::concurrent_channel<void(asio::error_code, OutboundRequest)>;

    /// Throws TransportError (connect_failure / bind_failure) if the peer
    /// cannot be resolved or the socket cannot be set up.
    PeerClient(asio::io_context& io, const PeerId& identity,
               const std::string& remote_host, const std::string& remote_port);
    ~PeerClient();

    PeerClient(const PeerClient&) = delete;
    PeerClient& operator=(const PeerClient&) = delete;

    void start();

    /// Stop the pump. Pending waits are woken; no traffic is needed.
    void shutdown();

    /// True once the pump has exited (or shutdown() came before start()).
    [[nodiscard]] bool stopped() const;

    [[nodiscard]] const PeerId& identity() const { return identity_; }
    [[nodiscard]] Endpoint local_endpoint() const;
    [[nodiscard]] Endpoint remote_endpoint() const;

    /// Must be set before start().
    void set_on_datagram_error(DatagramErrorCallback cb);

    /// Queue a frame for sending, blocking while the queue is full.
    /// Throws std::system_error(transport_errc::oversize_frame) for frames above the MTU.
    void enqueue_outbound(VoipFrame frame, SendHandler on_sent = {});

    template <typename CompletionToken>
    auto async_enqueue_outbound(OutboundRequest request, CompletionToken&& token) {
        return outbound_channel().async_send(asio::error_code{}, std::move(request),
                                             std::forward<CompletionToken>(token));
    }

    /// Next decoded message from the peer, blocking until one arrives.
    VoipMessage dequeue_inbound();

    template <typename CompletionToken>
    auto async_dequeue_inbound(CompletionToken&& token) {
        return inbound_channel().async_receive(std::forward<CompletionToken>(token));
    }

private:
    struct Pump;

    InboundChannel& inbound_channel();
    OutboundChannel& outbound_channel();

    PeerId identity_;
    std::shared_ptr<Pump> pump_;
};
