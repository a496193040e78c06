/**
 * PeerClient - Sends and receives voip frames to/from one remote peer.
 *
 * Uses standalone ASIO for async I/O. The pump is two operation chains
 * (socket receive, outbound queue) serialized on one strand; both stop
 * when the cancellation controller is signalled.
 */

#include "network/peer_client.h"

#include <atomic>
#include <vector>

#include <spdlog/spdlog.h>

#include "network/cancellation.h"
#include "network/client_registry.h"
#include "network/transport_error.h"

namespace {

// Large enough for any UDP datagram, so oversize frames are seen whole and rejected.
constexpr std::size_t kReceiveBufferSize = 65536;

bool is_socket_gone(const asio::error_code& ec) {
    return ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}

}  // namespace

struct PeerClient::Pump : std::enable_shared_from_this<PeerClient::Pump> {
    Pump(asio::io_context& io, asio::ip::udp::socket sock, const Endpoint& peer)
        : strand(asio::make_strand(io)),
          socket(std::move(sock)),
          inbound(io.get_executor(), kQueueCapacity),
          outbound(io.get_executor(), kQueueCapacity),
          remote(peer),
          local(socket.local_endpoint()),
          recv_buffer(kReceiveBufferSize) {}

    void start();
    void close_sources();
    void do_receive();
    void on_receive(const asio::error_code& ec, std::size_t bytes);
    void do_dequeue_outbound();
    void send(OutboundRequest request);
    void chain_finished();

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::udp::socket socket;
    InboundChannel inbound;
    OutboundChannel outbound;
    CancellationController cancel;
    DatagramErrorCallback on_datagram_error;

    Endpoint remote;
    Endpoint local;
    std::vector<std::uint8_t> recv_buffer;

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    int active_chains = 0;  // strand only
};

void PeerClient::Pump::start() {
    auto self = shared_from_this();
    asio::post(strand, [self] {
        self->active_chains = 2;
        if (self->cancel.signalled()) {
            self->active_chains = 1;
            self->chain_finished();
            return;
        }
        self->do_receive();
        self->do_dequeue_outbound();
    });
}

void PeerClient::Pump::close_sources() {
    asio::error_code ec;
    socket.cancel(ec);
    if (ec) {
        spdlog::debug("Cancelling client socket failed: {}", ec.message());
    }
    outbound.cancel();
    outbound.close();
    inbound.cancel();
    inbound.close();
}

void PeerClient::Pump::do_receive() {
    auto self = shared_from_this();
    socket.async_receive(asio::buffer(recv_buffer),
                         asio::bind_executor(strand, [self](const asio::error_code& ec,
                                                            std::size_t bytes) {
                             self->on_receive(ec, bytes);
                         }));
}

void PeerClient::Pump::on_receive(const asio::error_code& ec, std::size_t bytes) {
    if (cancel.signalled() || is_socket_gone(ec)) {
        chain_finished();
        return;
    }

    if (ec) {
        // e.g. connection refused after an ICMP port unreachable from the peer
        spdlog::error("Failed to receive message from {}: {}", format_endpoint(remote),
                      ec.message());
        do_receive();
        return;
    }

    std::error_code decode_ec;
    auto message = decode_frame(recv_buffer.data(), bytes, decode_ec);
    if (!message) {
        spdlog::error("Discarding {} byte datagram from {}: {}", bytes,
                      format_endpoint(remote), decode_ec.message());
        if (on_datagram_error) {
            on_datagram_error(decode_ec, remote);
        }
        do_receive();
        return;
    }

    // The next receive waits for queue space, so a full queue throttles the socket.
    auto self = shared_from_this();
    inbound.async_send(asio::error_code{}, std::move(*message),
                       asio::bind_executor(strand, [self](const asio::error_code& send_ec) {
                           if (send_ec || self->cancel.signalled()) {
                               self->chain_finished();
                               return;
                           }
                           self->do_receive();
                       }));
}

void PeerClient::Pump::do_dequeue_outbound() {
    auto self = shared_from_this();
    outbound.async_receive(asio::bind_executor(
        strand, [self](const asio::error_code& ec, OutboundRequest request) {
            if (ec || self->cancel.signalled()) {
                self->chain_finished();
                return;
            }
            self->send(std::move(request));
            self->do_dequeue_outbound();
        }));
}

void PeerClient::Pump::send(OutboundRequest request) {
    if (!request.frame.fits_mtu()) {
        spdlog::error("Refusing to send {} byte frame, limit is {}", request.frame.size(),
                      kMtuMaxPacketSize);
        if (request.on_sent) {
            request.on_sent(make_error_code(transport_errc::oversize_frame));
        }
        return;
    }

    auto pending = std::make_shared<OutboundRequest>(std::move(request));
    auto self = shared_from_this();
    socket.async_send(asio::buffer(pending->frame.bytes()),
                      asio::bind_executor(strand, [self, pending](const asio::error_code& ec,
                                                                  std::size_t) {
                          if (ec) {
                              spdlog::warn("Failed to send frame to {}: {}",
                                           format_endpoint(self->remote), ec.message());
                          }
                          if (pending->on_sent) {
                              pending->on_sent(ec);
                          }
                      }));
}

void PeerClient::Pump::chain_finished() {
    if (--active_chains == 0) {
        finished.store(true);
        spdlog::debug("Client pump for {} stopped", format_endpoint(remote));
    }
}

PeerClient::PeerClient(asio::io_context& io, const PeerId& identity,
                       const std::string& remote_host, const std::string& remote_port)
    : identity_(identity) {
    asio::error_code ec;

    asio::ip::udp::resolver resolver(io);
    auto results = resolver.resolve(remote_host, remote_port, ec);
    if (!ec && results.empty()) {
        ec = asio::error::host_not_found;
    }
    if (ec) {
        throw TransportError(transport_errc::connect_failure, ec,
                             "Cannot resolve " + remote_host + ":" + remote_port);
    }
    const Endpoint remote = results.begin()->endpoint();

    asio::ip::udp::socket socket(io);
    socket.open(remote.protocol(), ec);
    if (!ec) {
        socket.bind(Endpoint(remote.protocol(), 0), ec);
    }
    if (ec) {
        throw TransportError(transport_errc::bind_failure, ec, "Cannot bind client socket");
    }

    // UDP is connectionless; connect() only makes the OS filter datagrams to this peer.
    socket.connect(remote, ec);
    if (ec) {
        throw TransportError(transport_errc::connect_failure, ec,
                             "Cannot connect to " + format_endpoint(remote));
    }

    pump_ = std::make_shared<Pump>(io, std::move(socket), remote);

    std::weak_ptr<Pump> weak = pump_;
    pump_->cancel.on_signal([weak] {
        if (auto self = weak.lock()) {
            asio::post(self->strand, [self] { self->close_sources(); });
        }
    });

    spdlog::info("Client {} bound to {}, peer {}", format_peer_id(identity_),
                 format_endpoint(pump_->local), format_endpoint(remote));
}

PeerClient::~PeerClient() {
    shutdown();
}

void PeerClient::start() {
    if (pump_->cancel.signalled() || pump_->started.exchange(true)) {
        return;
    }
    pump_->start();
}

void PeerClient::shutdown() {
    if (pump_->cancel.signal()) {
        spdlog::debug("Client {} shutting down", format_peer_id(identity_));
    }
}

bool PeerClient::stopped() const {
    if (!pump_->started.load()) {
        return pump_->cancel.signalled();
    }
    return pump_->finished.load();
}

PeerClient::Endpoint PeerClient::local_endpoint() const {
    return pump_->local;
}

PeerClient::Endpoint PeerClient::remote_endpoint() const {
    return pump_->remote;
}

void PeerClient::set_on_datagram_error(DatagramErrorCallback cb) {
    pump_->on_datagram_error = std::move(cb);
}

void PeerClient::enqueue_outbound(VoipFrame frame, SendHandler on_sent) {
    if (!frame.fits_mtu()) {
        throw std::system_error(make_error_code(transport_errc::oversize_frame),
                                "enqueue_outbound");
    }
    pump_->outbound
        .async_send(asio::error_code{}, OutboundRequest{std::move(frame), std::move(on_sent)},
                    asio::use_future)
        .get();
}

VoipMessage PeerClient::dequeue_inbound() {
    return pump_->inbound.async_receive(asio::use_future).get();
}

PeerClient::InboundChannel& PeerClient::inbound_channel() {
    return pump_->inbound;
}

PeerClient::OutboundChannel& PeerClient::outbound_channel() {
    return pump_->outbound;
}
