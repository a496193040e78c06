/**
 * PeerServer - Relays voip frames between the peers of a session.
 *
 * Uses standalone ASIO for async I/O. The pump owns one unconnected UDP
 * socket and runs two operation chains on a strand:
 *   - receive_from -> decode -> inbound queue
 *   - broadcast queue -> registry snapshot -> one send_to per address
 * Signalling the cancellation controller wakes both chains and ends them.
 */

#include "network/peer_server.h"

#include <algorithm>
#include <atomic>

#include <spdlog/spdlog.h>

#include "network/cancellation.h"
#include "network/transport_error.h"

namespace {

constexpr std::size_t kReceiveBufferSize = 65536;

bool is_socket_gone(const asio::error_code& ec) {
    return ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}

}  // namespace

struct PeerServer::Pump : std::enable_shared_from_this<PeerServer::Pump> {
    Pump(asio::io_context& io, asio::ip::udp::socket sock,
         std::shared_ptr<ClientRegistry> clients)
        : strand(asio::make_strand(io)),
          socket(std::move(sock)),
          inbound(io.get_executor(), kQueueCapacity),
          broadcasts(io.get_executor(), kQueueCapacity),
          registry(std::move(clients)),
          local(socket.local_endpoint()),
          recv_buffer(kReceiveBufferSize) {}

    /// State shared by the sends of one broadcast request.
    struct FanOut {
        VoipFrame frame;
        BroadcastHandler on_done;
        BroadcastReport report;
        std::size_t remaining = 0;
    };

    void start();
    void close_sources();
    void do_receive();
    void on_receive(const asio::error_code& ec, std::size_t bytes);
    void do_dequeue_broadcast();
    void fan_out(BroadcastRequest request);
    void chain_finished();
    Endpoint wire_address(const Endpoint& address) const;

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::udp::socket socket;
    InboundChannel inbound;
    BroadcastChannel broadcasts;
    CancellationController cancel;
    std::shared_ptr<ClientRegistry> registry;
    DatagramErrorCallback on_datagram_error;
    BroadcastPolicy policy = BroadcastPolicy::include_origin;

    Endpoint local;
    Endpoint sender;
    std::vector<std::uint8_t> recv_buffer;

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    int active_chains = 0;  // strand only
};

void PeerServer::Pump::start() {
    auto self = shared_from_this();
    asio::post(strand, [self] {
        self->active_chains = 2;
        if (self->cancel.signalled()) {
            self->active_chains = 1;
            self->chain_finished();
            return;
        }
        self->do_receive();
        self->do_dequeue_broadcast();
    });
}

void PeerServer::Pump::close_sources() {
    asio::error_code ec;
    socket.cancel(ec);
    if (ec) {
        spdlog::debug("Cancelling server socket failed: {}", ec.message());
    }
    broadcasts.cancel();
    broadcasts.close();
    inbound.cancel();
    inbound.close();
}

void PeerServer::Pump::do_receive() {
    auto self = shared_from_this();
    socket.async_receive_from(asio::buffer(recv_buffer), sender,
                              asio::bind_executor(strand, [self](const asio::error_code& ec,
                                                                 std::size_t bytes) {
                                  self->on_receive(ec, bytes);
                              }));
}

void PeerServer::Pump::on_receive(const asio::error_code& ec, std::size_t bytes) {
    if (cancel.signalled() || is_socket_gone(ec)) {
        chain_finished();
        return;
    }

    if (ec) {
        spdlog::error("Failed to receive message: {}", ec.message());
        do_receive();
        return;
    }

    std::error_code decode_ec;
    auto message = decode_frame(recv_buffer.data(), bytes, decode_ec);
    if (!message) {
        spdlog::error("Discarding {} byte datagram from {}: {}", bytes, format_endpoint(sender),
                      decode_ec.message());
        if (on_datagram_error) {
            on_datagram_error(decode_ec, sender);
        }
        do_receive();
        return;
    }

    spdlog::debug("Received {} byte payload from {}", message->payload.size(),
                  format_endpoint(sender));

    auto self = shared_from_this();
    inbound.async_send(asio::error_code{},
                       InboundMessage{message->header, std::move(message->payload), sender},
                       asio::bind_executor(strand, [self](const asio::error_code& send_ec) {
                           if (send_ec || self->cancel.signalled()) {
                               self->chain_finished();
                               return;
                           }
                           self->do_receive();
                       }));
}

void PeerServer::Pump::do_dequeue_broadcast() {
    auto self = shared_from_this();
    broadcasts.async_receive(asio::bind_executor(
        strand, [self](const asio::error_code& ec, BroadcastRequest request) {
            if (ec || self->cancel.signalled()) {
                self->chain_finished();
                return;
            }
            self->fan_out(std::move(request));
            self->do_dequeue_broadcast();
        }));
}

void PeerServer::Pump::fan_out(BroadcastRequest request) {
    // Copy, so the registry lock is released before any send is issued.
    std::vector<Endpoint> targets = registry->snapshot();
    if (policy == BroadcastPolicy::exclude_origin && request.origin) {
        const Endpoint origin = wire_address(*request.origin);
        targets.erase(std::remove_if(targets.begin(), targets.end(),
                                     [&](const Endpoint& target) {
                                         return wire_address(target) == origin;
                                     }),
                      targets.end());
    }

    auto state = std::make_shared<FanOut>();
    state->frame = std::move(request.frame);
    state->on_done = std::move(request.on_done);
    state->remaining = targets.size();

    if (!state->frame.fits_mtu()) {
        spdlog::error("Refusing to broadcast {} byte frame, limit is {}", state->frame.size(),
                      kMtuMaxPacketSize);
        for (const auto& target : targets) {
            state->report.failed.emplace_back(target,
                                              make_error_code(transport_errc::oversize_frame));
        }
        targets.clear();
    }

    if (targets.empty()) {
        if (state->on_done) {
            state->on_done(state->report);
        }
        return;
    }

    auto self = shared_from_this();
    for (const auto& target : targets) {
        socket.async_send_to(
            asio::buffer(state->frame.bytes()), wire_address(target),
            asio::bind_executor(strand, [self, state, target](const asio::error_code& ec,
                                                              std::size_t) {
                if (ec) {
                    spdlog::warn("Failed to relay frame to {}: {}", format_endpoint(target),
                                 ec.message());
                    state->report.failed.emplace_back(target, ec);
                } else {
                    state->report.sent.push_back(target);
                }
                if (--state->remaining == 0 && state->on_done) {
                    state->on_done(state->report);
                }
            }));
    }
}

// A dual-stack socket reports IPv4 peers as v4-mapped IPv6 and cannot send to
// plain IPv4 endpoints. Reports keep the address as registered.
PeerServer::Endpoint PeerServer::Pump::wire_address(const Endpoint& address) const {
    if (local.protocol() == asio::ip::udp::v6() && address.address().is_v4()) {
        return Endpoint(asio::ip::make_address_v6(asio::ip::v4_mapped, address.address().to_v4()),
                        address.port());
    }
    return address;
}

void PeerServer::Pump::chain_finished() {
    if (--active_chains == 0) {
        finished.store(true);
        spdlog::debug("Server pump on {} stopped", format_endpoint(local));
    }
}

PeerServer::PeerServer(asio::io_context& io, std::uint16_t port, const asio::ip::udp& protocol)
    : registry_(std::make_shared<ClientRegistry>()) {
    asio::error_code ec;
    asio::ip::udp::socket socket(io);

    socket.open(protocol, ec);
    if (!ec && protocol == asio::ip::udp::v6()) {
        asio::error_code option_ec;
        socket.set_option(asio::ip::v6_only(false), option_ec);
        if (option_ec) {
            spdlog::warn("Server socket stays IPv6-only: {}", option_ec.message());
        }
    }
    if (!ec) {
        socket.bind(Endpoint(protocol, port), ec);
    }
    if (ec) {
        throw TransportError(transport_errc::bind_failure, ec,
                             "Cannot bind server to port " + std::to_string(port));
    }

    pump_ = std::make_shared<Pump>(io, std::move(socket), registry_);

    std::weak_ptr<Pump> weak = pump_;
    pump_->cancel.on_signal([weak] {
        if (auto self = weak.lock()) {
            asio::post(self->strand, [self] { self->close_sources(); });
        }
    });

    spdlog::info("Relay server listening on {}", format_endpoint(pump_->local));
}

PeerServer::~PeerServer() {
    shutdown();
}

void PeerServer::start() {
    if (pump_->cancel.signalled() || pump_->started.exchange(true)) {
        return;
    }
    pump_->start();
}

void PeerServer::shutdown() {
    if (pump_->cancel.signal()) {
        spdlog::debug("Relay server on {} shutting down", format_endpoint(pump_->local));
    }
}

bool PeerServer::stopped() const {
    if (!pump_->started.load()) {
        return pump_->cancel.signalled();
    }
    return pump_->finished.load();
}

PeerServer::Endpoint PeerServer::local_endpoint() const {
    return pump_->local;
}

void PeerServer::set_on_datagram_error(DatagramErrorCallback cb) {
    pump_->on_datagram_error = std::move(cb);
}

void PeerServer::set_broadcast_policy(BroadcastPolicy policy) {
    pump_->policy = policy;
}

PeerServer::BroadcastPolicy PeerServer::broadcast_policy() const {
    return pump_->policy;
}

void PeerServer::broadcast(VoipFrame frame, BroadcastHandler on_done) {
    enqueue_broadcast(BroadcastRequest{std::move(frame), std::nullopt, std::move(on_done)});
}

void PeerServer::broadcast_from(VoipFrame frame, const Endpoint& origin,
                                BroadcastHandler on_done) {
    enqueue_broadcast(BroadcastRequest{std::move(frame), origin, std::move(on_done)});
}

void PeerServer::enqueue_broadcast(BroadcastRequest request) {
    if (!request.frame.fits_mtu()) {
        throw std::system_error(make_error_code(transport_errc::oversize_frame), "broadcast");
    }
    pump_->broadcasts.async_send(asio::error_code{}, std::move(request), asio::use_future).get();
}

PeerServer::InboundMessage PeerServer::dequeue_inbound() {
    return pump_->inbound.async_receive(asio::use_future).get();
}

PeerServer::InboundChannel& PeerServer::inbound_channel() {
    return pump_->inbound;
}

PeerServer::BroadcastChannel& PeerServer::broadcast_channel() {
    return pump_->broadcasts;
}
