#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <thread>
#include <vector>

#include "identity/peer_id.h"
#include "packet/voip_packet.h"

using namespace std::chrono_literals;

/// Runs an io_context on a background thread until destroyed.
class IoThread {
public:
    explicit IoThread(asio::io_context& io)
        : io_(io), guard_(asio::make_work_guard(io)), thread_([this] { io_.run(); }) {}

    /// Lets already queued handlers (e.g. a transport's shutdown) run, then stops.
    ~IoThread() {
        guard_.reset();
        asio::post(io_, [this] { io_.stop(); });
        if (thread_.joinable()) thread_.join();
    }

private:
    asio::io_context& io_;
    asio::executor_work_guard<asio::io_context::executor_type> guard_;
    std::thread thread_;
};

/// Polls pred until it holds or the timeout expires.
template <typename Predicate>
bool wait_until(Predicate pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

template <typename T>
bool ready_within(std::future<T>& f, std::chrono::milliseconds timeout = 3000ms) {
    return f.wait_for(timeout) == std::future_status::ready;
}

/**
 * Plain UDP socket on 127.0.0.1 standing in for a remote peer.
 * Works synchronously on its own io_context.
 */
class RawPeer {
public:
    using Endpoint = asio::ip::udp::endpoint;

    RawPeer() : socket_(io_, Endpoint(asio::ip::address_v4::loopback(), 0)) {
        socket_.non_blocking(true);
    }

    [[nodiscard]] Endpoint endpoint() const { return socket_.local_endpoint(); }

    void send_to(const std::vector<std::uint8_t>& bytes, const Endpoint& to) {
        socket_.send_to(asio::buffer(bytes), to);
    }

    /// Next datagram, or std::nullopt if none arrives in time.
    std::optional<std::vector<std::uint8_t>> receive(std::chrono::milliseconds timeout = 3000ms,
                                                     Endpoint* from = nullptr) {
        std::vector<std::uint8_t> buffer(65536);
        Endpoint sender;
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            asio::error_code ec;
            std::size_t n = socket_.receive_from(asio::buffer(buffer), sender, 0, ec);
            if (!ec) {
                buffer.resize(n);
                if (from) *from = sender;
                return buffer;
            }
            if (ec != asio::error::would_block && ec != asio::error::try_again) {
                throw asio::system_error(ec);
            }
            if (std::chrono::steady_clock::now() > deadline) return std::nullopt;
            std::this_thread::sleep_for(2ms);
        }
    }

private:
    asio::io_context io_;
    asio::ip::udp::socket socket_;
};

/// Loopback address with the given endpoint's port (for sockets bound to a wildcard).
inline asio::ip::udp::endpoint loopback(const asio::ip::udp::endpoint& ep) {
    return {asio::ip::address_v4::loopback(), ep.port()};
}

inline VoipFrame make_voice_frame(const PeerId& author, const std::vector<std::uint8_t>& payload) {
    return encode_frame(VoipHeader(VoipMessageType::voice, payload.size(), author), payload);
}
