/**
 * silence - Node entry point
 *
 * Loads config, then runs either the relay server (register peers on their
 * first message, broadcast everything received) or a client that streams a
 * pre-encoded media file to a relay and logs what comes back.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/node_config.h"
#include "identity/peer_id.h"
#include "media/payload_slicer.h"
#include "network/peer_client.h"
#include "network/peer_server.h"
#include "network/transport_error.h"
#include "node/frame_streamer.h"
#include "node/relay_node.h"

static std::vector<std::uint8_t> read_payload_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open payload file: " + path);
    }
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

static int run_server(asio::io_context& io, asio::signal_set& signals, const NodeConfig& config) {
    PeerServer server(io, config.listen_port,
                      config.ipv6 ? asio::ip::udp::v6() : asio::ip::udp::v4());
    server.set_broadcast_policy(config.exclude_sender
                                    ? PeerServer::BroadcastPolicy::exclude_origin
                                    : PeerServer::BroadcastPolicy::include_origin);

    RelayNode node(server, {config.register_on_first_message, config.drop_failed_peers});

    signals.async_wait([&server](const asio::error_code& ec, int sig) {
        if (ec) return;
        spdlog::info("Received signal {}, shutting down", sig);
        server.shutdown();
    });

    server.start();
    node.start();
    spdlog::info("Relay ready. Press Ctrl+C to exit.");

    io.run();
    spdlog::info("Relay finished, {} messages relayed", node.relayed());
    return 0;
}

static int run_client(asio::io_context& io, asio::signal_set& signals, const NodeConfig& config,
                      const PeerId& identity) {
    PeerClient client(io, identity, config.remote_host, config.remote_port);
    std::atomic<bool> stopping{false};

    signals.async_wait([&](const asio::error_code& ec, int sig) {
        if (ec) return;
        spdlog::info("Received signal {}, shutting down", sig);
        stopping.store(true);
        client.shutdown();
    });

    std::function<void()> read_next = [&] {
        client.async_dequeue_inbound([&](const asio::error_code& ec, VoipMessage message) {
            if (ec) return;
            spdlog::info("{} byte {} payload from {}", message.payload.size(),
                         message.header.message_type() == VoipMessageType::voice ? "voice"
                                                                                 : "video",
                         format_peer_id(message.header.author()));
            read_next();
        });
    };

    client.start();
    read_next();

    // One frame on its own registers us with a relay even without media to send.
    std::vector<VoipFrame> frames;
    PayloadSlicer slicer(config.message_type, identity);
    if (!config.payload_file.empty()) {
        frames = slicer.frames(read_payload_file(config.payload_file));
        spdlog::info("Streaming {} frames from {}", frames.size(), config.payload_file);
    } else {
        frames.push_back(encode_frame(VoipHeader(config.message_type, 0, identity), {}));
    }

    // enqueue_outbound completes on the io_context, so it must keep running
    // until the sender thread is done with it.
    auto sender_guard = asio::make_work_guard(io);

    std::thread sender([&] {
        stream_frames(client, std::move(frames), std::chrono::milliseconds(config.frame_interval_ms),
                      stopping);
        asio::post(io, [&sender_guard] { sender_guard.reset(); });
    });

    io.run();
    sender.join();
    return 0;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("silence node starting…");

    std::string config_path = (argc > 1) ? argv[1] : "config.json";
    NodeConfig config;
    try {
        config = load_config(config_path);
    } catch (const std::exception& e) {
        spdlog::error("Cannot load config from {}: {}", config_path, e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("Loaded config from {}", config_path);

    PeerId identity = config.identity ? *config.identity : generate_peer_id();
    spdlog::info("Identity: {}", format_peer_id(identity));

    asio::io_context io;
    asio::signal_set signals(io, SIGINT, SIGTERM);

    try {
        if (config.mode == NodeConfig::Mode::server) {
            return run_server(io, signals, config);
        }
        return run_client(io, signals, config, identity);
    } catch (const TransportError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
