/**
 * NodeConfig - Loads node settings from a JSON file.
 */

#include "config/node_config.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw std::invalid_argument(std::string("config section '") + name + "' must be an object");
    }
    return *it;
}

NodeConfig::Mode parse_mode(const std::string& text) {
    if (text == "server") return NodeConfig::Mode::server;
    if (text == "client") return NodeConfig::Mode::client;
    throw std::invalid_argument("unknown node mode: " + text);
}

VoipMessageType parse_message_type(const std::string& text) {
    if (text == "voice") return VoipMessageType::voice;
    if (text == "video") return VoipMessageType::video;
    throw std::invalid_argument("unknown message type: " + text);
}

// Integers are read wide so out-of-range values are rejected instead of wrapped.
std::int64_t read_ranged(const json& value, const char* key, std::int64_t min, std::int64_t max) {
    const auto number = value.get<std::int64_t>();
    if (!value.is_number_integer() || number < min || number > max) {
        throw std::invalid_argument(std::string(key) + " out of range: " + value.dump());
    }
    return number;
}

std::uint16_t read_port(const json& value, const char* key) {
    return static_cast<std::uint16_t>(
        read_ranged(value, key, 0, std::numeric_limits<std::uint16_t>::max()));
}

}  // namespace

NodeConfig parse_config(const json& root) {
    NodeConfig config;

    const json& node = section(root, "node");
    config.mode = parse_mode(node.value("mode", std::string("server")));
    config.log_level = node.value("log_level", config.log_level);
    if (node.contains("identity")) {
        const std::string text = node.at("identity").get<std::string>();
        config.identity = parse_peer_id(text);
        if (!config.identity) {
            throw std::invalid_argument("invalid node identity: " + text);
        }
    }

    const json& server = section(root, "server");
    if (server.contains("listen_port")) {
        config.listen_port = read_port(server.at("listen_port"), "listen_port");
    }
    config.ipv6 = server.value("ipv6", config.ipv6);
    config.register_on_first_message =
        server.value("register_on_first_message", config.register_on_first_message);
    config.exclude_sender = server.value("exclude_sender", config.exclude_sender);
    config.drop_failed_peers = server.value("drop_failed_peers", config.drop_failed_peers);

    const json& client = section(root, "client");
    config.remote_host = client.value("remote_host", config.remote_host);
    if (client.contains("remote_port")) {
        // accept both "3004" and 3004
        const json& port = client.at("remote_port");
        config.remote_port = port.is_string() ? port.get<std::string>()
                                              : std::to_string(read_port(port, "remote_port"));
    }
    config.message_type = parse_message_type(client.value("message_type", std::string("voice")));
    config.payload_file = client.value("payload_file", config.payload_file);
    if (client.contains("frame_interval_ms")) {
        config.frame_interval_ms = static_cast<unsigned>(
            read_ranged(client.at("frame_interval_ms"), "frame_interval_ms", 0,
                        std::numeric_limits<unsigned>::max()));
    }

    return config;
}

NodeConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    return parse_config(json::parse(file));
}
