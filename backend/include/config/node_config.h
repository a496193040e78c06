#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "identity/peer_id.h"
#include "packet/voip_packet.h"

/**
 * Settings read from config.json. Every key is optional.
 */
struct NodeConfig {
    enum class Mode { server, client };

    Mode mode = Mode::server;
    std::string log_level = "info";
    std::optional<PeerId> identity;

    // server
    std::uint16_t listen_port = 3004;
    bool ipv6 = true;
    bool register_on_first_message = true;
    bool exclude_sender = false;
    bool drop_failed_peers = false;

    // client
    std::string remote_host = "::1";
    std::string remote_port = "3004";
    VoipMessageType message_type = VoipMessageType::voice;
    std::string payload_file;
    unsigned frame_interval_ms = 20;
};

/// Throws nlohmann::json::exception or std::invalid_argument on bad values.
NodeConfig parse_config(const nlohmann::json& root);

/// Reads and parses a config file. Throws std::runtime_error if it cannot be opened.
NodeConfig load_config(const std::string& path);
