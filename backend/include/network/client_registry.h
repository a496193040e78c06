#pragma once

#include <asio.hpp>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

/**
 * Set of peer addresses the relay broadcasts to.
 *
 * Shared between the application and the server's pump. The lock is only
 * held for the duration of a single call; iterate over snapshot() instead of
 * the live set so no I/O ever happens under the lock.
 */
class ClientRegistry {
public:
    using Endpoint = asio::ip::udp::endpoint;

    /// Returns true if the address was not registered yet.
    bool insert(const Endpoint& address);

    /// Returns true if the address was registered and has been removed.
    bool remove(const Endpoint& address);

    [[nodiscard]] bool contains(const Endpoint& address) const;
    [[nodiscard]] std::size_t size() const;

    /// Ordered copy of the current registrations.
    [[nodiscard]] std::vector<Endpoint> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::set<Endpoint> clients_;
};

/// "address:port" (IPv6 addresses in brackets), for log lines.
std::string format_endpoint(const asio::ip::udp::endpoint& endpoint);
