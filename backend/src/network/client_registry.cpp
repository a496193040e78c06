/**
 * ClientRegistry - The set of peer addresses a relay broadcasts to.
 */

#include "network/client_registry.h"

bool ClientRegistry::insert(const Endpoint& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.insert(address).second;
}

bool ClientRegistry::remove(const Endpoint& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(address) > 0;
}

bool ClientRegistry::contains(const Endpoint& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(address) > 0;
}

std::size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::vector<ClientRegistry::Endpoint> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {clients_.begin(), clients_.end()};
}

std::string format_endpoint(const asio::ip::udp::endpoint& endpoint) {
    const auto address = endpoint.address();
    if (address.is_v6()) {
        return "[" + address.to_string() + "]:" + std::to_string(endpoint.port());
    }
    return address.to_string() + ":" + std::to_string(endpoint.port());
}
