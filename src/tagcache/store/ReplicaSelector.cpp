#include "tagcache/store/ReplicaSelector.hpp"
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace store {

int parseNodePort(const std::string& text) {
    size_t parsed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &parsed);
    } catch (const std::exception&) {
        throw StoreError("Sentinel returned invalid port: " + text);
    }
    if (parsed != text.size() || port <= 0 || port > 65535) {
        throw StoreError("Sentinel returned invalid port: " + text);
    }
    return port;
}

bool isHealthyReplica(const std::string& flags) {
    return flags.find("s_down") == std::string::npos &&
           flags.find("o_down") == std::string::npos &&
           flags.find("disconnected") == std::string::npos;
}

std::vector<NodeAddress> healthyReplicas(const std::vector<ReplicaFields>& entries) {
    std::vector<NodeAddress> healthy;
    for (const auto& fields : entries) {
        auto ip = fields.find("ip");
        auto port = fields.find("port");
        if (ip == fields.end() || port == fields.end()) {
            continue;
        }
        auto flags = fields.find("flags");
        if (flags != fields.end() && !isHealthyReplica(flags->second)) {
            log::get()->debug("Skipping replica {}:{} with flags '{}'",
                              ip->second, port->second, flags->second);
            continue;
        }
        healthy.emplace_back(ip->second, parseNodePort(port->second));
    }
    return healthy;
}

std::shared_ptr<KeyValueStore> ReplicaSelector::select(const std::vector<NodeAddress>& replicas,
                                                       const Opener& open,
                                                       const Fallback& fallback) {
    for (size_t attempt = 0; attempt < replicas.size(); ++attempt) {
        const auto& address = replicas[cursor_++ % replicas.size()];
        try {
            return open(address);
        } catch (const ConnectionError& e) {
            log::get()->warn("Replica {}:{} unavailable: {}", address.first, address.second, e.what());
        }
    }
    return fallback();
}

} // namespace store
} // namespace tagcache
