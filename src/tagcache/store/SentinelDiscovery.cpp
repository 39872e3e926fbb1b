#include "tagcache/store/SentinelDiscovery.hpp"
#include <mutex>
#include <optional>
#include <unordered_map>
#include <spdlog/fmt/fmt.h>
#include "RedisConnection.hpp"
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"
#include "tagcache/store/RedisStore.hpp"

namespace tagcache {
namespace store {

namespace {

// Ответ SENTINEL replicas в RESP2: массив плоских массивов [поле, значение, ...]
ReplicaFields readFields(const redisReply* entry) {
    ReplicaFields fields;
    if (entry->type != REDIS_REPLY_ARRAY && entry->type != REDIS_REPLY_MAP) {
        return fields;
    }
    for (size_t i = 0; i + 1 < entry->elements; i += 2) {
        fields[detail::replyString(entry->element[i])] = detail::replyString(entry->element[i + 1]);
    }
    return fields;
}

} // namespace

struct SentinelDiscovery::Impl {
    struct Sentinel {
        cache::SentinelAddress address;
        std::unique_ptr<detail::RedisConnection> connection;
    };

    cache::SentinelConfig config;
    std::vector<Sentinel> sentinels;
    std::unordered_map<std::string, std::shared_ptr<RedisStore>> stores;
    ReplicaSelector selector;
    std::mutex mutex;

    explicit Impl(const cache::SentinelConfig& cfg) : config(cfg) {
        for (const auto& address : cfg.sentinels) {
            sentinels.push_back(Sentinel{address, nullptr});
        }
    }

    // Опросить Sentinel по очереди; nullopt от query - сервис этому Sentinel неизвестен.
    template<typename Result, typename Query>
    Result ask(const char* what, Query query) {
        std::string lastError = "no sentinel knows the service";
        for (size_t i = 0; i < sentinels.size(); ++i) {
            auto& sentinel = sentinels[i];
            auto label = fmt::format("{}:{}", sentinel.address.host, sentinel.address.port);
            try {
                if (!sentinel.connection) {
                    sentinel.connection = std::make_unique<detail::RedisConnection>(
                        sentinel.address.host, sentinel.address.port, config.connection,
                        config.sentinelPassword, 0);
                }
                std::optional<Result> result = query(*sentinel.connection);
                if (!result) {
                    log::get()->debug("Sentinel {} does not know service '{}'", label, config.serviceName);
                    continue;
                }
                if (i != 0) {
                    std::swap(sentinels[0], sentinels[i]);
                }
                return *result;
            } catch (const ConnectionError& e) {
                sentinel.connection.reset();
                lastError = e.what();
                log::get()->warn("Sentinel {} unavailable: {}", label, e.what());
            } catch (const StoreError& e) {
                lastError = e.what();
                log::get()->warn("Sentinel {} rejected {}: {}", label, what, e.what());
            }
        }
        throw ConnectionError(fmt::format("Cannot {} for service '{}': {}",
                                          what, config.serviceName, lastError));
    }

    std::shared_ptr<RedisStore> storeFor(const Address& address) {
        auto key = fmt::format("{}:{}", address.first, address.second);
        auto it = stores.find(key);
        if (it != stores.end()) {
            return it->second;
        }
        RedisEndpoint endpoint;
        endpoint.host = address.first;
        endpoint.port = address.second;
        endpoint.db = config.db;
        endpoint.password = config.password;
        endpoint.connection = config.connection;
        auto store = std::make_shared<RedisStore>(endpoint);
        stores.emplace(key, store);
        log::get()->info("Opened connection to {} for service '{}'", key, config.serviceName);
        return store;
    }

    Address primaryAddress() {
        return ask<Address>("resolve primary", [this](detail::RedisConnection& connection) -> std::optional<Address> {
            auto reply = connection.command({"SENTINEL", "get-master-addr-by-name", config.serviceName});
            if (reply->type == REDIS_REPLY_NIL) {
                return std::nullopt;
            }
            if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
                throw StoreError(fmt::format("get-master-addr-by-name returned {}",
                                             detail::replyTypeName(reply->type)));
            }
            return Address{detail::replyString(reply->element[0]),
                           parseNodePort(detail::replyString(reply->element[1]))};
        });
    }

    std::vector<Address> replicaAddresses() {
        return ask<std::vector<Address>>("list replicas", [this](detail::RedisConnection& connection)
                                                               -> std::optional<std::vector<Address>> {
            auto reply = connection.command({"SENTINEL", "replicas", config.serviceName});
            if (reply->type != REDIS_REPLY_ARRAY) {
                throw StoreError(fmt::format("SENTINEL replicas returned {}",
                                             detail::replyTypeName(reply->type)));
            }
            std::vector<ReplicaFields> entries;
            entries.reserve(reply->elements);
            for (size_t i = 0; i < reply->elements; ++i) {
                entries.push_back(readFields(reply->element[i]));
            }
            return healthyReplicas(entries);
        });
    }
};

SentinelDiscovery::SentinelDiscovery(const cache::SentinelConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    config.validate();
    log::get()->info("Sentinel discovery for service '{}' with {} sentinel(s)",
                     config.serviceName, config.sentinels.size());
}

SentinelDiscovery::~SentinelDiscovery() = default;

std::shared_ptr<KeyValueStore> SentinelDiscovery::resolvePrimary() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto address = pImpl->primaryAddress();
    log::get()->trace("Primary for '{}' is {}:{}", pImpl->config.serviceName, address.first, address.second);
    return pImpl->storeFor(address);
}

std::shared_ptr<KeyValueStore> SentinelDiscovery::resolveReplica() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto replicas = pImpl->replicaAddresses();
    return pImpl->selector.select(
        replicas,
        [this](const Address& address) -> std::shared_ptr<KeyValueStore> {
            return pImpl->storeFor(address);
        },
        [this]() -> std::shared_ptr<KeyValueStore> {
            log::get()->debug("No healthy replica for '{}', reading from primary", pImpl->config.serviceName);
            return pImpl->storeFor(pImpl->primaryAddress());
        });
}

std::string SentinelDiscovery::serviceName() const {
    return pImpl->config.serviceName;
}

SentinelDiscovery::Address SentinelDiscovery::discoverPrimary() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->primaryAddress();
}

std::vector<SentinelDiscovery::Address> SentinelDiscovery::discoverReplicas() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->replicaAddresses();
}

} // namespace store
} // namespace tagcache
