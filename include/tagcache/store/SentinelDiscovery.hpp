#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/store/ReplicaSelector.hpp"
#include "tagcache/store/ServiceDiscovery.hpp"

namespace tagcache {
namespace store {

/**
 * @brief Обнаружение primary/replica через Redis Sentinel.
 * @details Адрес выясняется заново при каждом resolve*(), а соединения
 * с узлами данных переиспользуются по адресу host:port.
 * Sentinel, ответивший первым, переносится в начало списка.
 */
class SentinelDiscovery : public ServiceDiscovery {
public:
    using Address = NodeAddress;

    explicit SentinelDiscovery(const cache::SentinelConfig& config);
    ~SentinelDiscovery() override;

    SentinelDiscovery(const SentinelDiscovery&) = delete;
    SentinelDiscovery& operator=(const SentinelDiscovery&) = delete;

    std::shared_ptr<KeyValueStore> resolvePrimary() override;
    std::shared_ptr<KeyValueStore> resolveReplica() override;
    std::string serviceName() const override;

    /// SENTINEL get-master-addr-by-name
    Address discoverPrimary();
    /// SENTINEL replicas, без узлов в состоянии s_down/o_down/disconnected
    std::vector<Address> discoverReplicas();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace store
} // namespace tagcache
