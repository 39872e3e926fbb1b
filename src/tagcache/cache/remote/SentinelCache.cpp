#include "tagcache/cache/remote/SentinelCache.hpp"
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"
#include "tagcache/store/SentinelDiscovery.hpp"

namespace tagcache {
namespace cache {

std::unique_ptr<RemoteCache> makeSentinelCache(const SentinelConfig& config, codec::CodecFormat codec) {
    config.validate();
    auto discovery = std::make_shared<store::SentinelDiscovery>(config);
    return makeFailoverCache(discovery, config.prefix, codec);
}

std::unique_ptr<RemoteCache> makeFailoverCache(std::shared_ptr<store::ServiceDiscovery> discovery,
                                               const std::string& prefix,
                                               codec::CodecFormat codec) {
    auto router = ConnectionRouter::discovered(discovery);

    // Проверка при создании: без primary кэш не создаётся
    try {
        auto primary = router.primary();
        log::get()->info("Failover cache for service '{}': primary is {}",
                         discovery->serviceName(), primary->describe());
    } catch (const ConnectionError& e) {
        log::get()->error("Cannot resolve primary for service '{}': {}", discovery->serviceName(), e.what());
        throw;
    }

    RemoteCacheOptions options;
    options.prefix = prefix;
    options.codec = codec;
    options.backendName = "redis-sentinel";
    return std::make_unique<RemoteCache>(std::move(router), options);
}

} // namespace cache
} // namespace tagcache
