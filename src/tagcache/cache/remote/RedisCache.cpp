#include "tagcache/cache/remote/RedisCache.hpp"
#include "tagcache/log/Logger.hpp"
#include "tagcache/store/RedisStore.hpp"

namespace tagcache {
namespace cache {

std::unique_ptr<RemoteCache> makeRedisCache(const RedisConfig& config, codec::CodecFormat codec) {
    config.validate();

    store::RedisEndpoint endpoint;
    endpoint.host = config.host;
    endpoint.port = config.port;
    endpoint.db = config.db;
    endpoint.password = config.password;
    endpoint.connection = config.connection;

    auto store = std::make_shared<store::RedisStore>(endpoint);
    log::get()->info("Redis cache connected to {} (db {})", store->describe(), config.db);

    RemoteCacheOptions options;
    options.prefix = config.prefix;
    options.codec = codec;
    options.backendName = "redis";
    return std::make_unique<RemoteCache>(ConnectionRouter::fixed(store), options);
}

} // namespace cache
} // namespace tagcache
