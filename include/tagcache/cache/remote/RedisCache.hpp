#pragma once

#include <memory>
#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/cache/remote/RemoteCache.hpp"

namespace tagcache {
namespace cache {

/**
 * @brief Кэш поверх одного сервера Redis ("redis").
 * ConfigurationError при неверной конфигурации, ConnectionError, если сервер недоступен.
 */
std::unique_ptr<RemoteCache> makeRedisCache(const RedisConfig& config,
                                            codec::CodecFormat codec = codec::CodecFormat::MessagePack);

} // namespace cache
} // namespace tagcache
