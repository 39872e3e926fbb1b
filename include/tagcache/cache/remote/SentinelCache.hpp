#pragma once

#include <memory>
#include <string>
#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/cache/remote/RemoteCache.hpp"
#include "tagcache/store/ServiceDiscovery.hpp"

namespace tagcache {
namespace cache {

/**
 * @brief Кэш с автоматическим переключением на новый primary ("redis-sentinel").
 * @details Запись идёт в текущий primary, чтения - в реплику; узлы
 * выясняются заново перед каждым примитивным вызовом.
 * Если primary не удаётся найти при создании, бросается ConnectionError.
 */
std::unique_ptr<RemoteCache> makeSentinelCache(const SentinelConfig& config,
                                               codec::CodecFormat codec = codec::CodecFormat::MessagePack);

/// То же поверх произвольного механизма обнаружения.
std::unique_ptr<RemoteCache> makeFailoverCache(std::shared_ptr<store::ServiceDiscovery> discovery,
                                               const std::string& prefix = "cache:",
                                               codec::CodecFormat codec = codec::CodecFormat::MessagePack);

} // namespace cache
} // namespace tagcache
