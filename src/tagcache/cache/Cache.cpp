#include "tagcache/cache/Cache.hpp"
#include <chrono>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/cache/memory/MemoryCache.hpp"
#include "tagcache/cache/remote/RedisCache.hpp"
#include "tagcache/cache/remote/SentinelCache.hpp"
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace cache {

std::unique_ptr<TaggedCache> makeBackend(const CacheConfig& config) {
    config.validate();
    auto codec = codec::parseFormat(config.codec);

    if (config.backend == "memory") {
        return std::make_unique<MemoryCache>();
    }
    if (config.backend == "redis") {
        return makeRedisCache(config.redis, codec);
    }
    if (config.backend == "redis-sentinel") {
        return makeSentinelCache(config.sentinel, codec);
    }
    throw ConfigurationError("Unsupported backend: " + config.backend);
}

Cache::Cache(const CacheConfig& config) {
    try {
        config.log.validate();
        // Логгер общий: без явных настроек его не трогаем
        if (!config.log.level.empty() || !config.log.file.empty()) {
            log::configure(config.log.level, config.log.file);
        }
        backend_ = makeBackend(config);
    } catch (const CacheError& e) {
        log::get()->error("Cache initialization failed: {}", e.what());
        throw;
    }
    log::get()->info("Cache initialized with backend '{}'", backend_->backendName());
}

Cache::Cache(std::unique_ptr<TaggedCache> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        throw ConfigurationError("Cache requires a backend");
    }
}

Cache::~Cache() = default;

std::optional<Value> Cache::get(const std::string& key) {
    ++requestCount_;
    auto value = backend_->get(key);
    if (value) {
        ++hitCount_;
    }
    return value;
}

Entries Cache::getByTag(const std::string& tag) {
    ++tagLookupCount_;
    return backend_->getByTag(tag);
}

Entries Cache::getAll() {
    return backend_->getAll();
}

void Cache::set(const std::string& key, const Value& value, const Tags& tags, Ttl ttl) {
    backend_->set(key, value, tags, ttl);
    ++writeCount_;
}

bool Cache::remove(const std::string& key) {
    bool removed = backend_->remove(key);
    if (removed) {
        ++removeCount_;
    }
    return removed;
}

size_t Cache::removeByTag(const std::string& tag) {
    size_t removed = backend_->removeByTag(tag);
    removeCount_ += removed;
    return removed;
}

bool Cache::exists(const std::string& key) {
    return backend_->exists(key);
}

std::string Cache::backendName() const {
    return backend_->backendName();
}

CacheMetrics Cache::getMetrics() const {
    CacheMetrics metrics;
    // Попадания читаются первыми, чтобы не превысить число запросов
    metrics.hitCount = hitCount_.load();
    metrics.requestCount = requestCount_.load();
    metrics.missCount = metrics.requestCount - metrics.hitCount;
    metrics.hitRate = metrics.requestCount == 0
        ? 0.0
        : static_cast<double>(metrics.hitCount) / metrics.requestCount;
    metrics.tagLookupCount = tagLookupCount_.load();
    metrics.writeCount = writeCount_.load();
    metrics.removeCount = removeCount_.load();
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

} // namespace cache
} // namespace tagcache
