#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "tagcache/cache/base/TaggedCache.hpp"
#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/cache/metrics/CacheMetrics.hpp"

namespace tagcache {
namespace cache {

/**
 * @brief Точка входа: выбирает бэкенд по конфигурации и передаёт ему вызовы.
 * @details Поддерживаемые бэкенды: "memory", "redis", "redis-sentinel".
 * Неизвестное имя - ConfigurationError("Unsupported backend: <name>").
 */
class Cache {
public:
    explicit Cache(const CacheConfig& config = CacheConfig{});
    // Обернуть готовый бэкенд
    explicit Cache(std::unique_ptr<TaggedCache> backend);
    ~Cache();

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    std::optional<Value> get(const std::string& key);
    Entries getByTag(const std::string& tag);
    Entries getAll();
    void set(const std::string& key, const Value& value,
             const Tags& tags = {}, Ttl ttl = std::nullopt);
    bool remove(const std::string& key);
    size_t removeByTag(const std::string& tag);
    bool exists(const std::string& key);

    std::string backendName() const;
    TaggedCache& backend() { return *backend_; }

    // Получение метрик
    CacheMetrics getMetrics() const;

private:
    std::unique_ptr<TaggedCache> backend_;

    std::atomic<size_t> requestCount_{0};
    std::atomic<size_t> hitCount_{0};
    std::atomic<size_t> tagLookupCount_{0};
    std::atomic<size_t> writeCount_{0};
    std::atomic<size_t> removeCount_{0};
};

/// Создать бэкенд по конфигурации без обёртки.
std::unique_ptr<TaggedCache> makeBackend(const CacheConfig& config);

} // namespace cache
} // namespace tagcache
