#pragma once

#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "tagcache/cache/base/TaggedCache.hpp"

namespace tagcache {
namespace cache {

/**
 * @brief Кэш с тегами в памяти процесса.
 * @details Основная таблица и оба индекса (тег -> ключи, ключ -> теги)
 * защищены одним shared_mutex: чтения идут под общей блокировкой,
 * set/remove/removeByTag целиком под эксклюзивной. TTL не поддерживается.
 * Каждый экземпляр владеет своими структурами.
 */
class MemoryCache : public TaggedCache {
public:
    MemoryCache();
    ~MemoryCache() override;

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    std::optional<Value> get(const std::string& key) override;
    Entries getByTag(const std::string& tag) override;
    Entries getAll() override;
    void set(const std::string& key, const Value& value,
             const Tags& tags = {}, Ttl ttl = std::nullopt) override;
    bool remove(const std::string& key) override;
    size_t removeByTag(const std::string& tag) override;
    bool exists(const std::string& key) override;
    std::string backendName() const override { return "memory"; }

    // Количество записей
    size_t size() const;
    // Количество непустых тегов
    size_t tagCount() const;
    // Теги ключа (пусто, если ключа нет)
    std::unordered_set<std::string> tagsOf(const std::string& key) const;
    // Очистить кэш и индексы
    void clear();

private:
    bool removeLocked(const std::string& key);
    void detachLocked(const std::string& key);

    std::unordered_map<std::string, Value> cache_;
    std::unordered_map<std::string, std::unordered_set<std::string>> tagRegistry_;  // тег -> ключи
    std::unordered_map<std::string, std::unordered_set<std::string>> keyTags_;      // ключ -> теги
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace tagcache
