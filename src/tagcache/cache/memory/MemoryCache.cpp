#include "tagcache/cache/memory/MemoryCache.hpp"
#include <vector>
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace cache {

MemoryCache::MemoryCache() {
    log::get()->debug("MemoryCache created");
}

MemoryCache::~MemoryCache() = default;

std::optional<Value> MemoryCache::get(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        log::get()->trace("MemoryCache miss: {}", key);
        return std::nullopt;
    }
    return it->second;
}

Entries MemoryCache::getByTag(const std::string& tag) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Entries result;
    auto it = tagRegistry_.find(tag);
    if (it == tagRegistry_.end()) {
        return result;
    }
    for (const auto& key : it->second) {
        auto entry = cache_.find(key);
        if (entry != cache_.end()) {
            result.emplace(key, entry->second);
        }
    }
    return result;
}

Entries MemoryCache::getAll() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return Entries(cache_.begin(), cache_.end());
}

void MemoryCache::set(const std::string& key, const Value& value, const Tags& tags, Ttl ttl) {
    validateTtl(ttl);
    if (ttl) {
        log::get()->debug("MemoryCache ignores TTL of {}s for key {}", ttl->count(), key);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Сначала отвязываем старые теги, затем пишем значение и новые теги
    detachLocked(key);
    cache_[key] = value;

    if (tags.empty()) {
        return;
    }
    std::unordered_set<std::string> tagSet(tags.begin(), tags.end());
    for (const auto& tag : tagSet) {
        tagRegistry_[tag].insert(key);
    }
    keyTags_[key] = std::move(tagSet);
}

bool MemoryCache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return removeLocked(key);
}

size_t MemoryCache::removeByTag(const std::string& tag) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tagRegistry_.find(tag);
    if (it == tagRegistry_.end()) {
        return 0;
    }
    // Копия: removeLocked меняет tagRegistry_
    std::vector<std::string> keys(it->second.begin(), it->second.end());
    size_t count = 0;
    for (const auto& key : keys) {
        if (removeLocked(key)) {
            ++count;
        }
    }
    log::get()->debug("MemoryCache removed {} entries with tag {}", count, tag);
    return count;
}

bool MemoryCache::exists(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.count(key) > 0;
}

size_t MemoryCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t MemoryCache::tagCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tagRegistry_.size();
}

std::unordered_set<std::string> MemoryCache::tagsOf(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = keyTags_.find(key);
    if (it == keyTags_.end()) {
        return {};
    }
    return it->second;
}

void MemoryCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    tagRegistry_.clear();
    keyTags_.clear();
}

bool MemoryCache::removeLocked(const std::string& key) {
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    cache_.erase(it);
    detachLocked(key);
    return true;
}

void MemoryCache::detachLocked(const std::string& key) {
    auto it = keyTags_.find(key);
    if (it == keyTags_.end()) {
        return;
    }
    for (const auto& tag : it->second) {
        auto registered = tagRegistry_.find(tag);
        if (registered == tagRegistry_.end()) {
            continue;
        }
        registered->second.erase(key);
        // Пустые теги удаляются
        if (registered->second.empty()) {
            tagRegistry_.erase(registered);
        }
    }
    keyTags_.erase(it);
}

} // namespace cache
} // namespace tagcache
