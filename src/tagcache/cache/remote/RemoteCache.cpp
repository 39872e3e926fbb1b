#include "tagcache/cache/remote/RemoteCache.hpp"
#include <unordered_set>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace cache {

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

// Убрать дубликаты, сохранив порядок
Tags uniqueTags(const Tags& tags) {
    Tags unique;
    std::unordered_set<std::string> seen;
    for (const auto& tag : tags) {
        if (seen.insert(tag).second) {
            unique.push_back(tag);
        }
    }
    return unique;
}

} // namespace

ConnectionRouter ConnectionRouter::fixed(std::shared_ptr<store::KeyValueStore> store) {
    if (!store) {
        throw ConfigurationError("ConnectionRouter requires a store");
    }
    auto resolver = [store]() { return store; };
    return ConnectionRouter{resolver, resolver};
}

ConnectionRouter ConnectionRouter::discovered(std::shared_ptr<store::ServiceDiscovery> discovery) {
    if (!discovery) {
        throw ConfigurationError("ConnectionRouter requires a discovery service");
    }
    ConnectionRouter router;
    router.primary = [discovery]() {
        auto store = discovery->resolvePrimary();
        if (!store) {
            throw ConnectionError("No primary available for service '" + discovery->serviceName() + "'");
        }
        return store;
    };
    router.replica = [discovery]() {
        auto store = discovery->resolveReplica();
        if (!store) {
            throw ConnectionError("No replica available for service '" + discovery->serviceName() + "'");
        }
        return store;
    };
    return router;
}

RemoteCache::RemoteCache(ConnectionRouter router, RemoteCacheOptions options)
    : router_(std::move(router))
    , options_(std::move(options))
    , tagPrefix_(options_.prefix + "tag:")
    , keyTagsPrefix_(options_.prefix + "key_tags:")
    , codec_(options_.codec) {
    if (!router_.primary || !router_.replica) {
        throw ConfigurationError("RemoteCache requires primary and replica resolvers");
    }
    log::get()->info("RemoteCache '{}' ready (prefix '{}', codec {})",
                     options_.backendName, options_.prefix, codec::formatName(options_.codec));
}

RemoteCache::~RemoteCache() = default;

std::shared_ptr<store::KeyValueStore> RemoteCache::primary() const {
    return router_.primary();
}

std::shared_ptr<store::KeyValueStore> RemoteCache::replica() const {
    return router_.replica();
}

Value RemoteCache::decode(const std::string& storageKey, const Bytes& bytes) const {
    try {
        return codec_.decode(bytes);
    } catch (const SerializationError& e) {
        log::get()->error("Cannot decode {}: {}", storageKey, e.what());
        throw;
    }
}

std::optional<Value> RemoteCache::get(const std::string& key) {
    auto storageKey = dataKey(key);
    auto bytes = replica()->get(storageKey);
    if (!bytes) {
        return std::nullopt;
    }
    return decode(storageKey, *bytes);
}

Entries RemoteCache::getByTag(const std::string& tag) {
    Entries result;
    auto members = replica()->setMembers(tagKey(tag));
    for (const auto& key : members) {
        // Истекшие значения пропускаются, индекс чинится при следующей записи
        auto value = get(key);
        if (value) {
            result.emplace(key, std::move(*value));
        }
    }
    return result;
}

Entries RemoteCache::getAll() {
    Entries result;
    auto keys = replica()->keysWithPrefix(options_.prefix);
    for (const auto& storageKey : keys) {
        if (startsWith(storageKey, tagPrefix_) || startsWith(storageKey, keyTagsPrefix_)) {
            continue;
        }
        auto bytes = replica()->get(storageKey);
        if (!bytes) {
            continue;
        }
        result.emplace(storageKey.substr(options_.prefix.size()), decode(storageKey, *bytes));
    }
    return result;
}

void RemoteCache::set(const std::string& key, const Value& value, const Tags& tags, Ttl ttl) {
    validateTtl(ttl);
    auto bytes = codec_.encode(value);

    detach(key);

    auto storageKey = dataKey(key);
    if (ttl) {
        primary()->setWithTtl(storageKey, bytes, *ttl);
    } else {
        primary()->set(storageKey, bytes);
    }

    if (tags.empty()) {
        log::get()->debug("{}: set {} ({} bytes)", options_.backendName, key, bytes.size());
        return;
    }

    auto tagSet = uniqueTags(tags);
    auto ownTagsKey = keyTagsKey(key);
    primary()->setAdd(ownTagsKey, tagSet);
    if (ttl) {
        primary()->expire(ownTagsKey, *ttl);
    }
    // Множества тегов живут без TTL и удаляются, когда пустеют
    for (const auto& tag : tagSet) {
        primary()->setAdd(tagKey(tag), {key});
    }
    log::get()->debug("{}: set {} ({} bytes) with {} tag(s)",
                      options_.backendName, key, bytes.size(), tagSet.size());
}

bool RemoteCache::remove(const std::string& key) {
    auto storageKey = dataKey(key);
    if (!replica()->exists(storageKey)) {
        return false;
    }
    detach(key);
    primary()->remove(storageKey);
    log::get()->debug("{}: removed {}", options_.backendName, key);
    return true;
}

size_t RemoteCache::removeByTag(const std::string& tag) {
    auto setKey = tagKey(tag);
    auto members = replica()->setMembers(setKey);
    size_t count = 0;
    for (const auto& key : members) {
        if (remove(key)) {
            ++count;
            continue;
        }
        // Реплика может отставать: ссылку убираем, только если значения нет и на primary
        if (primary()->exists(dataKey(key))) {
            log::get()->debug("{}: {} is still live on primary, keeping it in tag {}",
                              options_.backendName, key, tag);
            continue;
        }
        log::get()->trace("{}: pruning stale member {} of tag {}", options_.backendName, key, tag);
        primary()->setRemove(setKey, key);
        pruneTag(setKey);
    }
    log::get()->debug("{}: removed {} entries with tag {}", options_.backendName, count, tag);
    return count;
}

bool RemoteCache::exists(const std::string& key) {
    return replica()->exists(dataKey(key));
}

void RemoteCache::detach(const std::string& key) {
    auto ownTagsKey = keyTagsKey(key);
    auto previous = primary()->setMembers(ownTagsKey);
    for (const auto& tag : previous) {
        auto setKey = tagKey(tag);
        primary()->setRemove(setKey, key);
        pruneTag(setKey);
    }
    primary()->remove(ownTagsKey);
}

void RemoteCache::pruneTag(const std::string& setKey) {
    if (primary()->setCardinality(setKey) == 0) {
        primary()->remove(setKey);
    }
}

} // namespace cache
} // namespace tagcache
