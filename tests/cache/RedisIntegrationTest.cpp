#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/cache/remote/RedisCache.hpp"
#include "tagcache/store/RedisStore.hpp"

// Требует Redis на localhost:6379; без него тест пропускается (код 77)

namespace {

constexpr int kSkipped = 77;
const char* kPrefix = "tagcache-test:";

void cleanup(tagcache::store::RedisStore& store) {
    for (const auto& key : store.keysWithPrefix(kPrefix)) {
        store.remove(key);
    }
}

} // namespace

void testBasicOperations(tagcache::cache::RemoteCache& cache) {
    cache.set("key1", "value1");
    auto value = cache.get("key1");
    assert(value && *value == "value1");
    assert(cache.exists("key1"));

    tagcache::Value complex = {{"list", {1, 2, 3}}, {"dict", {{"nested", "value"}}}, {"none", nullptr}};
    cache.set("complex", complex);
    value = cache.get("complex");
    assert(value && *value == complex);

    assert(cache.getAll().size() == 2);
    assert(cache.remove("key1"));
    assert(!cache.get("key1"));
    assert(!cache.remove("key1"));
    std::cout << "[OK] Redis basic operations\n";
}

void testTagScenario(tagcache::cache::RemoteCache& cache) {
    cache.set("k1", "v1", {"t1", "t2"});
    cache.set("k2", "v2", {"t1", "t3"});
    cache.set("k3", "v3", {"t2", "t3"});

    auto t1 = cache.getByTag("t1");
    assert(t1.size() == 2);
    assert(t1.at("k1") == "v1" && t1.at("k2") == "v2");

    assert(cache.removeByTag("t1") == 2);
    assert(!cache.exists("k1"));
    assert(!cache.exists("k2"));
    auto t2 = cache.getByTag("t2");
    assert(t2.size() == 1 && t2.at("k3") == "v3");
    std::cout << "[OK] Redis tag scenario\n";
}

void testTtl(tagcache::cache::RemoteCache& cache, tagcache::store::RedisStore& store) {
    cache.set("ttl_key", "v", {"tg"}, std::chrono::seconds(2));
    assert(cache.exists("ttl_key"));
    assert(store.exists(cache.keyTagsKey("ttl_key")));

    std::this_thread::sleep_for(std::chrono::seconds(3));
    assert(!cache.get("ttl_key"));
    assert(cache.getByTag("tg").empty());
    assert(!store.exists(cache.keyTagsKey("ttl_key")));
    assert(cache.removeByTag("tg") == 0);
    assert(!store.exists(cache.tagKey("tg")));
    std::cout << "[OK] Redis TTL expiry\n";
}

int main() {
    tagcache::cache::RedisConfig config;
    config.prefix = kPrefix;
    config.connection.connectTimeout = std::chrono::milliseconds(500);
    config.connection.socketTimeout = std::chrono::milliseconds(2000);

    std::unique_ptr<tagcache::cache::RemoteCache> cache;
    std::unique_ptr<tagcache::store::RedisStore> store;
    try {
        cache = tagcache::cache::makeRedisCache(config);
        tagcache::store::RedisEndpoint endpoint;
        endpoint.host = config.host;
        endpoint.port = config.port;
        endpoint.connection = config.connection;
        store = std::make_unique<tagcache::store::RedisStore>(endpoint);
    } catch (const tagcache::ConnectionError& e) {
        std::cout << "[SKIP] Redis is not available: " << e.what() << "\n";
        return kSkipped;
    }

    store->ping();
    std::cout << "[OK] Redis PING\n";

    cleanup(*store);
    testBasicOperations(*cache);
    cleanup(*store);
    testTagScenario(*cache);
    cleanup(*store);
    testTtl(*cache, *store);
    cleanup(*store);
    std::cout << "All Redis integration tests passed!\n";
    return 0;
}
