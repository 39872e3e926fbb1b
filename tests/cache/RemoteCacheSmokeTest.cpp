#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/cache/remote/RemoteCache.hpp"
#include "support/FakeKeyValueStore.hpp"

using tagcache::Value;
using tagcache::cache::ConnectionRouter;
using tagcache::cache::RemoteCache;
using tagcache::cache::RemoteCacheOptions;
using tagcache::testing::FakeKeyValueStore;

namespace {

struct Fixture {
    std::shared_ptr<FakeKeyValueStore> store = std::make_shared<FakeKeyValueStore>();
    RemoteCache cache;

    explicit Fixture(RemoteCacheOptions options = RemoteCacheOptions{})
        : cache(ConnectionRouter::fixed(store), options) {}
};

bool holds(const std::optional<Value>& value, const Value& expected) {
    return value && *value == expected;
}

} // namespace

void smokeTestBasicOperations() {
    Fixture f;
    assert(!f.cache.get("missing"));
    assert(!f.cache.exists("missing"));
    assert(!f.cache.remove("missing"));

    f.cache.set("key1", "value1");
    assert(holds(f.cache.get("key1"), "value1"));
    assert(f.cache.exists("key1"));
    assert(f.store->has("cache:key1"));
    // Без тегов служебные множества не создаются
    assert(!f.store->has("cache:key_tags:key1"));

    Value complex = {
        {"string", "hello"},
        {"number", 42},
        {"list", {1, 2, 3}},
        {"dict", {{"nested", "value"}}},
        {"none", nullptr}
    };
    f.cache.set("complex", complex);
    assert(holds(f.cache.get("complex"), complex));

    f.cache.set("null", nullptr);
    auto stored = f.cache.get("null");
    assert(stored && stored->is_null());

    assert(f.cache.remove("key1"));
    assert(!f.cache.get("key1"));
    assert(!f.cache.remove("key1"));
    assert(f.cache.backendName() == "redis");
    std::cout << "[OK] RemoteCache basic operations\n";
}

void smokeTestIndexLayout() {
    Fixture f;
    f.cache.set("k1", "v", {"a", "b", "a"});
    assert(f.store->has("cache:k1"));
    assert(f.store->members("cache:key_tags:k1") == (std::set<std::string>{"a", "b"}));
    assert(f.store->members("cache:tag:a") == (std::set<std::string>{"k1"}));
    assert(f.store->members("cache:tag:b") == (std::set<std::string>{"k1"}));

    // Новый набор тегов полностью заменяет старый, пустые теги удаляются
    f.cache.set("k1", "w", {"c"});
    assert(!f.store->has("cache:tag:a"));
    assert(!f.store->has("cache:tag:b"));
    assert(f.store->members("cache:tag:c") == (std::set<std::string>{"k1"}));
    assert(f.store->members("cache:key_tags:k1") == (std::set<std::string>{"c"}));
    assert(f.cache.getByTag("a").empty());
    assert(f.cache.getByTag("c").at("k1") == "w");

    // set без тегов снимает все теги
    f.cache.set("k1", "plain");
    assert(!f.store->has("cache:tag:c"));
    assert(!f.store->has("cache:key_tags:k1"));
    assert(f.cache.exists("k1"));

    f.cache.set("k2", 2, {"shared"});
    f.cache.set("k3", 3, {"shared"});
    assert(f.cache.remove("k2"));
    assert(f.store->members("cache:tag:shared") == (std::set<std::string>{"k3"}));
    assert(f.cache.remove("k3"));
    assert(!f.store->has("cache:tag:shared"));
    std::cout << "[OK] RemoteCache index layout\n";
}

void smokeTestTagScenario() {
    Fixture f;
    f.cache.set("k1", "v1", {"t1", "t2"});
    f.cache.set("k2", "v2", {"t1", "t3"});
    f.cache.set("k3", "v3", {"t2", "t3"});

    auto t1 = f.cache.getByTag("t1");
    assert(t1.size() == 2);
    assert(t1.at("k1") == "v1");
    assert(t1.at("k2") == "v2");

    assert(f.cache.removeByTag("t1") == 2);
    assert(!f.cache.exists("k1"));
    assert(!f.cache.exists("k2"));
    assert(f.cache.exists("k3"));

    auto t2 = f.cache.getByTag("t2");
    assert(t2.size() == 1);
    assert(t2.at("k3") == "v3");
    assert(f.cache.getByTag("t1").empty());
    assert(f.cache.getByTag("unknown").empty());
    assert(f.cache.removeByTag("unknown") == 0);
    std::cout << "[OK] RemoteCache tag scenario\n";
}

void smokeTestTtlExpiry() {
    Fixture f;
    f.cache.set("ttl_key", "v", {"tg"}, std::chrono::seconds(2));
    assert(holds(f.cache.get("ttl_key"), "v"));
    assert(f.cache.getByTag("tg").size() == 1);

    f.store->data().advance(std::chrono::seconds(3));
    assert(!f.cache.get("ttl_key"));
    assert(!f.cache.exists("ttl_key"));
    assert(f.cache.getByTag("tg").empty());
    // Запись о тегах ключа истекает вместе со значением, множество тега - нет
    assert(!f.store->has("cache:key_tags:ttl_key"));
    assert(f.store->has("cache:tag:tg"));

    // Висячая ссылка не считается удалённой и вычищается
    assert(f.cache.removeByTag("tg") == 0);
    assert(!f.store->has("cache:tag:tg"));

    // Повторный set без TTL делает запись бессрочной
    f.cache.set("again", 1, {"x"}, std::chrono::seconds(1));
    f.cache.set("again", 2, {"x"});
    f.store->data().advance(std::chrono::seconds(5));
    assert(holds(f.cache.get("again"), 2));
    assert(f.cache.getByTag("x").size() == 1);

    bool rejected = false;
    try {
        f.cache.set("bad", 1, {}, std::chrono::seconds(-1));
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    assert(!f.cache.exists("bad"));
    std::cout << "[OK] RemoteCache TTL expiry\n";
}

void smokeTestGetAll() {
    Fixture f;
    f.cache.set("key1", "value1", {"t"});
    f.cache.set("key2", "value2");
    f.cache.set("key3", "value3", {"t", "u"});

    // Другой кэш с другим префиксом в том же хранилище
    RemoteCacheOptions otherOptions;
    otherOptions.prefix = "other:";
    RemoteCache other(ConnectionRouter::fixed(f.store), otherOptions);
    other.set("foreign", 1, {"t"});

    auto all = f.cache.getAll();
    assert(all.size() == 3);
    assert(all.at("key1") == "value1");
    assert(all.at("key2") == "value2");
    assert(all.at("key3") == "value3");

    auto otherAll = other.getAll();
    assert(otherAll.size() == 1);
    assert(otherAll.count("foreign") == 1);
    assert(f.cache.getByTag("t").size() == 2);
    std::cout << "[OK] RemoteCache getAll\n";
}

void smokeTestErrors() {
    Fixture f;
    f.store->putRaw("cache:broken", tagcache::Bytes{0xc1, 0xff, 0x00});
    bool serialization = false;
    try {
        f.cache.get("broken");
    } catch (const tagcache::SerializationError&) {
        serialization = true;
    }
    assert(serialization);

    f.store->offline = true;
    bool connection = false;
    try {
        f.cache.get("key");
    } catch (const tagcache::ConnectionError&) {
        connection = true;
    }
    assert(connection);

    connection = false;
    try {
        f.cache.set("key", 1, {"t"});
    } catch (const tagcache::ConnectionError&) {
        connection = true;
    }
    assert(connection);
    std::cout << "[OK] RemoteCache errors surface\n";
}

void smokeTestCodecs() {
    for (auto format : {tagcache::codec::CodecFormat::MessagePack,
                        tagcache::codec::CodecFormat::Cbor,
                        tagcache::codec::CodecFormat::Json}) {
        RemoteCacheOptions options;
        options.codec = format;
        Fixture f(options);
        Value value = {{"a", {1, 2.5, "x", nullptr, true}}};
        f.cache.set("k", value, {"t"});
        assert(holds(f.cache.get("k"), value));
        assert(f.cache.getByTag("t").at("k") == value);
    }
    std::cout << "[OK] RemoteCache codecs\n";
}

int main() {
    smokeTestBasicOperations();
    smokeTestIndexLayout();
    smokeTestTagScenario();
    smokeTestTtlExpiry();
    smokeTestGetAll();
    smokeTestErrors();
    smokeTestCodecs();
    std::cout << "All RemoteCache tests passed!\n";
    return 0;
}
