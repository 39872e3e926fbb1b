#pragma once

#include <functional>
#include <memory>
#include <string>
#include "tagcache/cache/base/TaggedCache.hpp"
#include "tagcache/codec/ValueCodec.hpp"
#include "tagcache/store/KeyValueStore.hpp"
#include "tagcache/store/ServiceDiscovery.hpp"

namespace tagcache {
namespace cache {

/**
 * @brief Выбор соединения для каждого примитивного вызова.
 * primary - запись и чтения внутри последовательности записи,
 * replica - самостоятельные чтения.
 */
struct ConnectionRouter {
    using Resolver = std::function<std::shared_ptr<store::KeyValueStore>()>;

    Resolver primary;
    Resolver replica;

    /// Одно соединение для всего.
    static ConnectionRouter fixed(std::shared_ptr<store::KeyValueStore> store);
    /// Каждый вызов заново спрашивает discovery.
    static ConnectionRouter discovered(std::shared_ptr<store::ServiceDiscovery> discovery);
};

struct RemoteCacheOptions {
    std::string prefix = "cache:";
    codec::CodecFormat codec = codec::CodecFormat::MessagePack;
    std::string backendName = "redis";
};

/**
 * @brief Кэш с тегами поверх удалённого хранилища ключ-значение.
 *
 * Раскладка ключей:
 *   prefix + key               - закодированное значение
 *   prefix + "tag:" + tag      - множество ключей тега (без TTL)
 *   prefix + "key_tags:" + key - множество тегов ключа (TTL как у значения)
 *
 * Транзакций нет: set и remove пересобирают индекс ключа с нуля,
 * чтения по тегу пропускают ключи, значение которых уже истекло.
 * Параллельный set одного ключа может смешать теги двух вызовов.
 */
class RemoteCache : public TaggedCache {
public:
    RemoteCache(ConnectionRouter router, RemoteCacheOptions options);
    ~RemoteCache() override;

    RemoteCache(const RemoteCache&) = delete;
    RemoteCache& operator=(const RemoteCache&) = delete;

    std::optional<Value> get(const std::string& key) override;
    Entries getByTag(const std::string& tag) override;
    Entries getAll() override;
    void set(const std::string& key, const Value& value,
             const Tags& tags = {}, Ttl ttl = std::nullopt) override;
    bool remove(const std::string& key) override;
    size_t removeByTag(const std::string& tag) override;
    bool exists(const std::string& key) override;
    std::string backendName() const override { return options_.backendName; }

    const std::string& prefix() const { return options_.prefix; }
    std::string dataKey(const std::string& key) const { return options_.prefix + key; }
    std::string tagKey(const std::string& tag) const { return tagPrefix_ + tag; }
    std::string keyTagsKey(const std::string& key) const { return keyTagsPrefix_ + key; }

private:
    std::shared_ptr<store::KeyValueStore> primary() const;
    std::shared_ptr<store::KeyValueStore> replica() const;
    // Шаги 1-3 протокола set: снять ключ со всех прежних тегов
    void detach(const std::string& key);
    void pruneTag(const std::string& tagKey);
    Value decode(const std::string& storageKey, const Bytes& bytes) const;

    ConnectionRouter router_;
    RemoteCacheOptions options_;
    std::string tagPrefix_;
    std::string keyTagsPrefix_;
    codec::ValueCodec codec_;
};

} // namespace cache
} // namespace tagcache
