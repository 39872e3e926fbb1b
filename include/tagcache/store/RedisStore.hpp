#pragma once

#include <memory>
#include <optional>
#include <string>
#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/store/KeyValueStore.hpp"

namespace tagcache {
namespace store {

// Адрес и параметры подключения к одному узлу Redis
struct RedisEndpoint {
    std::string host = "localhost";
    int port = 6379;
    int db = 0;
    std::optional<std::string> password;
    cache::ConnectionOptions connection;
};

/**
 * @brief KeyValueStore поверх одного соединения hiredis.
 * Подключается в конструкторе (ConnectionError при неудаче).
 * Вызовы сериализуются внутренним мьютексом.
 */
class RedisStore : public KeyValueStore {
public:
    explicit RedisStore(const RedisEndpoint& endpoint);
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::optional<Bytes> get(const std::string& key) override;
    void set(const std::string& key, const Bytes& value) override;
    void setWithTtl(const std::string& key, const Bytes& value, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    void expire(const std::string& key, std::chrono::seconds ttl) override;
    std::vector<std::string> keysWithPrefix(const std::string& prefix) override;

    void setAdd(const std::string& setKey, const std::vector<std::string>& members) override;
    void setRemove(const std::string& setKey, const std::string& member) override;
    std::unordered_set<std::string> setMembers(const std::string& setKey) override;
    size_t setCardinality(const std::string& setKey) override;

    std::string describe() const override;

    /// Проверка соединения (PING).
    void ping();
    /// Роль узла по команде ROLE: "master", "slave" или "sentinel".
    std::string role();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace store
} // namespace tagcache
