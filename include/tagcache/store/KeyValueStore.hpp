#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "tagcache/codec/ValueCodec.hpp"

namespace tagcache {
namespace store {

/**
 * @brief Минимальный набор операций удалённого хранилища ключ-значение.
 * Все методы бросают ConnectionError при недоступности хранилища
 * и StoreError при ответе-ошибке сервера.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// Значение по ключу; nullopt, если ключа нет.
    virtual std::optional<Bytes> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const Bytes& value) = 0;
    virtual void setWithTtl(const std::string& key, const Bytes& value, std::chrono::seconds ttl) = 0;
    /// true, если ключ существовал.
    virtual bool remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual void expire(const std::string& key, std::chrono::seconds ttl) = 0;
    /// Все ключи, начинающиеся с prefix.
    virtual std::vector<std::string> keysWithPrefix(const std::string& prefix) = 0;

    // Операции над множествами
    virtual void setAdd(const std::string& setKey, const std::vector<std::string>& members) = 0;
    virtual void setRemove(const std::string& setKey, const std::string& member) = 0;
    virtual std::unordered_set<std::string> setMembers(const std::string& setKey) = 0;
    virtual size_t setCardinality(const std::string& setKey) = 0;

    /// Адрес хранилища для журналов.
    virtual std::string describe() const = 0;
};

} // namespace store
} // namespace tagcache
