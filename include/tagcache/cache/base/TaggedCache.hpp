#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "tagcache/codec/ValueCodec.hpp"

namespace tagcache {
namespace cache {

using Tags = std::vector<std::string>;
using Entries = std::unordered_map<std::string, Value>;
using Ttl = std::optional<std::chrono::seconds>;

/**
 * @brief Единый интерфейс кэша с тегами для всех бэкендов.
 * @details Отсутствующий ключ или тег - не ошибка. Сбои хранилища
 * бросают ConnectionError, ошибки кодека - SerializationError.
 */
class TaggedCache {
public:
    virtual ~TaggedCache() = default;
    /// Получить значение по ключу.
    virtual std::optional<Value> get(const std::string& key) = 0;
    /// Все живые записи с тегом; пусто, если тег неизвестен.
    virtual Entries getByTag(const std::string& tag) = 0;
    /// Все живые записи бэкенда.
    virtual Entries getAll() = 0;
    /**
     * @brief Сохранить значение и заменить набор тегов ключа.
     * @param tags Новые теги (дубликаты игнорируются); пустой список снимает все теги
     * @param ttl Время жизни в секундах, > 0. Локальный бэкенд его игнорирует.
     */
    virtual void set(const std::string& key, const Value& value,
                     const Tags& tags = {}, Ttl ttl = std::nullopt) = 0;
    /// Удалить ключ и отвязать его от всех тегов. true, если ключ существовал.
    virtual bool remove(const std::string& key) = 0;
    /// Удалить все ключи с тегом. Возвращает число реально удалённых.
    virtual size_t removeByTag(const std::string& tag) = 0;
    /// Проверить наличие ключа.
    virtual bool exists(const std::string& key) = 0;
    /// "memory", "redis" или "redis-sentinel".
    virtual std::string backendName() const = 0;
};

/// Проверка ttl: std::invalid_argument, если задан и не положителен.
void validateTtl(const Ttl& ttl);

} // namespace cache
} // namespace tagcache
