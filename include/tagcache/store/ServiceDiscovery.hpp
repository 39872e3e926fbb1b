#pragma once

#include <memory>
#include <string>
#include "tagcache/store/KeyValueStore.hpp"

namespace tagcache {
namespace store {

/**
 * @brief Поиск текущих узлов реплицированного хранилища.
 * Каждый вызов заново выясняет топологию; при недоступности
 * механизма обнаружения бросается ConnectionError.
 */
class ServiceDiscovery {
public:
    virtual ~ServiceDiscovery() = default;

    /// Соединение с текущим primary.
    virtual std::shared_ptr<KeyValueStore> resolvePrimary() = 0;
    /// Соединение с одной из реплик (или с primary, если реплик нет).
    virtual std::shared_ptr<KeyValueStore> resolveReplica() = 0;

    virtual std::string serviceName() const = 0;
};

} // namespace store
} // namespace tagcache
