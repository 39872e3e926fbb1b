#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "tagcache/store/KeyValueStore.hpp"

namespace tagcache {
namespace store {

/// Адрес узла: host и port.
using NodeAddress = std::pair<std::string, int>;
/// Поля одной записи ответа SENTINEL replicas ("ip", "port", "flags", ...).
using ReplicaFields = std::unordered_map<std::string, std::string>;

/// Порт из ответа Sentinel; StoreError, если это не число.
int parseNodePort(const std::string& text);

/// false, если флаги содержат s_down, o_down или disconnected.
bool isHealthyReplica(const std::string& flags);

/// Адреса исправных реплик в порядке ответа. Записи без ip или port пропускаются.
std::vector<NodeAddress> healthyReplicas(const std::vector<ReplicaFields>& entries);

/**
 * @brief Перебор реплик по кругу.
 * @details Недоступная реплика (ConnectionError при открытии) пропускается,
 * без доступных реплик используется fallback (обычно primary).
 * Не потокобезопасно: синхронизация на стороне владельца.
 */
class ReplicaSelector {
public:
    using Opener = std::function<std::shared_ptr<KeyValueStore>(const NodeAddress&)>;
    using Fallback = std::function<std::shared_ptr<KeyValueStore>()>;

    std::shared_ptr<KeyValueStore> select(const std::vector<NodeAddress>& replicas,
                                          const Opener& open,
                                          const Fallback& fallback);

private:
    size_t cursor_ = 0;
};

} // namespace store
} // namespace tagcache
