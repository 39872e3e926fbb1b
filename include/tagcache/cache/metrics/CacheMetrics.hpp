#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace tagcache {
namespace cache {

struct CacheMetrics {
    size_t requestCount = 0;        // Количество запросов get
    size_t hitCount = 0;            // Попадания
    size_t missCount = 0;           // Промахи
    double hitRate = 0.0;           // Частота попаданий
    size_t tagLookupCount = 0;      // Запросы getByTag
    size_t writeCount = 0;          // Вызовы set
    size_t removeCount = 0;         // Удалённые записи (remove и removeByTag)
    std::chrono::steady_clock::time_point lastUpdate; // Время последнего обновления

    nlohmann::json toJson() const {
        return {
            {"requestCount", requestCount},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"hitRate", hitRate},
            {"tagLookupCount", tagLookupCount},
            {"writeCount", writeCount},
            {"removeCount", removeCount},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace tagcache
