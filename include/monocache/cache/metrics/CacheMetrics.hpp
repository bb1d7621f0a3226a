#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace monocache {
namespace cache {

// CacheMetrics — метрики хранилища (записи, попадания, промахи, отказы)
struct CacheMetrics {
    size_t entryCount = 0;    // Кол-во записей
    size_t hitCount = 0;      // Попадания
    size_t missCount = 0;     // Промахи
    size_t writeCount = 0;    // Успешные add
    size_t removeCount = 0;   // Удалённые записи
    size_t rejectedCount = 0; // Отклонённые ключи
    double hitRate = 0.0;     // Hit rate
    std::chrono::steady_clock::time_point lastUpdate; // Последнее обновление
    nlohmann::json toJson() const {
        return {
            {"entryCount", entryCount},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"writeCount", writeCount},
            {"removeCount", removeCount},
            {"rejectedCount", rejectedCount},
            {"hitRate", hitRate},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace monocache
