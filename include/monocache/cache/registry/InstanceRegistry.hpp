#pragma once

#include "monocache/cache/CacheConfig.hpp"
#include "monocache/cache/registry/CacheInstance.hpp"

namespace monocache {
namespace cache {

// InstanceRegistry — ленивое создание единственного CacheInstance.
// Первый вызов getInstance() из любого потока создаёт экземпляр ровно один раз,
// последующие вызовы возвращают его без блокировок.
class InstanceRegistry {
public:
    static CacheInstance& getInstance(); // Singleton
    static bool configure(const CacheConfig& config); // false, если экземпляр уже создан
    static bool isInitialized() noexcept; // Создан ли экземпляр
private:
    InstanceRegistry() = delete;
    static CacheInstance createInstance();
    static bool markCreated() noexcept;
};

} // namespace cache
} // namespace monocache
