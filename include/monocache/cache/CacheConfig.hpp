#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "monocache/common/JsonConfig.hpp"

namespace monocache {
namespace cache {

constexpr size_t MAX_INITIAL_CAPACITY = size_t(1) << 24; // 16M бакетов
constexpr size_t MAX_KEY_LENGTH_LIMIT = size_t(1) << 20; // 1 MB

// CacheConfig — параметры кэша (ёмкость, ограничение ключа, метрики)
struct CacheConfig {
    std::string name = "default";  // Имя хранилища (для логов и снимков)
    size_t initialCapacity = 1024; // Начальное число бакетов
    size_t maxKeyLength = 0;       // Макс. длина ключа (0 = без ограничения)
    bool enableMetrics = true;     // Метрики
    bool validate() const {
        return !name.empty()
            && initialCapacity <= MAX_INITIAL_CAPACITY
            && maxKeyLength <= MAX_KEY_LENGTH_LIMIT;
    }
    nlohmann::json toJson() const {
        return {
            {"name", name},
            {"initialCapacity", initialCapacity},
            {"maxKeyLength", maxKeyLength},
            {"enableMetrics", enableMetrics}
        };
    }
    static CacheConfig fromJson(const nlohmann::json& j); // Бросает ConfigError
};

} // namespace cache
} // namespace monocache
