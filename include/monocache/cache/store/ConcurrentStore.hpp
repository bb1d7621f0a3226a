#pragma once

#include <string>
#include <optional>
#include <unordered_map>
#include <memory>
#include <atomic>
#include <shared_mutex>
#include <spdlog/spdlog.h>
#include "monocache/cache/CacheConfig.hpp"
#include "monocache/cache/base/BaseStore.hpp"
#include "monocache/cache/metrics/CacheMetrics.hpp"

namespace monocache {
namespace cache {

// ConcurrentStore — потокобезопасное строковое key-value хранилище.
// Каждая операция атомарна: читатель видит либо старое, либо новое значение ключа.
// Блокировка держится только на время операции с map, логирование — вне её.
class ConcurrentStore : public BaseStore {
public:
    using Map = std::unordered_map<std::string, std::string>;

    explicit ConcurrentStore(const CacheConfig& config = CacheConfig{}); // Конструктор
    ~ConcurrentStore() override = default;
    ConcurrentStore(const ConcurrentStore&) = delete;
    ConcurrentStore& operator=(const ConcurrentStore&) = delete;

    void add(const std::string& key, const std::string& value) override; // Вставить/заменить
    std::optional<std::string> get(const std::string& key) const override; // Получить
    bool remove(const std::string& key) override; // Удалить
    bool contains(const std::string& key) const; // Есть ли ключ
    size_t size() const override; // Кол-во записей
    void clear(); // Очистить
    Map exportAll() const; // Экспорт (согласованная копия)
    void importAll(const Map& data); // Импорт пачкой, всё или ничего
    CacheMetrics getMetrics() const; // Метрики
    const std::string& name() const noexcept { return name_; }
    bool isValidKey(const std::string& key) const noexcept;

private:
    std::string name_;
    size_t maxKeyLength_;
    bool metricsEnabled_;
    Map data_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> writes_{0};
    std::atomic<size_t> removals_{0};
    std::atomic<size_t> rejected_{0};
    [[noreturn]] void rejectKey(const std::string& key);
};

} // namespace cache
} // namespace monocache
