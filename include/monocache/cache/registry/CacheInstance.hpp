#pragma once

#include <memory>
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "monocache/cache/CacheConfig.hpp"
#include "monocache/cache/base/BaseStore.hpp"
#include "monocache/cache/store/ConcurrentStore.hpp"
#include "monocache/cache/registry/SingleInstanceGuard.hpp"

namespace monocache {
namespace cache {

class InstanceRegistry;

// CacheInstance — единственный экземпляр кэша процесса, создаётся только InstanceRegistry
class CacheInstance : public BaseStore {
public:
    ~CacheInstance() override = default;
    CacheInstance(const CacheInstance&) = delete;
    CacheInstance& operator=(const CacheInstance&) = delete;
    CacheInstance(CacheInstance&&) = delete;
    CacheInstance& operator=(CacheInstance&&) = delete;

    void add(const std::string& key, const std::string& value) override; // Сохранить
    std::optional<std::string> get(const std::string& key) const override; // Получить
    bool remove(const std::string& key) override; // Удалить
    size_t size() const override; // Размер

    ConcurrentStore& store() noexcept { return store_; }
    const ConcurrentStore& store() const noexcept { return store_; }
    const CacheConfig& config() const noexcept { return config_; }

    std::unique_ptr<CacheInstance> clone() const; // Всегда CloneNotSupportedError
    static std::unique_ptr<CacheInstance> fromJson(const nlohmann::json& j); // Всегда DuplicateInstantiationError
    nlohmann::json toJson() const; // Снимок {"name", "entries"}
    void loadSnapshot(const nlohmann::json& j); // Импорт снимка в этот экземпляр

    static constexpr const char* TYPE_NAME = "CacheInstance";

private:
    friend class InstanceRegistry;
    explicit CacheInstance(const CacheConfig& config);

    SingleInstanceGuard<CacheInstance> guard_; // Должен быть первым членом
    CacheConfig config_;
    ConcurrentStore store_;
};

} // namespace cache
} // namespace monocache
