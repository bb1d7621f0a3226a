#include "monocache/cache/registry/InstanceRegistry.hpp"
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/logging/Logging.hpp"
#include <atomic>
#include <mutex>

namespace monocache {
namespace cache {

namespace {

// Open -> Constructing -> Created; при ошибке конструктора Constructing -> Open
enum class RegistryState { Open, Constructing, Created };

std::mutex& configMutex() {
    static std::mutex mutex;
    return mutex;
}

CacheConfig& pendingConfig() {
    static CacheConfig config;
    return config;
}

std::atomic<RegistryState>& state() {
    static std::atomic<RegistryState> value{RegistryState::Open};
    return value;
}

} // namespace

CacheInstance& InstanceRegistry::getInstance() {
    // Инициализация локальной static-переменной потокобезопасна: конкурирующие
    // потоки ждут завершения конструктора и видят полностью созданный объект.
    // Если конструктор бросил исключение, следующий вызов повторит попытку.
    static CacheInstance instance = createInstance();
    static const bool created = markCreated();
    (void)created;
    return instance;
}

CacheInstance InstanceRegistry::createInstance() {
    CacheConfig config;
    {
        std::lock_guard<std::mutex> lock(configMutex());
        state().store(RegistryState::Constructing, std::memory_order_release);
        config = pendingConfig();
    }
    try {
        return CacheInstance(config);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(configMutex());
            state().store(RegistryState::Open, std::memory_order_release);
        }
        logging::getLogger()->error("InstanceRegistry: failed to create instance '{}': {}", config.name, e.what());
        throw;
    }
}

bool InstanceRegistry::markCreated() noexcept {
    // Из Constructing в Open не возвращаемся, configure() видит отказ и без мьютекса
    state().store(RegistryState::Created, std::memory_order_release);
    return true;
}

bool InstanceRegistry::configure(const CacheConfig& config) {
    if (!config.validate()) {
        throw ConfigError("InstanceRegistry: invalid configuration");
    }
    {
        std::lock_guard<std::mutex> lock(configMutex());
        if (state().load(std::memory_order_acquire) == RegistryState::Open) {
            pendingConfig() = config;
            return true;
        }
    }
    logging::getLogger()->warn("InstanceRegistry: instance already created, configuration '{}' ignored", config.name);
    return false;
}

bool InstanceRegistry::isInitialized() noexcept {
    return state().load(std::memory_order_acquire) == RegistryState::Created;
}

} // namespace cache
} // namespace monocache
