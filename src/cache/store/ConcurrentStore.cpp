#include "monocache/cache/store/ConcurrentStore.hpp"
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/logging/Logging.hpp"
#include <mutex>

namespace monocache {
namespace cache {

ConcurrentStore::ConcurrentStore(const CacheConfig& config)
    : name_(config.name),
      maxKeyLength_(config.maxKeyLength),
      metricsEnabled_(config.enableMetrics),
      logger_(logging::getLogger()) {
    if (!config.validate()) {
        throw ConfigError("ConcurrentStore: invalid configuration");
    }
    data_.reserve(config.initialCapacity);
    logger_->debug("ConcurrentStore '{}': created, initialCapacity={}, maxKeyLength={}, metrics={}",
                   name_, config.initialCapacity, maxKeyLength_, metricsEnabled_);
}

bool ConcurrentStore::isValidKey(const std::string& key) const noexcept {
    if (key.empty()) return false;
    return maxKeyLength_ == 0 || key.size() <= maxKeyLength_;
}

void ConcurrentStore::rejectKey(const std::string& key) {
    if (metricsEnabled_) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
    }
    logger_->warn("ConcurrentStore '{}': rejected key of length {}", name_, key.size());
    throw InvalidKeyError(key);
}

void ConcurrentStore::add(const std::string& key, const std::string& value) {
    if (!isValidKey(key)) {
        rejectKey(key);
    }
    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        replaced = !data_.insert_or_assign(key, value).second;
    }
    if (metricsEnabled_) {
        writes_.fetch_add(1, std::memory_order_relaxed);
    }
    logger_->trace("ConcurrentStore '{}': {} key='{}', size={}", name_,
                   replaced ? "replaced" : "inserted", key, value.size());
}

std::optional<std::string> ConcurrentStore::get(const std::string& key) const {
    if (!isValidKey(key)) {
        return std::nullopt;
    }
    std::optional<std::string> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it != data_.end()) {
            result = it->second;
        }
    }
    if (metricsEnabled_) {
        (result ? hits_ : misses_).fetch_add(1, std::memory_order_relaxed);
    }
    return result;
}

bool ConcurrentStore::remove(const std::string& key) {
    if (!isValidKey(key)) {
        return false;
    }
    bool removed = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed = data_.erase(key) > 0;
    }
    if (removed) {
        if (metricsEnabled_) {
            removals_.fetch_add(1, std::memory_order_relaxed);
        }
        logger_->trace("ConcurrentStore '{}': removed key='{}'", name_, key);
    }
    return removed;
}

bool ConcurrentStore::contains(const std::string& key) const {
    if (!isValidKey(key)) {
        return false;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.find(key) != data_.end();
}

size_t ConcurrentStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

void ConcurrentStore::clear() {
    size_t cleared = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cleared = data_.size();
        data_.clear();
    }
    if (metricsEnabled_) {
        removals_.fetch_add(cleared, std::memory_order_relaxed);
    }
    logger_->debug("ConcurrentStore '{}': cleared {} entries", name_, cleared);
}

ConcurrentStore::Map ConcurrentStore::exportAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_;
}

void ConcurrentStore::importAll(const Map& data) {
    // Ключи проверяются до захвата блокировки: при ошибке пачка не применяется
    for (const auto& [key, _] : data) {
        if (!isValidKey(key)) {
            rejectKey(key);
        }
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [key, value] : data) {
            data_.insert_or_assign(key, value);
        }
    }
    if (metricsEnabled_) {
        writes_.fetch_add(data.size(), std::memory_order_relaxed);
    }
    logger_->debug("ConcurrentStore '{}': imported {} entries", name_, data.size());
}

CacheMetrics ConcurrentStore::getMetrics() const {
    CacheMetrics metrics;
    metrics.entryCount = size();
    metrics.hitCount = hits_.load(std::memory_order_relaxed);
    metrics.missCount = misses_.load(std::memory_order_relaxed);
    metrics.writeCount = writes_.load(std::memory_order_relaxed);
    metrics.removeCount = removals_.load(std::memory_order_relaxed);
    metrics.rejectedCount = rejected_.load(std::memory_order_relaxed);
    auto lookups = metrics.hitCount + metrics.missCount;
    metrics.hitRate = lookups > 0 ? static_cast<double>(metrics.hitCount) / lookups : 0.0;
    metrics.lastUpdate = std::chrono::steady_clock::now();
    return metrics;
}

} // namespace cache
} // namespace monocache
