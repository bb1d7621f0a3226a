#include "monocache/cache/registry/CacheInstance.hpp"
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/logging/Logging.hpp"

namespace monocache {
namespace cache {

CacheInstance::CacheInstance(const CacheConfig& config)
    : guard_(TYPE_NAME), config_(config), store_(config) {
    logging::getLogger()->info("CacheInstance '{}' created: {}", config_.name, config_.toJson().dump());
}

void CacheInstance::add(const std::string& key, const std::string& value) {
    store_.add(key, value);
}

std::optional<std::string> CacheInstance::get(const std::string& key) const {
    return store_.get(key);
}

bool CacheInstance::remove(const std::string& key) {
    return store_.remove(key);
}

size_t CacheInstance::size() const {
    return store_.size();
}

std::unique_ptr<CacheInstance> CacheInstance::clone() const {
    logging::getLogger()->error("CacheInstance '{}': clone attempted", config_.name);
    throw CloneNotSupportedError(TYPE_NAME);
}

std::unique_ptr<CacheInstance> CacheInstance::fromJson(const nlohmann::json&) {
    // Десериализация создала бы второй экземпляр: данные загружаются через loadSnapshot()
    logging::getLogger()->error("CacheInstance: deserialization into a new instance attempted");
    throw DuplicateInstantiationError(TYPE_NAME);
}

nlohmann::json CacheInstance::toJson() const {
    return {
        {"name", config_.name},
        {"entries", store_.exportAll()}
    };
}

void CacheInstance::loadSnapshot(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("entries") || !j.at("entries").is_object()) {
        throw SerializationError("snapshot must be an object with an 'entries' object");
    }
    ConcurrentStore::Map entries;
    try {
        entries = j.at("entries").get<ConcurrentStore::Map>();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("snapshot entries must be strings: ") + e.what());
    }
    store_.importAll(entries);
    logging::getLogger()->info("CacheInstance '{}': loaded snapshot with {} entries", config_.name, entries.size());
}

} // namespace cache
} // namespace monocache
