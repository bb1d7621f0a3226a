#include "monocache/cache/CacheConfig.hpp"
#include "monocache/cache/CacheErrors.hpp"

namespace monocache {
namespace cache {

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("cache config must be a JSON object");
    }
    CacheConfig config;
    try {
        config.name = j.value("name", config.name);
        config.initialCapacity = readSizeField(j, "initialCapacity", config.initialCapacity);
        config.maxKeyLength = readSizeField(j, "maxKeyLength", config.maxKeyLength);
        config.enableMetrics = j.value("enableMetrics", config.enableMetrics);
    } catch (const ConfigError& e) {
        throw ConfigError(std::string("invalid cache config: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid cache config: ") + e.what());
    }
    if (config.name.empty()) {
        throw ConfigError("invalid cache config: name must not be empty");
    }
    if (!config.validate()) {
        throw ConfigError("invalid cache config: initialCapacity or maxKeyLength out of range");
    }
    return config;
}

} // namespace cache
} // namespace monocache
