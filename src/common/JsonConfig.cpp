#include "monocache/common/JsonConfig.hpp"
#include <cstdint>
#include <fstream>

namespace monocache {

nlohmann::json loadJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file '" + path + "'");
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse config file '" + path + "': " + e.what());
    }
}

size_t readSizeField(const nlohmann::json& j, const std::string& field, size_t fallback) {
    if (!j.contains(field)) {
        return fallback;
    }
    const auto& value = j.at(field);
    if (value.is_number_unsigned()) {
        return value.get<size_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<size_t>(value.get<std::int64_t>());
    }
    throw ConfigError("'" + field + "' must be a non-negative integer, got " + value.dump());
}

} // namespace monocache
