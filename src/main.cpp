#include <iostream>
#include <string>
#include <optional>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "monocache/cache/CacheConfig.hpp"
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/cache/registry/InstanceRegistry.hpp"
#include "monocache/logging/Logging.hpp"

using namespace monocache;

namespace {

// Пользователь сессии хранится в общем кэше; хранилище передаётся явно
void rememberUser(cache::BaseStore& store, const std::string& username) {
    store.add("username", username);
}

std::string describe(const std::optional<std::string>& value) {
    return value ? "'" + *value + "'" : "<absent>";
}

} // namespace

int main(int argc, char** argv) {
    logging::LoggingConfig loggingConfig;
    cache::CacheConfig cacheConfig;

    try {
        if (argc > 1) {
            auto document = loadJsonFile(argv[1]);
            if (document.contains("logging")) {
                loggingConfig = logging::LoggingConfig::fromJson(document.at("logging"));
            }
            if (document.contains("cache")) {
                cacheConfig = cache::CacheConfig::fromJson(document.at("cache"));
            }
        }
        logging::initializeLogging(loggingConfig);
    } catch (const ConfigError& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    auto logger = logging::getLogger();
    logger->info("=== monocache demo starting ===");

    try {
        if (!cache::InstanceRegistry::configure(cacheConfig)) {
            logger->warn("Cache already created, running with its existing configuration");
        }
        auto& instance = cache::InstanceRegistry::getInstance();

        rememberUser(instance, "john_doe");
        logger->info("Username from cache: {}", describe(instance.get("username")));
        logger->info("Email from cache: {}", describe(instance.get("email")));

        try {
            instance.add("", "x");
        } catch (const cache::InvalidKeyError& e) {
            logger->warn("Rejected write: {}", e.what());
        }

        logger->info("Snapshot: {}", instance.toJson().dump());
        logger->info("Metrics: {}", instance.store().getMetrics().toJson().dump());
    } catch (const std::exception& e) {
        logger->critical("Fatal error: {}", e.what());
        spdlog::shutdown();
        return 1;
    }

    logger->info("=== monocache demo finished ===");
    spdlog::shutdown();
    return 0;
}
