#include "monocache/logging/Logging.hpp"
#include "monocache/common/JsonConfig.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace monocache {
namespace logging {

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("logging config must be a JSON object");
    }
    LoggingConfig config;
    try {
        config.level = j.value("level", config.level);
        config.enableConsole = j.value("enableConsole", config.enableConsole);
        config.enableFile = j.value("enableFile", config.enableFile);
        config.logPath = j.value("logPath", config.logPath);
        config.maxLogSize = readSizeField(j, "maxLogSize", config.maxLogSize);
        config.maxLogFiles = readSizeField(j, "maxLogFiles", config.maxLogFiles);
    } catch (const ConfigError& e) {
        throw ConfigError(std::string("invalid logging config: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid logging config: ") + e.what());
    }
    if (spdlog::level::from_str(config.level) == spdlog::level::off && config.level != "off") {
        throw ConfigError("invalid logging config: unknown level '" + config.level + "'");
    }
    if (!config.validate()) {
        throw ConfigError("invalid logging config: no usable sink");
    }
    return config;
}

std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config) {
    if (!config.validate()) {
        throw ConfigError("invalid logging config: no usable sink");
    }
    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.enableConsole) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }
        if (config.enableFile) {
            auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logPath, config.maxLogSize, config.maxLogFiles);
            rotating_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(rotating_sink);
        }
    } catch (const spdlog::spdlog_ex& e) {
        throw ConfigError(std::string("cannot create log sink: ") + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        throw ConfigError(std::string("cannot create log directory: ") + e.what());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    logger->info("Logging initialized: level={}, console={}, file={}",
                 config.level, config.enableConsole, config.enableFile ? config.logPath : "-");
    return logger;
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = spdlog::get(LOGGER_NAME)) {
        return logger;
    }
    return spdlog::default_logger();
}

} // namespace logging
} // namespace monocache
