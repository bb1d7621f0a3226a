#pragma once
#include <string>
#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "monocache/common/JsonConfig.hpp"

namespace monocache {
namespace logging {

constexpr const char* LOGGER_NAME = "monocache";

// LoggingConfig — параметры логирования (уровень, консоль, ротация файла)
struct LoggingConfig {
    std::string level = "info";                 // trace|debug|info|warn|error|critical|off
    bool enableConsole = true;                  // Цветной stdout
    bool enableFile = false;                    // Ротируемый файл
    std::string logPath = "logs/monocache.log"; // Путь к файлу
    size_t maxLogSize = 1024 * 1024 * 5;        // Размер файла до ротации (5 MB)
    size_t maxLogFiles = 2;                     // Кол-во файлов ротации
    bool validate() const {
        if (!enableConsole && !enableFile) return false;
        if (enableFile && (logPath.empty() || maxLogSize == 0)) return false;
        return true;
    }
    static LoggingConfig fromJson(const nlohmann::json& j); // Бросает ConfigError
};

// Создаёт и регистрирует логгер "monocache", повторный вызов заменяет его
std::shared_ptr<spdlog::logger> initializeLogging(const LoggingConfig& config);

// Логгер "monocache" или логгер spdlog по умолчанию, если он ещё не создан
std::shared_ptr<spdlog::logger> getLogger();

} // namespace logging
} // namespace monocache
