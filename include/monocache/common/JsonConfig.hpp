#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace monocache {

// ConfigError — некорректная конфигурация (кэш, логирование, файл)
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Загрузка JSON-документа из файла, бросает ConfigError
nlohmann::json loadJsonFile(const std::string& path);

// Неотрицательное целое поле или fallback, если поля нет.
// Отрицательные, дробные и нечисловые значения — ConfigError.
size_t readSizeField(const nlohmann::json& j, const std::string& field, size_t fallback);

} // namespace monocache
