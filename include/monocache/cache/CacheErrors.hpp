#pragma once

#include <stdexcept>
#include <string>
#include "monocache/common/JsonConfig.hpp"

namespace monocache {
namespace cache {

// InvalidKeyError — пустой или слишком длинный ключ, мутация не выполнена
class InvalidKeyError : public std::invalid_argument {
public:
    explicit InvalidKeyError(const std::string& key)
        : std::invalid_argument("invalid cache key: '" + key + "'"), key_(key) {}
    const std::string& key() const noexcept { return key_; } // Отклонённый ключ
private:
    std::string key_;
};

// DuplicateInstantiationError — попытка создать второй экземпляр в обход реестра
class DuplicateInstantiationError : public std::logic_error {
public:
    explicit DuplicateInstantiationError(const std::string& typeName)
        : std::logic_error("an instance of " + typeName + " already exists") {}
};

// CloneNotSupportedError — клонирование singleton запрещено
class CloneNotSupportedError : public std::logic_error {
public:
    explicit CloneNotSupportedError(const std::string& typeName)
        : std::logic_error("cloning of " + typeName + " is not allowed") {}
};

// ConfigError общий для всех модулей
using monocache::ConfigError;

// SerializationError — некорректный снимок кэша
class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace cache
} // namespace monocache
