#pragma once
#include <cstddef>
#include <string>
#include <optional>

namespace monocache {
namespace cache {

/**
 * @brief Базовый интерфейс строкового key-value хранилища.
 *
 * Потребители получают хранилище через ссылку на этот интерфейс,
 * поэтому в тестах можно подставить изолированный экземпляр вместо
 * общего экземпляра процесса.
 */
class BaseStore {
public:
    virtual ~BaseStore() = default;
    /// Сохранить значение по ключу. Пустой ключ — InvalidKeyError.
    virtual void add(const std::string& key, const std::string& value) = 0;
    /// Получить значение по ключу, std::nullopt если ключа нет.
    virtual std::optional<std::string> get(const std::string& key) const = 0;
    /// Удалить значение по ключу. Возвращает true, если запись была.
    virtual bool remove(const std::string& key) = 0;
    /// Количество записей.
    virtual size_t size() const = 0;
};

} // namespace cache
} // namespace monocache
