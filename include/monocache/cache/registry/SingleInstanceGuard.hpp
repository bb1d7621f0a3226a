#pragma once
#include <atomic>
#include <string>
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/logging/Logging.hpp"

namespace monocache {
namespace cache {

// SingleInstanceGuard — не более одного живого объекта типа Tag на процесс.
// Хранится первым членом охраняемого класса: второй конструктор бросает
// DuplicateInstantiationError до выделения остальных ресурсов.
template<typename Tag>
class SingleInstanceGuard {
public:
    explicit SingleInstanceGuard(const std::string& typeName) {
        bool expected = false;
        if (!claimed().compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            logging::getLogger()->error("SingleInstanceGuard: second instance of {} rejected", typeName);
            throw DuplicateInstantiationError(typeName);
        }
    }
    ~SingleInstanceGuard() {
        claimed().store(false, std::memory_order_release);
    }
    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;

    static bool isClaimed() noexcept {
        return claimed().load(std::memory_order_acquire);
    }

private:
    static std::atomic<bool>& claimed() noexcept {
        static std::atomic<bool> flag{false};
        return flag;
    }
};

} // namespace cache
} // namespace monocache
