#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include "monocache/cache/registry/InstanceRegistry.hpp"
#include "monocache/cache/registry/SingleInstanceGuard.hpp"
#include "monocache/cache/CacheErrors.hpp"

using namespace monocache::cache;

// Отдельный процесс: первая попытка создать экземпляр должна провалиться
void testFailedFirstConstruction() {
    std::cout << "Testing InstanceRegistry after a failed first construction...\n";

    CacheConfig first;
    first.name = "first_attempt";
    assert(InstanceRegistry::configure(first));

    // Чужой захват guard'а делает конструирование CacheInstance невозможным
    auto blocker = std::make_unique<SingleInstanceGuard<CacheInstance>>("external holder");
    bool thrown = false;
    try {
        InstanceRegistry::getInstance();
    } catch (const DuplicateInstantiationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(!InstanceRegistry::isInitialized());

    // Повторная попытка из другого потока тоже видит ошибку, а не пустой объект
    thrown = false;
    std::thread retry([&thrown] {
        try {
            InstanceRegistry::getInstance();
        } catch (const DuplicateInstantiationError&) {
            thrown = true;
        }
    });
    retry.join();
    assert(thrown);
    assert(!InstanceRegistry::isInitialized());

    // Конфигурация после неудачи принимается
    CacheConfig second;
    second.name = "second_attempt";
    second.maxKeyLength = 16;
    assert(InstanceRegistry::configure(second));

    blocker.reset();
    auto& instance = InstanceRegistry::getInstance();
    assert(InstanceRegistry::isInitialized());
    assert(instance.config().name == "second_attempt");
    assert(instance.config().maxKeyLength == 16);
    assert(&InstanceRegistry::getInstance() == &instance);

    instance.add("username", "john_doe");
    assert(instance.get("username") == std::optional<std::string>("john_doe"));

    // Теперь конфигурация запечатана
    CacheConfig late;
    late.name = "late";
    assert(!InstanceRegistry::configure(late));
    assert(InstanceRegistry::getInstance().config().name == "second_attempt");

    std::cout << "[OK] InstanceRegistry failed first construction test\n";
}

int main() {
    try {
        testFailedFirstConstruction();
        std::cout << "All InstanceRegistry recovery tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
