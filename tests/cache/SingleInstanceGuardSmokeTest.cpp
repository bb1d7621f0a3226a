#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <sstream>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>
#include "monocache/cache/registry/SingleInstanceGuard.hpp"
#include "monocache/cache/CacheErrors.hpp"
#include "monocache/logging/Logging.hpp"

using monocache::cache::DuplicateInstantiationError;
using monocache::cache::SingleInstanceGuard;

namespace {

struct GuardedService {
    SingleInstanceGuard<GuardedService> guard{"GuardedService"};
    std::vector<int> payload = std::vector<int>(16, 7);
};

struct OtherService {
    SingleInstanceGuard<OtherService> guard{"OtherService"};
};

} // namespace

void smokeTestSingleInstanceGuard() {
    std::cout << "Testing SingleInstanceGuard basic operations...\n";

    assert(!SingleInstanceGuard<GuardedService>::isClaimed());
    auto first = std::make_unique<GuardedService>();
    assert(SingleInstanceGuard<GuardedService>::isClaimed());

    bool thrown = false;
    try {
        GuardedService second;
        (void)second;
    } catch (const DuplicateInstantiationError& e) {
        thrown = true;
        assert(std::string(e.what()).find("GuardedService") != std::string::npos);
    }
    assert(thrown);
    // Неудачная попытка не снимает захват первого экземпляра
    assert(SingleInstanceGuard<GuardedService>::isClaimed());

    // Другой тип охраняется независимо
    OtherService other;
    assert(SingleInstanceGuard<OtherService>::isClaimed());

    first.reset();
    assert(!SingleInstanceGuard<GuardedService>::isClaimed());
    GuardedService again;
    assert(again.payload.size() == 16);

    std::cout << "[OK] SingleInstanceGuard smoke test\n";
}

void testConcurrentClaims() {
    std::cout << "Testing SingleInstanceGuard concurrent claims...\n";

    struct RaceTag {};
    const size_t threadCount = 32;
    std::atomic<bool> go{false};
    std::atomic<size_t> winners{0};
    std::atomic<size_t> losers{0};
    std::vector<std::unique_ptr<SingleInstanceGuard<RaceTag>>> held(threadCount);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < threadCount; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            try {
                held[i] = std::make_unique<SingleInstanceGuard<RaceTag>>("RaceTag");
                winners.fetch_add(1);
            } catch (const DuplicateInstantiationError&) {
                losers.fetch_add(1);
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& t : threads) t.join();

    assert(winners.load() == 1);
    assert(losers.load() == threadCount - 1);

    std::cout << "[OK] SingleInstanceGuard concurrent claims test\n";
}

void testDuplicateIsLogged() {
    std::cout << "Testing SingleInstanceGuard error logging...\n";

    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("[%l] %v");
    auto logger = std::make_shared<spdlog::logger>(monocache::logging::LOGGER_NAME, sink);
    spdlog::drop(monocache::logging::LOGGER_NAME);
    spdlog::register_logger(logger);

    struct LoggedTag {};
    SingleInstanceGuard<LoggedTag> first("LoggedService");
    bool thrown = false;
    try {
        SingleInstanceGuard<LoggedTag> second("LoggedService");
        (void)second;
    } catch (const DuplicateInstantiationError&) {
        thrown = true;
    }
    assert(thrown);
    logger->flush();
    auto text = captured.str();
    assert(text.find("[error]") != std::string::npos);
    assert(text.find("LoggedService") != std::string::npos);

    spdlog::drop(monocache::logging::LOGGER_NAME);
    std::cout << "[OK] SingleInstanceGuard error logging test\n";
}

int main() {
    try {
        smokeTestSingleInstanceGuard();
        testConcurrentClaims();
        testDuplicateIsLogged();
        std::cout << "All SingleInstanceGuard tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
