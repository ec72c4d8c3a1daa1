#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <thread>
#include <vector>
#include <string>
#include "tiercache/core/cache/local/LocalBackend.hpp"
#include "tiercache/core/cache/CacheConfig.hpp"

#include <spdlog/spdlog.h>

using namespace tiercache::core::cache;
using namespace std::chrono_literals;

void smokeTestLocalBackend() {
    std::cout << "Testing LocalBackend basic operations...\n";

    CacheConfig config;
    LocalBackend backend(config);

    assert(backend.name() == "local");
    assert(backend.size() == 0);
    assert(!backend.get("missing").has_value());

    CacheBackend::Value user = {{"id", 42}, {"name", "Jo"}};
    backend.set("user:42", user, 60s);
    auto value = backend.get("user:42");
    assert(value.has_value());
    assert(*value == user);
    assert(backend.exists("user:42"));

    // Перезапись
    backend.set("user:42", {{"id", 42}, {"name", "Joanna"}}, 60s);
    assert(backend.get("user:42")->at("name") == "Joanna");
    assert(backend.size() == 1);

    backend.remove("user:42");
    assert(!backend.exists("user:42"));
    backend.remove("user:42"); // удаление отсутствующего ключа не ошибка

    std::cout << "[OK] LocalBackend smoke test\n";
}

void testLocalBackendExpiry() {
    std::cout << "Testing LocalBackend expiry...\n";

    CacheConfig config;
    LocalBackend backend(config);

    backend.set("short", "value", 1s);
    assert(backend.get("short").has_value());
    std::this_thread::sleep_for(1100ms);
    assert(!backend.get("short").has_value());
    assert(!backend.exists("short"));
    assert(backend.getMetrics().expirations == 1);

    // Неположительный TTL удаляет запись
    backend.set("gone", 1, 60s);
    backend.set("gone", 2, 0s);
    assert(!backend.get("gone").has_value());
    backend.set("negative", 3, -5s);
    assert(!backend.get("negative").has_value());

    // Без TTL запись бессрочна
    backend.set("forever", true);
    assert(backend.ttlRemaining("forever") == std::chrono::seconds::max());

    auto remaining = backend.ttlRemaining("missing");
    assert(!remaining.has_value());

    std::cout << "[OK] LocalBackend expiry test\n";
}

void testLocalBackendLruEviction() {
    std::cout << "Testing LocalBackend LRU eviction...\n";

    CacheConfig config;
    config.localMaxEntries = 3;
    LocalBackend backend(config);

    backend.set("a", 1, 60s);
    backend.set("b", 2, 60s);
    backend.set("c", 3, 60s);
    assert(backend.get("a").has_value()); // "a" становится самым свежим

    backend.set("d", 4, 60s);
    assert(backend.size() == 3);
    assert(!backend.get("b").has_value());
    assert(backend.get("a").has_value());
    assert(backend.get("c").has_value());
    assert(backend.get("d").has_value());
    assert(backend.getMetrics().evictions == 1);

    std::cout << "[OK] LocalBackend LRU eviction test\n";
}

void testLocalBackendPrefixAndCleanup() {
    std::cout << "Testing LocalBackend prefix removal and cleanup...\n";

    CacheConfig config;
    config.localCleanupInterval = 1s;
    LocalBackend backend(config);

    backend.set("user:1", 1, 60s);
    backend.set("user:2", 2, 60s);
    backend.set("jobs:1", 3, 60s);
    assert(backend.removeByPrefix("user:") == 2);
    assert(!backend.exists("user:1"));
    assert(backend.exists("jobs:1"));

    // Фоновая очистка удаляет истёкшие записи без чтения
    backend.set("temp", 4, 1s);
    assert(backend.size() == 2);
    std::this_thread::sleep_for(2500ms);
    assert(backend.size() == 1);

    backend.clear();
    assert(backend.size() == 0);

    std::cout << "[OK] LocalBackend prefix removal and cleanup test\n";
}

void testLocalBackendConcurrentAccess() {
    std::cout << "Testing LocalBackend concurrent access...\n";

    CacheConfig config;
    config.localMaxEntries = 100;
    LocalBackend backend(config);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&backend, t]() {
            for (int i = 0; i < 200; ++i) {
                auto key = "k:" + std::to_string(t) + ":" + std::to_string(i % 50);
                backend.set(key, i, 60s);
                backend.get(key);
                if (i % 7 == 0) {
                    backend.remove(key);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(backend.size() <= config.localMaxEntries);

    std::cout << "[OK] LocalBackend concurrent access test\n";
}

void testCacheBackendInterface() {
    std::cout << "Testing CacheBackend interface through LocalBackend...\n";

    CacheConfig config;
    std::unique_ptr<CacheBackend> backend = std::make_unique<LocalBackend>(config);
    backend->set("iface", {{"ok", true}}, 10s);
    assert(backend->exists("iface"));
    assert(backend->get("iface")->at("ok") == true);
    backend->remove("iface");
    assert(!backend->get("iface").has_value());

    std::cout << "[OK] CacheBackend interface test\n";
}

int main() {
    try {
        smokeTestLocalBackend();
        testLocalBackendExpiry();
        testLocalBackendLruEviction();
        testLocalBackendPrefixAndCleanup();
        testLocalBackendConcurrentAccess();
        testCacheBackendInterface();
        spdlog::shutdown();
        std::cout << "All LocalBackend tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "LocalBackend test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
