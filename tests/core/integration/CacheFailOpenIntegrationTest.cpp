#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <atomic>
#include "tiercache/core/cache/manager/CacheManager.hpp"
#include "tiercache/core/cache/shared/RedisClient.hpp"
#include "tiercache/core/cache/CacheConfig.hpp"
#include "core/cache/fakes/FakeKeyValueClient.hpp"

#include <spdlog/spdlog.h>

using namespace tiercache::core::cache;
using tiercache::testing::FakeKeyValueClient;
using namespace std::chrono_literals;

namespace {

// Клиент с ошибкой программирования вместо сетевой
class BrokenKeyValueClient : public KeyValueClient {
public:
    std::optional<StoredValue> get(const std::string&) override { throw std::logic_error("broken get"); }
    void set(const std::string&, const std::string&, std::optional<std::chrono::seconds>) override {
        throw std::logic_error("broken set");
    }
    void remove(const std::string&) override { throw std::logic_error("broken remove"); }
    bool exists(const std::string&) override { throw std::logic_error("broken exists"); }
    size_t removeByPrefix(const std::string&) override { throw std::logic_error("broken scan"); }
    bool ping() override { throw std::logic_error("broken ping"); }
};

} // namespace

void testUnreachableSharedStore() {
    std::cout << "Testing fail-open with unreachable shared store...\n";

    auto client = std::make_shared<FakeKeyValueClient>();
    client->setFailing(true);
    auto manager = createCacheManager(client, CacheConfig());

    // Ни одна операция не выбрасывает исключений
    assert(!manager->getCollection("apps", 7, 1, 20).has_value());
    manager->setCollection("apps", 7, nlohmann::json::array({1, 2}), 1, 20, 60s);
    manager->set("user", 1, {{"name", "Jo"}}, 60s);
    manager->invalidate("user", 1);
    manager->invalidateUser(1);
    assert(manager->invalidateDomain("apps") == 1);
    assert(!manager->getCachedUser(1).has_value());

    // Локальный уровень продолжает работать
    manager->setCachedJob("j", "local");
    assert(manager->getCachedJob("j").value() == "local");
    assert(manager->getCollection("apps", 7, 1, 20).has_value() == false);

    auto metrics = manager->getMetrics();
    assert(metrics.errors > 0);

    // Восстановление связи: общий уровень снова используется
    client->setFailing(false);
    manager->setCachedUser(2, "shared");
    assert(client->contains("user:2"));

    std::cout << "[OK] fail-open with unreachable shared store test\n";
}

void testSlowSharedStore() {
    std::cout << "Testing fail-open with slow shared store...\n";

    auto client = std::make_shared<FakeKeyValueClient>();
    CacheConfig config;
    config.sharedTimeout = 50ms;
    auto manager = createCacheManager(client, config);

    client->putRaw("user:9", R"({"name":"Slow"})", 60s);
    client->setDelay(300ms);

    auto started = std::chrono::steady_clock::now();
    assert(!manager->getCachedUser(9).has_value());
    assert(std::chrono::steady_clock::now() - started < 250ms);
    assert(manager->getMetrics().timeouts >= 1);

    client->setDelay(0ms);
    std::this_thread::sleep_for(350ms);
    assert(manager->getCachedUser(9).value().at("name") == "Slow");

    std::cout << "[OK] fail-open with slow shared store test\n";
}

void testTimedOutWriteDoesNotOutliveInvalidation() {
    std::cout << "Testing invalidation after a timed-out write...\n";

    auto client = std::make_shared<FakeKeyValueClient>();
    CacheConfig config;
    config.sharedTimeout = 50ms;
    auto manager = createCacheManager(client, config);

    client->setDelay(300ms);
    manager->setCachedUser(1, "stale", 3600s); // общий уровень не успевает
    assert(manager->getMetrics().timeouts >= 1);
    client->setDelay(0ms);
    manager->invalidateUser(1);

    // Запоздавшая запись не возвращает удалённое значение
    std::this_thread::sleep_for(400ms);
    assert(!client->contains("user:1"));
    manager->clearLocal();
    assert(!manager->getCachedUser(1).has_value());

    std::cout << "[OK] invalidation after a timed-out write test\n";
}

void testProgrammingErrorIsContained() {
    std::cout << "Testing fail-open with unexpected exceptions...\n";

    auto manager = createCacheManager(std::make_shared<BrokenKeyValueClient>(), CacheConfig());

    assert(!manager->getCachedUser(1).has_value());
    manager->setCachedUser(1, "value");
    // Локальный уровень записан, общий нет
    assert(manager->getCachedUser(1).value() == "value");
    manager->invalidateUser(1);
    assert(!manager->getCachedUser(1).has_value());
    assert(manager->getMetrics().errors > 0);

    std::cout << "[OK] fail-open with unexpected exceptions test\n";
}

void testRedisClientWithoutServer() {
    std::cout << "Testing RedisClient without a server...\n";

    RedisConfig redisConfig;
    redisConfig.host = "127.0.0.1";
    redisConfig.port = 1; // никто не слушает
    redisConfig.connectTimeout = 200ms;
    auto redis = std::make_shared<RedisClient>(redisConfig);
    assert(!redis->connect());
    assert(!redis->isConnected());

    bool thrown = false;
    try {
        redis->get("user:1");
    } catch (const BackendUnavailable&) {
        thrown = true;
    }
    assert(thrown);

    CacheConfig config;
    config.sharedTimeout = 1000ms;
    auto manager = createCacheManager(redis, config);
    manager->setCachedUser(3, "only-local");
    assert(manager->getCachedUser(3).value() == "only-local");
    assert(!manager->getCachedUser(4).has_value());
    assert(manager->getMetrics().errors > 0);

    std::cout << "[OK] RedisClient without a server test\n";
}

void testConcurrentUsers() {
    std::cout << "Testing concurrent CacheManager access...\n";

    auto client = std::make_shared<FakeKeyValueClient>();
    auto manager = createCacheManager(client, CacheConfig());

    std::atomic<int> hits{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&manager, &hits, t]() {
            for (int i = 0; i < 50; ++i) {
                int64_t userId = t * 100 + i;
                manager->setCachedUser(userId, {{"id", userId}});
                manager->setCachedApplications(userId, nlohmann::json::array({i}), 1, 10);
                if (manager->getCachedUser(userId)) {
                    ++hits;
                }
                if (i % 5 == 0) {
                    manager->invalidateUser(userId);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(hits == 200);
    assert(manager->trackedCollectionKeys() == 160);

    std::cout << "[OK] concurrent CacheManager access test\n";
}

int main() {
    try {
        testUnreachableSharedStore();
        testSlowSharedStore();
        testTimedOutWriteDoesNotOutliveInvalidation();
        testProgrammingErrorIsContained();
        testRedisClientWithoutServer();
        testConcurrentUsers();
        spdlog::shutdown();
        std::cout << "All fail-open integration tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Fail-open integration test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
