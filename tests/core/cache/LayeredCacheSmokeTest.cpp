#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <thread>
#include <stdexcept>
#include "tiercache/core/cache/layered/LayeredCache.hpp"
#include "tiercache/core/cache/local/LocalBackend.hpp"
#include "tiercache/core/cache/shared/SharedBackend.hpp"
#include "tiercache/core/cache/CacheConfig.hpp"
#include "core/cache/fakes/FakeKeyValueClient.hpp"

#include <spdlog/spdlog.h>

using namespace tiercache::core::cache;
using tiercache::testing::FakeKeyValueClient;
using namespace std::chrono_literals;

namespace {

struct LayeredFixture {
    CacheConfig config;
    std::shared_ptr<FakeKeyValueClient> client = std::make_shared<FakeKeyValueClient>();
    std::shared_ptr<LocalBackend> local;
    std::shared_ptr<SharedBackend> shared;
    std::unique_ptr<LayeredCache> cache;

    explicit LayeredFixture(const CacheConfig& cfg = CacheConfig()) : config(cfg) {
        local = std::make_shared<LocalBackend>(config);
        shared = std::make_shared<SharedBackend>(client, config);
        cache = std::make_unique<LayeredCache>(local, shared, config);
    }
};

} // namespace

void testLayeredRoundTrip() {
    std::cout << "Testing LayeredCache round-trip...\n";

    LayeredFixture f;
    CacheBackend::Value user = {{"name", "Jo"}};
    f.cache->set("user:42", user, 1800s);

    auto value = f.cache->get("user:42");
    assert(value.has_value());
    assert(*value == user);

    // Локальный уровень ограничен потолком, общий получает полный TTL
    auto localTtl = f.local->ttlRemaining("user:42");
    assert(localTtl.has_value() && *localTtl <= f.config.localTtlCap);
    auto sharedTtl = f.client->ttlOf("user:42");
    assert(sharedTtl.has_value() && sharedTtl->count() > 1790);

    // Без TTL: локальный получает потолок, общий хранит бессрочно
    f.cache->set("config:flags", {{"beta", true}});
    assert(f.local->ttlRemaining("config:flags").value() <= f.config.localTtlCap);
    assert(f.client->contains("config:flags"));
    assert(!f.client->ttlOf("config:flags").has_value());

    std::cout << "[OK] LayeredCache round-trip test\n";
}

void testLayeredExpiry() {
    std::cout << "Testing LayeredCache expiry...\n";

    LayeredFixture f;
    f.cache->set("temp:1", "x", 1s);
    assert(f.cache->get("temp:1").has_value());
    std::this_thread::sleep_for(2s);
    assert(!f.cache->get("temp:1").has_value());

    // Неположительный TTL удаляет ключ из обоих уровней
    f.cache->set("temp:2", "y", 60s);
    f.cache->set("temp:2", "z", 0s);
    assert(!f.local->get("temp:2").has_value());
    assert(!f.client->contains("temp:2"));

    std::cout << "[OK] LayeredCache expiry test\n";
}

void testLayeredPromotion() {
    std::cout << "Testing LayeredCache promotion...\n";

    LayeredFixture f;
    f.client->putRaw("user:7", R"({"name":"Sam"})", 3600s);
    assert(!f.local->exists("user:7"));

    auto value = f.cache->get("user:7");
    assert(value.has_value());
    assert(value->at("name") == "Sam");

    // Продвинутая запись живёт не дольше потолка локального уровня
    auto localTtl = f.local->ttlRemaining("user:7");
    assert(localTtl.has_value());
    assert(*localTtl <= f.config.localTtlCap);
    assert(f.local->get("user:7").value() == *value);

    // Повторное чтение обслуживается локальным уровнем
    auto callsBefore = f.client->callCount();
    assert(f.cache->get("user:7").has_value());
    assert(f.client->callCount() == callsBefore);

    // Короткий остаток TTL в общем уровне сохраняется при продвижении
    f.client->putRaw("user:8", R"({"name":"Kim"})", 30s);
    assert(f.cache->get("user:8").has_value());
    assert(f.local->ttlRemaining("user:8").value() <= 30s);

    // Запись без TTL в общем уровне получает потолок
    f.client->putRaw("user:9", "9");
    assert(f.cache->get("user:9").value() == 9);
    assert(f.local->ttlRemaining("user:9").value() <= f.config.localTtlCap);

    auto metrics = f.cache->getMetrics();
    assert(metrics.promotions == 3);
    assert(metrics.sharedHits == 3);
    assert(metrics.localHits == 1);

    std::cout << "[OK] LayeredCache promotion test\n";
}

void testLayeredDeletionAndExistence() {
    std::cout << "Testing LayeredCache deletion and existence...\n";

    LayeredFixture f;
    f.cache->set("user:1", 1, 60s);
    f.cache->remove("user:1");
    assert(!f.local->get("user:1").has_value());
    assert(!f.shared->get("user:1").has_value());
    assert(!f.cache->exists("user:1"));

    // Только в общем уровне: exists = true
    f.client->putRaw("user:2", "2", 60s);
    assert(!f.local->exists("user:2"));
    assert(f.cache->exists("user:2"));

    // Только в локальном уровне: exists = true
    f.local->set("user:3", 3, 60s);
    assert(f.cache->exists("user:3"));

    // Удаление по префиксу в обоих уровнях
    f.cache->set("jobs:a", "a", 60s);
    f.cache->set("jobs:b", "b", 60s);
    assert(f.cache->removeByPrefix("jobs:") == 2);
    assert(!f.cache->exists("jobs:a"));
    assert(!f.client->contains("jobs:b"));

    f.cache->clearLocal();
    assert(f.local->size() == 0);
    assert(f.client->contains("user:2"));

    std::cout << "[OK] LayeredCache deletion and existence test\n";
}

void testLayeredEvictionFallsBackToShared() {
    std::cout << "Testing LayeredCache with evicted local entries...\n";

    CacheConfig config;
    config.localMaxEntries = 2;
    LayeredFixture f(config);

    f.cache->set("a", 1, 60s);
    f.cache->set("b", 2, 60s);
    f.cache->set("c", 3, 60s); // вытесняет "a" из локального уровня
    assert(!f.local->exists("a"));
    assert(f.cache->exists("a"));
    assert(f.cache->get("a").value() == 1);

    std::cout << "[OK] LayeredCache eviction fallback test\n";
}

void testLayeredRequiresBothTiers() {
    std::cout << "Testing LayeredCache construction...\n";

    CacheConfig config;
    auto local = std::make_shared<LocalBackend>(config);
    bool thrown = false;
    try {
        LayeredCache broken(local, nullptr, config);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "[OK] LayeredCache construction test\n";
}

int main() {
    try {
        testLayeredRoundTrip();
        testLayeredExpiry();
        testLayeredPromotion();
        testLayeredDeletionAndExistence();
        testLayeredEvictionFallsBackToShared();
        testLayeredRequiresBothTiers();
        spdlog::shutdown();
        std::cout << "All LayeredCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "LayeredCache test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
