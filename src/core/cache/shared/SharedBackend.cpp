#include "tiercache/core/cache/shared/SharedBackend.hpp"
#include "tiercache/core/cache/CacheErrors.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include "tiercache/core/thread/ThreadPool.hpp"
#include <atomic>
#include <future>
#include <functional>
#include <type_traits>
#include <vector>

namespace tiercache {
namespace core {
namespace cache {

// Реализация PIMPL
struct SharedBackend::Impl {
    std::shared_ptr<KeyValueClient> client;
    CacheConfig config;
    // Полосы: однопоточные очереди, операции одного ключа всегда в одной полосе и в порядке вызова
    std::vector<std::unique_ptr<thread::ThreadPool>> lanes;
    std::atomic<size_t> hits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> sets{0};
    std::atomic<size_t> removals{0};
    std::atomic<size_t> errors{0};
    std::atomic<size_t> timeouts{0};
    std::atomic<size_t> serializationFailures{0};

    static thread::ThreadPoolConfig laneConfig(const CacheConfig& cfg) {
        thread::ThreadPoolConfig poolCfg;
        poolCfg.minThreads = 1;
        poolCfg.maxThreads = 1;
        poolCfg.queueSize = cfg.ioQueueSize;
        return poolCfg;
    }

    Impl(std::shared_ptr<KeyValueClient> c, const CacheConfig& cfg)
        : client(std::move(c)), config(cfg) {
        if (client) {
            for (size_t i = 0; i < cfg.ioThreads; ++i) {
                lanes.push_back(std::make_unique<thread::ThreadPool>(laneConfig(cfg)));
            }
        }
    }

    thread::ThreadPool& laneFor(const std::string& key) {
        return *lanes[std::hash<std::string>{}(key) % lanes.size()];
    }

    // Выполняет fn в полосе ключа и ждёт не дольше sharedTimeout.
    // nullopt = операция не удалась (ошибка уже залогирована и учтена).
    // cancellable: брошенная по таймауту операция пропускается, если ещё не началась.
    // Удаления не отменяются: они должны лечь после всех предыдущих записей ключа.
    template<typename Fn>
    std::optional<std::invoke_result_t<Fn>> call(const char* operation, const std::string& key, Fn fn,
                                                 bool cancellable = true) {
        using Result = std::invoke_result_t<Fn>;
        auto abandoned = std::make_shared<std::atomic<bool>>(false);
        try {
            auto future = laneFor(key).trySubmit(
                [abandoned, cancellable, operation, key, fn = std::move(fn)]() -> Result {
                    if (cancellable && abandoned->load()) {
                        logging::getLogger()->debug("SharedBackend: {} key='{}' отменён после таймаута",
                                                    operation, key);
                        throw BackendUnavailable("операция отменена после таймаута");
                    }
                    return fn();
                });
            if (!future) {
                throw BackendUnavailable("очередь сетевых операций переполнена");
            }
            if (future->wait_for(config.sharedTimeout) != std::future_status::ready) {
                abandoned->store(true);
                ++timeouts;
                throw BackendUnavailable("таймаут " + std::to_string(config.sharedTimeout.count()) + " ms");
            }
            return future->get();
        } catch (const CacheError& e) {
            ++errors;
            logging::getLogger()->warn("SharedBackend: {} key='{}' не выполнен: {}", operation, key, e.what());
        } catch (const std::exception& e) {
            ++errors;
            logging::getLogger()->error("SharedBackend: unexpected ошибка в {} key='{}': {}", operation, key, e.what());
        }
        return std::nullopt;
    }
};

SharedBackend::SharedBackend(std::shared_ptr<KeyValueClient> client, const CacheConfig& config)
    : pImpl(std::make_unique<Impl>(std::move(client), config)) {
    if (!pImpl->client) {
        logging::getLogger()->warn("SharedBackend: клиент не задан, общий уровень отключён");
    } else {
        logging::getLogger()->info("SharedBackend: создан: timeout={} ms, ioThreads={}",
                                   config.sharedTimeout.count(), config.ioThreads);
    }
}

SharedBackend::~SharedBackend() = default;

std::optional<CacheBackend::Value> SharedBackend::get(const std::string& key) {
    auto entry = getEntry(key);
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->value);
}

std::optional<CacheBackend::Entry> SharedBackend::getEntry(const std::string& key) {
    if (!pImpl->client) {
        ++pImpl->misses;
        return std::nullopt;
    }
    auto client = pImpl->client;
    auto stored = pImpl->call("get", key, [client, key]() { return client->get(key); });
    if (!stored || !*stored) {
        ++pImpl->misses;
        return std::nullopt;
    }
    try {
        Entry entry{decode((*stored)->payload), (*stored)->ttlRemaining};
        ++pImpl->hits;
        return entry;
    } catch (const SerializationFailure& e) {
        ++pImpl->serializationFailures;
        ++pImpl->misses;
        logging::getLogger()->warn("SharedBackend: повреждённое значение key='{}': {}", key, e.what());
        return std::nullopt;
    }
}

void SharedBackend::set(const std::string& key, const Value& value, Ttl ttl) {
    if (!pImpl->client) {
        return;
    }
    std::string payload;
    try {
        payload = encode(value);
    } catch (const SerializationFailure& e) {
        ++pImpl->serializationFailures;
        logging::getLogger()->warn("SharedBackend: значение key='{}' не сериализуется: {}", key, e.what());
        return;
    }
    auto client = pImpl->client;
    const bool deletes = ttl && ttl->count() <= 0; // Неположительный TTL удаляет ключ
    auto done = pImpl->call("set", key, [client, key, payload = std::move(payload), ttl]() {
        client->set(key, payload, ttl);
        return true;
    }, !deletes);
    if (done) {
        ++pImpl->sets;
    }
}

void SharedBackend::remove(const std::string& key) {
    if (!pImpl->client) {
        return;
    }
    auto client = pImpl->client;
    auto done = pImpl->call("remove", key, [client, key]() {
        client->remove(key);
        return true;
    }, false);
    if (done) {
        ++pImpl->removals;
    }
}

bool SharedBackend::exists(const std::string& key) {
    if (!pImpl->client) {
        return false;
    }
    auto client = pImpl->client;
    auto found = pImpl->call("exists", key, [client, key]() { return client->exists(key); });
    return found.value_or(false);
}

size_t SharedBackend::removeByPrefix(const std::string& prefix) {
    if (!pImpl->client) {
        return 0;
    }
    auto client = pImpl->client;
    auto removed = pImpl->call("removeByPrefix", prefix,
                                [client, prefix]() { return client->removeByPrefix(prefix); }, false);
    if (removed) {
        pImpl->removals += *removed;
    }
    return removed.value_or(0);
}

bool SharedBackend::ping() {
    if (!pImpl->client) {
        return false;
    }
    auto client = pImpl->client;
    return pImpl->call("ping", "", [client]() { return client->ping(); }).value_or(false);
}

bool SharedBackend::isEnabled() const {
    return pImpl->client != nullptr;
}

CacheMetrics SharedBackend::getMetrics() const {
    CacheMetrics metrics;
    metrics.hits = pImpl->hits.load(std::memory_order_relaxed);
    metrics.misses = pImpl->misses.load(std::memory_order_relaxed);
    metrics.sharedHits = metrics.hits;
    metrics.sets = pImpl->sets.load(std::memory_order_relaxed);
    metrics.removals = pImpl->removals.load(std::memory_order_relaxed);
    metrics.errors = pImpl->errors.load(std::memory_order_relaxed);
    metrics.timeouts = pImpl->timeouts.load(std::memory_order_relaxed);
    metrics.serializationFailures = pImpl->serializationFailures.load(std::memory_order_relaxed);
    metrics.lastUpdate = std::chrono::steady_clock::now();
    metrics.updateHitRate();
    return metrics;
}

std::string SharedBackend::encode(const Value& value) {
    try {
        return value.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw SerializationFailure(e.what());
    }
}

CacheBackend::Value SharedBackend::decode(const std::string& payload) {
    try {
        return Value::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw SerializationFailure(e.what());
    }
}

} // namespace cache
} // namespace core
} // namespace tiercache
