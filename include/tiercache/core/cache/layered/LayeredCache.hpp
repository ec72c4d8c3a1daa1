#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <optional>
#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/base/CacheBackend.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"

namespace tiercache {
namespace core {
namespace cache {

// LayeredCache: два уровня, локальный (быстрый, TTL ограничен localTtlCap)
// и общий (полный TTL). Чтение: локальный -> общий с продвижением найденного
// значения в локальный. Запись: сначала локальный, затем общий, независимо.
// Уровни видны только через CacheBackend.
class LayeredCache {
public:
    using Value = CacheBackend::Value;
    using Ttl = CacheBackend::Ttl;

    LayeredCache(std::shared_ptr<CacheBackend> local, std::shared_ptr<CacheBackend> shared,
                 const CacheConfig& config); // Конструктор

    std::optional<Value> get(const std::string& key); // Получить (с продвижением)
    void set(const std::string& key, const Value& value, Ttl ttl = std::nullopt); // Записать в оба уровня
    void remove(const std::string& key); // Удалить из обоих уровней
    bool exists(const std::string& key); // Есть хотя бы в одном уровне

    size_t removeByPrefix(const std::string& prefix); // Удалить по префиксу в обоих уровнях
    void clearLocal(); // Очистить только локальный уровень
    CacheMetrics getMetrics() const; // Сводные метрики
    std::chrono::seconds localTtlCap() const { return config_.localTtlCap; }

    CacheBackend& local() { return *local_; }
    CacheBackend& shared() { return *shared_; }

private:
    std::chrono::seconds cappedLocalTtl(Ttl ttl) const; // min(ttl, localTtlCap)

    std::shared_ptr<CacheBackend> local_;
    std::shared_ptr<CacheBackend> shared_;
    CacheConfig config_;
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> localHits_{0};
    std::atomic<size_t> sharedHits_{0};
    std::atomic<size_t> promotions_{0};
};

} // namespace cache
} // namespace core
} // namespace tiercache
