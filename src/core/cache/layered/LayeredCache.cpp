#include "tiercache/core/cache/layered/LayeredCache.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include <algorithm>
#include <stdexcept>

namespace tiercache {
namespace core {
namespace cache {

LayeredCache::LayeredCache(std::shared_ptr<CacheBackend> local, std::shared_ptr<CacheBackend> shared,
                           const CacheConfig& config)
    : local_(std::move(local)), shared_(std::move(shared)), config_(config) {
    if (!local_ || !shared_) {
        throw std::invalid_argument("LayeredCache: оба уровня обязательны");
    }
    logging::getLogger()->info("LayeredCache: создан: {} + {} ({}), localTtlCap={}s",
                               local_->name(), shared_->name(), shared_->isEnabled() ? "enabled" : "disabled",
                               config_.localTtlCap.count());
}

std::optional<LayeredCache::Value> LayeredCache::get(const std::string& key) {
    if (auto value = local_->get(key)) {
        ++hits_;
        ++localHits_;
        return value;
    }

    auto entry = shared_->getEntry(key);
    if (!entry) {
        ++misses_;
        logging::getLogger()->debug("LayeredCache: промах key={}", key);
        return std::nullopt;
    }

    ++hits_;
    ++sharedHits_;
    // Продвижение: остаток TTL общего уровня, но не больше потолка локального
    auto ttl = cappedLocalTtl(entry->ttlRemaining);
    if (ttl.count() > 0) {
        local_->set(key, entry->value, ttl);
        ++promotions_;
        logging::getLogger()->debug("LayeredCache: key={} продвинут в локальный уровень, ttl={}s", key, ttl.count());
    }
    return std::move(entry->value);
}

void LayeredCache::set(const std::string& key, const Value& value, Ttl ttl) {
    if (ttl && ttl->count() <= 0) {
        remove(key);
        return;
    }
    local_->set(key, value, cappedLocalTtl(ttl));
    shared_->set(key, value, ttl);
}

void LayeredCache::remove(const std::string& key) {
    local_->remove(key);
    shared_->remove(key);
}

bool LayeredCache::exists(const std::string& key) {
    return local_->exists(key) || shared_->exists(key);
}

size_t LayeredCache::removeByPrefix(const std::string& prefix) {
    auto localRemoved = local_->removeByPrefix(prefix);
    auto sharedRemoved = shared_->removeByPrefix(prefix);
    logging::getLogger()->info("LayeredCache: по префиксу '{}' удалено local={}, shared={}",
                               prefix, localRemoved, sharedRemoved);
    return std::max(localRemoved, sharedRemoved);
}

void LayeredCache::clearLocal() {
    local_->removeByPrefix("");
}

CacheMetrics LayeredCache::getMetrics() const {
    auto localMetrics = local_->getMetrics();
    auto sharedMetrics = shared_->getMetrics();

    CacheMetrics metrics;
    metrics.hits = hits_.load(std::memory_order_relaxed);
    metrics.misses = misses_.load(std::memory_order_relaxed);
    metrics.localHits = localHits_.load(std::memory_order_relaxed);
    metrics.sharedHits = sharedHits_.load(std::memory_order_relaxed);
    metrics.promotions = promotions_.load(std::memory_order_relaxed);
    metrics.sets = localMetrics.sets;
    metrics.removals = localMetrics.removals + sharedMetrics.removals;
    metrics.errors = sharedMetrics.errors;
    metrics.timeouts = sharedMetrics.timeouts;
    metrics.serializationFailures = sharedMetrics.serializationFailures;
    metrics.evictions = localMetrics.evictions;
    metrics.expirations = localMetrics.expirations;
    metrics.entryCount = localMetrics.entryCount;
    metrics.lastUpdate = std::chrono::steady_clock::now();
    metrics.updateHitRate();
    return metrics;
}

std::chrono::seconds LayeredCache::cappedLocalTtl(Ttl ttl) const {
    if (!ttl) {
        return config_.localTtlCap;
    }
    return std::min(*ttl, config_.localTtlCap);
}

} // namespace cache
} // namespace core
} // namespace tiercache
