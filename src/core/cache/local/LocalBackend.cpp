#include "tiercache/core/cache/local/LocalBackend.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include <sstream>

namespace tiercache {
namespace core {
namespace cache {

namespace {

LocalBackend::Clock::time_point expiryFor(LocalBackend::Clock::time_point now, const std::chrono::seconds& ttl) {
    // Защита от переполнения time_point при очень больших TTL
    auto headroom = std::chrono::duration_cast<std::chrono::seconds>(LocalBackend::Clock::time_point::max() - now);
    if (ttl >= headroom) {
        return LocalBackend::Clock::time_point::max();
    }
    return now + ttl;
}

} // namespace

LocalBackend::LocalBackend(const CacheConfig& config) : config_(config) {
    cache_.reserve(config_.localMaxEntries);
    if (config_.localCleanupInterval.count() > 0) {
        startCleanupThread();
    }
    logging::getLogger()->info("LocalBackend: создан: maxEntries={}, ttlCap={}s, cleanupInterval={}s",
                               config_.localMaxEntries, config_.localTtlCap.count(),
                               config_.localCleanupInterval.count());
}

LocalBackend::~LocalBackend() {
    stopCleanupThread();
}

std::optional<CacheBackend::Value> LocalBackend::get(const std::string& key) {
    auto entry = getEntry(key);
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->value);
}

std::optional<CacheBackend::Entry> LocalBackend::getEntry(const std::string& key) {
    try {
        // unique_lock: чтение меняет порядок LRU
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            ++misses_;
            return std::nullopt;
        }
        auto now = Clock::now();
        const auto& expiresAt = it->second.second.expiresAt;
        if (now >= expiresAt) {
            // Запись истекла, удаляем её на месте
            eraseLocked(it);
            ++expirations_;
            ++misses_;
            return std::nullopt;
        }
        lruList_.splice(lruList_.begin(), lruList_, it->second.first);
        ++hits_;
        Entry entry{it->second.second.value, std::nullopt};
        if (expiresAt != Clock::time_point::max()) {
            entry.ttlRemaining = std::chrono::duration_cast<std::chrono::seconds>(expiresAt - now);
        }
        return entry;
    } catch (const std::exception& e) {
        logging::getLogger()->error("LocalBackend: unexpected ошибка get key='{}': {}", key, e.what());
        return std::nullopt;
    }
}

void LocalBackend::set(const std::string& key, const Value& value, Ttl ttl) {
    try {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (ttl && ttl->count() <= 0) {
            // Неположительный TTL: запись сразу считается истёкшей
            if (it != cache_.end()) {
                eraseLocked(it);
            }
            return;
        }
        auto now = Clock::now();
        auto expiresAt = ttl ? expiryFor(now, *ttl) : Clock::time_point::max();
        if (it != cache_.end()) {
            // Обновляем существующую запись
            it->second.second.value = value;
            it->second.second.expiresAt = expiresAt;
            lruList_.splice(lruList_.begin(), lruList_, it->second.first);
        } else {
            if (cache_.size() >= config_.localMaxEntries) {
                evictLRU();
            }
            lruList_.push_front(key);
            try {
                cache_.emplace(key, std::make_pair(lruList_.begin(), CacheEntry{value, expiresAt}));
            } catch (const std::exception&) {
                lruList_.pop_front();
                throw;
            }
        }
        ++sets_;
    } catch (const std::exception& e) {
        logging::getLogger()->error("LocalBackend: unexpected ошибка set key='{}': {}", key, e.what());
    }
}

void LocalBackend::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        eraseLocked(it);
        ++removals_;
    }
}

bool LocalBackend::exists(const std::string& key) {
    return get(key).has_value();
}

std::optional<std::chrono::seconds> LocalBackend::ttlRemaining(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    auto now = Clock::now();
    const auto& expiresAt = it->second.second.expiresAt;
    if (now >= expiresAt) {
        return std::nullopt;
    }
    if (expiresAt == Clock::time_point::max()) {
        return std::chrono::seconds::max();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(expiresAt - now);
}

size_t LocalBackend::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

void LocalBackend::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    removals_ += cache_.size();
    cache_.clear();
    lruList_.clear();
}

size_t LocalBackend::removeByPrefix(const std::string& prefix) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            lruList_.erase(it->second.first);
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    removals_ += removed;
    return removed;
}

size_t LocalBackend::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (now >= it->second.second.expiresAt) {
            lruList_.erase(it->second.first);
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_ += removed;
    return removed;
}

CacheMetrics LocalBackend::getMetrics() const {
    CacheMetrics metrics;
    metrics.hits = hits_.load(std::memory_order_relaxed);
    metrics.misses = misses_.load(std::memory_order_relaxed);
    metrics.localHits = metrics.hits;
    metrics.sets = sets_.load(std::memory_order_relaxed);
    metrics.removals = removals_.load(std::memory_order_relaxed);
    metrics.evictions = evictions_.load(std::memory_order_relaxed);
    metrics.expirations = expirations_.load(std::memory_order_relaxed);
    metrics.entryCount = size();
    metrics.lastUpdate = Clock::now();
    metrics.updateHitRate();
    return metrics;
}

void LocalBackend::eraseLocked(EntryMap::iterator it) {
    lruList_.erase(it->second.first);
    cache_.erase(it);
}

void LocalBackend::evictLRU() {
    if (lruList_.empty()) return;
    auto it = cache_.find(lruList_.back());
    if (it != cache_.end()) {
        logging::getLogger()->debug("LocalBackend: вытеснена запись key={}", it->first);
        eraseLocked(it);
        ++evictions_;
    }
}

void LocalBackend::startCleanupThread() {
    stopCleanup_.store(false, std::memory_order_release);
    cleanupThread_ = std::thread([this] {
        cleanupThreadFunc();
    });
}

void LocalBackend::stopCleanupThread() {
    stopCleanup_.store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        cleanupCv_.notify_all();
    }
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
}

void LocalBackend::cleanupThreadFunc() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    logging::getLogger()->debug("LocalBackend: cleanupThread стартует (thread_id={})", oss.str());

    while (!stopCleanup_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(cleanupMutex_);
            cleanupCv_.wait_for(lock, config_.localCleanupInterval,
                                [this] { return stopCleanup_.load(std::memory_order_acquire); });
        }
        if (stopCleanup_.load(std::memory_order_acquire)) break;

        auto removed = removeExpired();
        if (removed > 0) {
            logging::getLogger()->debug("LocalBackend: фоновая очистка удалила {} записей", removed);
        }
    }

    logging::getLogger()->debug("LocalBackend: cleanupThread завершён (thread_id={})", oss.str());
}

} // namespace cache
} // namespace core
} // namespace tiercache
