#pragma once

#include <string>
#include <list>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <chrono>
#include <optional>
#include <thread>
#include <atomic>
#include <condition_variable>
#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/base/CacheBackend.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"

namespace tiercache {
namespace core {
namespace cache {

// LocalBackend: потокобезопасный in-memory уровень с TTL на каждую запись.
// Истёкшие записи удаляются лениво при чтении; при переполнении
// вытесняется наименее недавно использованная запись. Фоновая очистка
// (localCleanupInterval > 0) только ограничивает память.
class LocalBackend : public CacheBackend {
public:
    using Clock = std::chrono::steady_clock;
    struct CacheEntry {
        Value value;
        Clock::time_point expiresAt; // time_point::max() = бессрочно
    };

    explicit LocalBackend(const CacheConfig& config); // Конструктор
    ~LocalBackend() override; // Деструктор
    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::optional<Value> get(const std::string& key) override;
    void set(const std::string& key, const Value& value, Ttl ttl = std::nullopt) override;
    void remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::string name() const override { return "local"; }
    std::optional<Entry> getEntry(const std::string& key) override; // Бессрочная запись: ttlRemaining = nullopt
    size_t removeByPrefix(const std::string& prefix) override;
    CacheMetrics getMetrics() const override;

    std::optional<std::chrono::seconds> ttlRemaining(const std::string& key) const; // Остаток TTL
    size_t size() const; // Кол-во записей (включая ещё не удалённые истёкшие)
    void clear(); // Очистить
    size_t removeExpired(); // Синхронная очистка истёкших

private:
    using LruList = std::list<std::string>;
    using EntryMap = std::unordered_map<std::string, std::pair<LruList::iterator, CacheEntry>>;

    void eraseLocked(EntryMap::iterator it);
    void evictLRU();
    void startCleanupThread();
    void stopCleanupThread();
    void cleanupThreadFunc();

    CacheConfig config_;
    EntryMap cache_;
    LruList lruList_; // front = самый свежий
    mutable std::shared_mutex mutex_;

    std::thread cleanupThread_;
    std::atomic<bool> stopCleanup_{false};
    std::mutex cleanupMutex_; // только для ожидания на cleanupCv_
    std::condition_variable cleanupCv_;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> sets_{0};
    std::atomic<size_t> removals_{0};
    std::atomic<size_t> evictions_{0};
    std::atomic<size_t> expirations_{0};
};

} // namespace cache
} // namespace core
} // namespace tiercache
