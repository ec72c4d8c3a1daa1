#include "tiercache/core/cache/manager/CacheManager.hpp"
#include "tiercache/core/cache/local/LocalBackend.hpp"
#include "tiercache/core/cache/shared/SharedBackend.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include <limits>
#include <list>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tiercache {
namespace core {
namespace cache {

// Реализация PIMPL
struct CacheManager::Impl {
    // Сущность, для которой этот процесс выдавал ключи
    struct TrackedEntity {
        std::string entityKey;                           // Основной ключ (может быть хешем)
        std::unordered_set<std::string> collectionKeys;  // Выданные ключи коллекций
        std::list<std::string>::iterator lruPos;
    };

    std::shared_ptr<LayeredCache> cache;
    CacheConfig config;
    // "domain:id" без хеширования -> сущность; размер ограничен maxTrackedEntities
    std::unordered_map<std::string, TrackedEntity> tracked;
    std::list<std::string> trackedLru; // front: последние
    mutable std::mutex trackingMutex;

    Impl(std::shared_ptr<LayeredCache> c, const CacheConfig& cfg) : cache(std::move(c)), config(cfg) {}

    std::chrono::seconds resolveTtl(Ttl ttl) const {
        return ttl ? *ttl : config.defaultTtl;
    }

    // Идентичность сущности без хеширования: по ней находятся и хешированные ключи
    static std::string entityIdentity(const std::string& domain, const KeyPart& id) {
        return buildCacheKey(domain, {id}, {}, std::numeric_limits<size_t>::max());
    }

    // Вызывается под trackingMutex
    TrackedEntity& touchLocked(const std::string& identity, const std::string& entityKey) {
        auto it = tracked.find(identity);
        if (it != tracked.end()) {
            trackedLru.splice(trackedLru.begin(), trackedLru, it->second.lruPos);
            return it->second;
        }
        trackedLru.push_front(identity);
        auto& entity = tracked[identity];
        entity.entityKey = entityKey;
        entity.lruPos = trackedLru.begin();
        while (tracked.size() > config.maxTrackedEntities) {
            auto victim = tracked.find(trackedLru.back());
            logging::getLogger()->debug("CacheManager: {} вытеснен из отслеживания, {} ключей истекут по TTL",
                                        trackedLru.back(), victim->second.collectionKeys.size());
            tracked.erase(victim);
            trackedLru.pop_back();
        }
        return tracked[identity];
    }

    void trackCollectionKey(const std::string& identity, const std::string& entityKey, const std::string& key) {
        std::lock_guard<std::mutex> lock(trackingMutex);
        auto& keys = touchLocked(identity, entityKey).collectionKeys;
        if (keys.size() >= config.maxTrackedCollectionKeys && keys.count(key) == 0) {
            logging::getLogger()->debug("CacheManager: лимит ключей коллекций для {} исчерпан, key={} истечёт по TTL",
                                        identity, key);
            return;
        }
        keys.insert(key);
    }

    // Хешированный основной ключ запоминается, чтобы его нашёл invalidateDomain
    void trackHashedEntity(const std::string& identity, const std::string& entityKey) {
        if (identity == entityKey) {
            return;
        }
        std::lock_guard<std::mutex> lock(trackingMutex);
        touchLocked(identity, entityKey);
    }

    std::vector<std::string> takeCollectionKeys(const std::string& identity) {
        std::lock_guard<std::mutex> lock(trackingMutex);
        auto it = tracked.find(identity);
        if (it == tracked.end()) {
            return {};
        }
        std::vector<std::string> keys(it->second.collectionKeys.begin(), it->second.collectionKeys.end());
        trackedLru.erase(it->second.lruPos);
        tracked.erase(it);
        return keys;
    }

    // Забирает сущности пространства; возвращает их ключи, не покрытые удалением по префиксу
    std::vector<std::string> takeHashedKeys(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(trackingMutex);
        std::vector<std::string> hashed;
        auto outsidePrefix = [&prefix](const std::string& key) {
            return key.compare(0, prefix.size(), prefix) != 0;
        };
        for (auto it = tracked.begin(); it != tracked.end();) {
            if (outsidePrefix(it->first)) {
                ++it;
                continue;
            }
            if (outsidePrefix(it->second.entityKey)) {
                hashed.push_back(it->second.entityKey);
            }
            for (const auto& key : it->second.collectionKeys) {
                if (outsidePrefix(key)) {
                    hashed.push_back(key);
                }
            }
            trackedLru.erase(it->second.lruPos);
            it = tracked.erase(it);
        }
        return hashed;
    }

    std::optional<Value> read(const std::string& key) {
        try {
            return cache->get(key);
        } catch (const std::exception& e) {
            logging::getLogger()->error("CacheManager: unexpected ошибка чтения key={}: {}", key, e.what());
            return std::nullopt;
        }
    }

    void write(const std::string& key, const Value& value, Ttl ttl) {
        try {
            cache->set(key, value, resolveTtl(ttl));
        } catch (const std::exception& e) {
            logging::getLogger()->error("CacheManager: unexpected ошибка записи key={}: {}", key, e.what());
        }
    }
};

CacheManager::CacheManager(std::shared_ptr<LayeredCache> cache, const CacheConfig& config)
    : pImpl(std::make_unique<Impl>(std::move(cache), config)) {
    if (!pImpl->cache) {
        throw std::invalid_argument("CacheManager: LayeredCache не задан");
    }
    if (!config.validate()) {
        throw std::invalid_argument("CacheManager: некорректная конфигурация кэша");
    }
    logging::getLogger()->info("CacheManager создан: keyHashThreshold={}, defaultTtl={}s",
                               config.keyHashThreshold, config.defaultTtl.count());
}

CacheManager::~CacheManager() = default;

std::string CacheManager::generateKey(const std::string& prefix,
                                      const PositionalKeyParts& positional,
                                      const NamedKeyParts& named) const {
    return buildCacheKey(prefix, positional, named, pImpl->config.keyHashThreshold);
}

std::optional<CacheManager::Value> CacheManager::get(const std::string& domain, const KeyPart& id) {
    try {
        return pImpl->read(generateKey(domain, {id}));
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка get domain={}: {}", domain, e.what());
        return std::nullopt;
    }
}

std::optional<CacheRecord> CacheManager::getRecord(const std::string& domain, const KeyPart& id) {
    try {
        auto key = generateKey(domain, {id});
        auto value = pImpl->read(key);
        if (!value) {
            return std::nullopt;
        }
        return CacheRecord{std::move(key), std::move(*value)};
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка getRecord domain={}: {}", domain, e.what());
        return std::nullopt;
    }
}

void CacheManager::set(const std::string& domain, const KeyPart& id, const Value& value, Ttl ttl) {
    try {
        auto key = generateKey(domain, {id});
        pImpl->write(key, value, ttl);
        pImpl->trackHashedEntity(Impl::entityIdentity(domain, id), key);
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка set domain={}: {}", domain, e.what());
    }
}

std::optional<CacheManager::Value> CacheManager::getCollection(const std::string& domain, const KeyPart& id,
                                                               int64_t page, int64_t limit) {
    try {
        return pImpl->read(generateKey(domain, {id}, {{"page", page}, {"limit", limit}}));
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка getCollection domain={}: {}", domain, e.what());
        return std::nullopt;
    }
}

void CacheManager::setCollection(const std::string& domain, const KeyPart& id, const Value& value,
                                 int64_t page, int64_t limit, Ttl ttl) {
    try {
        auto key = generateKey(domain, {id}, {{"page", page}, {"limit", limit}});
        pImpl->write(key, value, ttl);
        pImpl->trackCollectionKey(Impl::entityIdentity(domain, id), generateKey(domain, {id}), key);
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка setCollection domain={}: {}", domain, e.what());
    }
}

void CacheManager::invalidate(const std::string& domain, const KeyPart& id) {
    try {
        auto entityKey = generateKey(domain, {id});
        pImpl->cache->remove(entityKey);
        auto collectionKeys = pImpl->takeCollectionKeys(Impl::entityIdentity(domain, id));
        for (const auto& key : collectionKeys) {
            pImpl->cache->remove(key);
        }
        logging::getLogger()->debug("CacheManager: инвалидирован {} (+{} ключей коллекций)",
                                    entityKey, collectionKeys.size());
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка invalidate domain={}: {}", domain, e.what());
    }
}

size_t CacheManager::invalidateDomain(const std::string& domain) {
    try {
        const std::string prefix = domain + kKeyDelimiter;
        // Ключи пространства, ушедшие в хеш, префиксом не находятся
        for (const auto& key : pImpl->takeHashedKeys(prefix)) {
            pImpl->cache->remove(key);
        }
        return pImpl->cache->removeByPrefix(prefix);
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка invalidateDomain domain={}: {}", domain, e.what());
        return 0;
    }
}

std::optional<CacheManager::Value> CacheManager::getCachedUser(int64_t userId) {
    return get(domain::kUser, userId);
}

void CacheManager::setCachedUser(int64_t userId, const Value& user, Ttl ttl) {
    set(domain::kUser, userId, user, ttl);
}

std::optional<CacheManager::Value> CacheManager::getCachedApplications(int64_t userId, int64_t page, int64_t limit) {
    return getCollection(domain::kApplications, userId, page, limit);
}

void CacheManager::setCachedApplications(int64_t userId, const Value& applications, int64_t page, int64_t limit,
                                         Ttl ttl) {
    setCollection(domain::kApplications, userId, applications, page, limit, ttl);
}

std::optional<CacheManager::Value> CacheManager::getCachedRecommendations(int64_t userId, const NamedKeyParts& filters) {
    try {
        return pImpl->read(generateKey(domain::kRecommendations, {userId}, filters));
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка getCachedRecommendations: {}", e.what());
        return std::nullopt;
    }
}

void CacheManager::setCachedRecommendations(int64_t userId, const Value& recommendations,
                                            const NamedKeyParts& filters, Ttl ttl) {
    try {
        auto key = generateKey(domain::kRecommendations, {userId}, filters);
        pImpl->write(key, recommendations, ttl);
        if (!filters.empty()) {
            pImpl->trackCollectionKey(Impl::entityIdentity(domain::kRecommendations, userId),
                                      generateKey(domain::kRecommendations, {userId}), key);
        }
    } catch (const std::exception& e) {
        logging::getLogger()->error("CacheManager: unexpected ошибка setCachedRecommendations: {}", e.what());
    }
}

std::optional<CacheManager::Value> CacheManager::getCachedJob(const std::string& jobId) {
    return get(domain::kJobs, jobId);
}

void CacheManager::setCachedJob(const std::string& jobId, const Value& job, Ttl ttl) {
    set(domain::kJobs, jobId, job, ttl);
}

void CacheManager::invalidateUser(int64_t userId) {
    invalidate(domain::kUser, userId);
    invalidate(domain::kApplications, userId);
    invalidate(domain::kRecommendations, userId);
}

size_t CacheManager::trackedCollectionKeys() const {
    std::lock_guard<std::mutex> lock(pImpl->trackingMutex);
    size_t total = 0;
    for (const auto& [identity, entity] : pImpl->tracked) {
        total += entity.collectionKeys.size();
    }
    return total;
}

size_t CacheManager::trackedEntities() const {
    std::lock_guard<std::mutex> lock(pImpl->trackingMutex);
    return pImpl->tracked.size();
}

CacheMetrics CacheManager::getMetrics() const {
    return pImpl->cache->getMetrics();
}

nlohmann::json CacheManager::getStats() const {
    nlohmann::json stats = {
        {"config", pImpl->config.toJson()},
        {"trackedCollectionKeys", trackedCollectionKeys()},
        {"trackedEntities", trackedEntities()},
        {"sharedEnabled", pImpl->cache->shared().isEnabled()}
    };
    if (pImpl->config.enableMetrics) {
        stats["metrics"] = getMetrics().toJson();
    }
    return stats;
}

void CacheManager::clearLocal() {
    pImpl->cache->clearLocal();
    logging::getLogger()->info("CacheManager: локальный уровень очищен");
}

CacheConfig CacheManager::getConfiguration() const {
    return pImpl->config;
}

std::shared_ptr<CacheManager> createCacheManager(std::shared_ptr<KeyValueClient> client, const CacheConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("createCacheManager: некорректная конфигурация кэша");
    }
    auto local = std::make_shared<LocalBackend>(config);
    auto shared = std::make_shared<SharedBackend>(std::move(client), config);
    auto layered = std::make_shared<LayeredCache>(std::move(local), std::move(shared), config);
    return std::make_shared<CacheManager>(std::move(layered), config);
}

} // namespace cache
} // namespace core
} // namespace tiercache
