#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/base/CacheBackend.hpp"
#include "tiercache/core/cache/layered/LayeredCache.hpp"
#include "tiercache/core/cache/manager/CacheKey.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"
#include "tiercache/core/cache/shared/KeyValueClient.hpp"

namespace tiercache {
namespace core {
namespace cache {

// Пространства ключей и TTL по умолчанию для доменных данных
namespace domain {
inline constexpr char kUser[] = "user";
inline constexpr char kApplications[] = "applications";
inline constexpr char kRecommendations[] = "recommendations";
inline constexpr char kJobs[] = "jobs";

inline constexpr std::chrono::seconds kUserTtl{1800};
inline constexpr std::chrono::seconds kApplicationsTtl{300};
inline constexpr std::chrono::seconds kRecommendationsTtl{600};
inline constexpr std::chrono::seconds kJobTtl{3600};
} // namespace domain

// CacheRecord: ключ и значение доменной записи (проекция данных из основного хранилища)
struct CacheRecord {
    std::string key;
    nlohmann::json value;
};

// CacheManager: единственная точка входа для остальной системы.
// Строит ключи, даёт типизированные операции и инвалидацию.
// Ни одна операция не выбрасывает исключений: сбой = промах.
//
// Ключи коллекций (страницы, фильтры) запоминаются на сущность при записи
// и удаляются вместе с основным ключом в invalidate(). Ключи, записанные
// другими процессами, этому экземпляру неизвестны и истекают по TTL.
class CacheManager {
public:
    using Value = CacheBackend::Value;
    using Ttl = CacheBackend::Ttl; // nullopt = config.defaultTtl

    CacheManager(std::shared_ptr<LayeredCache> cache, const CacheConfig& config); // Конструктор
    ~CacheManager(); // Деструктор
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::string generateKey(const std::string& prefix,
                            const PositionalKeyParts& positional = {},
                            const NamedKeyParts& named = {}) const; // Построить ключ

    std::optional<Value> get(const std::string& domain, const KeyPart& id); // Получить
    std::optional<CacheRecord> getRecord(const std::string& domain, const KeyPart& id); // Получить с ключом
    void set(const std::string& domain, const KeyPart& id, const Value& value, Ttl ttl = std::nullopt); // Сохранить
    std::optional<Value> getCollection(const std::string& domain, const KeyPart& id,
                                       int64_t page, int64_t limit); // Страница коллекции
    void setCollection(const std::string& domain, const KeyPart& id, const Value& value,
                       int64_t page, int64_t limit, Ttl ttl = std::nullopt); // Сохранить страницу
    void invalidate(const std::string& domain, const KeyPart& id); // Основной ключ + ключи коллекций
    size_t invalidateDomain(const std::string& domain); // Все ключи пространства (по префиксу)

    std::optional<Value> getCachedUser(int64_t userId);
    void setCachedUser(int64_t userId, const Value& user, Ttl ttl = domain::kUserTtl);
    std::optional<Value> getCachedApplications(int64_t userId, int64_t page, int64_t limit);
    void setCachedApplications(int64_t userId, const Value& applications, int64_t page, int64_t limit,
                               Ttl ttl = domain::kApplicationsTtl);
    std::optional<Value> getCachedRecommendations(int64_t userId, const NamedKeyParts& filters = {});
    void setCachedRecommendations(int64_t userId, const Value& recommendations,
                                  const NamedKeyParts& filters = {}, Ttl ttl = domain::kRecommendationsTtl);
    std::optional<Value> getCachedJob(const std::string& jobId);
    void setCachedJob(const std::string& jobId, const Value& job, Ttl ttl = domain::kJobTtl);
    void invalidateUser(int64_t userId); // Профиль, заявки и рекомендации пользователя

    size_t trackedCollectionKeys() const; // Кол-во запомненных ключей коллекций
    size_t trackedEntities() const; // Кол-во отслеживаемых сущностей (не больше maxTrackedEntities)
    CacheMetrics getMetrics() const; // Метрики
    nlohmann::json getStats() const; // Метрики + конфигурация в JSON
    void clearLocal(); // Очистить локальный уровень
    CacheConfig getConfiguration() const; // Получить конфиг

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

// Собирает LocalBackend + SharedBackend + LayeredCache + CacheManager.
// client может быть nullptr (только локальный уровень).
std::shared_ptr<CacheManager> createCacheManager(std::shared_ptr<KeyValueClient> client, const CacheConfig& config);

} // namespace cache
} // namespace core
} // namespace tiercache
