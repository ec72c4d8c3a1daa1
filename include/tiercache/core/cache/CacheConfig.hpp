#pragma once
#include <string>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "tiercache/core/logging/CacheLogger.hpp"

namespace tiercache {
namespace core {
namespace cache {

// CacheConfig: параметры двухуровневого кэша (TTL, лимиты, таймауты, хеширование ключей)
struct CacheConfig {
    std::chrono::seconds localTtlCap = std::chrono::seconds(300);        // Потолок TTL локального уровня
    size_t localMaxEntries = 1000;                                       // Макс. записей в локальном уровне
    std::chrono::seconds localCleanupInterval = std::chrono::seconds(0); // Фоновая очистка (0 = выкл.)
    std::chrono::milliseconds sharedTimeout = std::chrono::milliseconds(500); // Таймаут общего уровня
    size_t ioThreads = 4;                                                // Потоки для сетевых операций
    size_t ioQueueSize = 1024;                                           // Макс. очередь сетевых операций
    size_t keyHashThreshold = 250;                                       // Порог длины ключа
    size_t maxTrackedCollectionKeys = 512;                               // Лимит ключей коллекций на сущность
    size_t maxTrackedEntities = 10000;                                   // Лимит отслеживаемых сущностей (LRU)
    std::chrono::seconds defaultTtl = std::chrono::seconds(3600);        // TTL по умолчанию (1 час)
    bool enableMetrics = true;                                           // Метрики
    bool validate() const {
        return localTtlCap.count() > 0 && localMaxEntries > 0 && localCleanupInterval.count() >= 0 &&
               sharedTimeout.count() > 0 && ioThreads > 0 && ioQueueSize > 0 &&
               keyHashThreshold > 0 && maxTrackedEntities > 0 && defaultTtl.count() > 0;
    }
    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j); // std::invalid_argument при ошибке
};

// RedisConfig: параметры подключения к общему хранилищу
struct RedisConfig {
    bool enabled = true;                                               // false = только локальный уровень
    std::string host = "127.0.0.1";
    int port = 6379;
    int db = 0;
    std::string password;
    std::chrono::milliseconds connectTimeout = std::chrono::milliseconds(2000);
    std::chrono::milliseconds socketTimeout = std::chrono::milliseconds(1000);
    bool validate() const {
        return !enabled || (!host.empty() && port > 0 && port < 65536 && db >= 0 &&
                            connectTimeout.count() > 0 && socketTimeout.count() > 0);
    }
    nlohmann::json toJson() const; // пароль не экспортируется
    static RedisConfig fromJson(const nlohmann::json& j);
};

// ServiceConfig: корневой конфиг процесса (секции cache, redis, logging)
struct ServiceConfig {
    CacheConfig cache;
    RedisConfig redis;
    logging::LoggingConfig logging;
    static ServiceConfig fromJson(const nlohmann::json& j);
};

// Загрузка ServiceConfig из JSON-файла; std::invalid_argument при ошибке
ServiceConfig loadConfigFile(const std::string& path);

} // namespace cache
} // namespace core
} // namespace tiercache
