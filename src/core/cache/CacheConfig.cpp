#include "tiercache/core/cache/CacheConfig.hpp"
#include <fstream>
#include <stdexcept>

namespace tiercache {
namespace core {
namespace cache {

namespace {

template<typename Duration>
Duration readDuration(const nlohmann::json& j, const char* field, Duration fallback) {
    return Duration(j.value(field, static_cast<long long>(fallback.count())));
}

} // namespace

nlohmann::json CacheConfig::toJson() const {
    return {
        {"localTtlCapSeconds", localTtlCap.count()},
        {"localMaxEntries", localMaxEntries},
        {"localCleanupIntervalSeconds", localCleanupInterval.count()},
        {"sharedTimeoutMs", sharedTimeout.count()},
        {"ioThreads", ioThreads},
        {"ioQueueSize", ioQueueSize},
        {"keyHashThreshold", keyHashThreshold},
        {"maxTrackedCollectionKeys", maxTrackedCollectionKeys},
        {"maxTrackedEntities", maxTrackedEntities},
        {"defaultTtlSeconds", defaultTtl.count()},
        {"enableMetrics", enableMetrics}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    try {
        config.localTtlCap = readDuration(j, "localTtlCapSeconds", config.localTtlCap);
        config.localMaxEntries = j.value("localMaxEntries", config.localMaxEntries);
        config.localCleanupInterval = readDuration(j, "localCleanupIntervalSeconds", config.localCleanupInterval);
        config.sharedTimeout = readDuration(j, "sharedTimeoutMs", config.sharedTimeout);
        config.ioThreads = j.value("ioThreads", config.ioThreads);
        config.ioQueueSize = j.value("ioQueueSize", config.ioQueueSize);
        config.keyHashThreshold = j.value("keyHashThreshold", config.keyHashThreshold);
        config.maxTrackedCollectionKeys = j.value("maxTrackedCollectionKeys", config.maxTrackedCollectionKeys);
        config.maxTrackedEntities = j.value("maxTrackedEntities", config.maxTrackedEntities);
        config.defaultTtl = readDuration(j, "defaultTtlSeconds", config.defaultTtl);
        config.enableMetrics = j.value("enableMetrics", config.enableMetrics);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Некорректная секция cache: ") + e.what());
    }
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация кэша");
    }
    return config;
}

nlohmann::json RedisConfig::toJson() const {
    return {
        {"enabled", enabled},
        {"host", host},
        {"port", port},
        {"db", db},
        {"connectTimeoutMs", connectTimeout.count()},
        {"socketTimeoutMs", socketTimeout.count()}
    };
}

RedisConfig RedisConfig::fromJson(const nlohmann::json& j) {
    RedisConfig config;
    try {
        config.enabled = j.value("enabled", config.enabled);
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.db = j.value("db", config.db);
        config.password = j.value("password", config.password);
        config.connectTimeout = readDuration(j, "connectTimeoutMs", config.connectTimeout);
        config.socketTimeout = readDuration(j, "socketTimeoutMs", config.socketTimeout);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Некорректная секция redis: ") + e.what());
    }
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация Redis: " + config.host + ":" + std::to_string(config.port));
    }
    return config;
}

ServiceConfig ServiceConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Конфигурация должна быть JSON-объектом");
    }
    ServiceConfig config;
    if (j.contains("cache")) config.cache = CacheConfig::fromJson(j.at("cache"));
    if (j.contains("redis")) config.redis = RedisConfig::fromJson(j.at("redis"));
    if (j.contains("logging")) config.logging = logging::LoggingConfig::fromJson(j.at("logging"));
    return config;
}

ServiceConfig loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Не удалось открыть файл конфигурации: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Ошибка разбора " + path + ": " + e.what());
    }
    return ServiceConfig::fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace tiercache
