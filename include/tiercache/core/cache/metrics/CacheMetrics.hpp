#pragma once
#include <cstddef>
#include <chrono>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace core {
namespace cache {

// CacheMetrics: счётчики кэша (попадания, промахи, продвижения, ошибки, вытеснения)
struct CacheMetrics {
    size_t hits = 0;          // Попадания
    size_t misses = 0;        // Промахи
    size_t localHits = 0;     // Попадания в локальный уровень
    size_t sharedHits = 0;    // Попадания в общий уровень
    size_t promotions = 0;    // Продвижения в локальный уровень
    size_t sets = 0;          // Записи
    size_t removals = 0;      // Удаления
    size_t errors = 0;        // Ошибки общего уровня
    size_t timeouts = 0;      // Из них таймауты
    size_t serializationFailures = 0;
    size_t evictions = 0;     // LRU-вытеснения
    size_t expirations = 0;   // Истёкшие записи
    size_t entryCount = 0;    // Записей в локальном уровне
    double hitRate = 0.0;     // Доля попаданий
    std::chrono::steady_clock::time_point lastUpdate; // Последнее обновление

    void updateHitRate() {
        auto total = hits + misses;
        hitRate = total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
    }

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"localHits", localHits},
            {"sharedHits", sharedHits},
            {"promotions", promotions},
            {"sets", sets},
            {"removals", removals},
            {"errors", errors},
            {"timeouts", timeouts},
            {"serializationFailures", serializationFailures},
            {"evictions", evictions},
            {"expirations", expirations},
            {"entryCount", entryCount},
            {"hitRate", hitRate},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace tiercache
