#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"

namespace tiercache {
namespace core {
namespace cache {

// CacheBackend: контракт уровня кэша (get/set/remove/exists и служебные операции).
// Реализации работают по принципу fail-open: внутренняя ошибка никогда не
// выходит наружу, операция деградирует до промаха (get/exists) или no-op
// (set/remove), а ошибка только логируется.
class CacheBackend {
public:
    using Value = nlohmann::json;
    using Ttl = std::optional<std::chrono::seconds>; // nullopt = без ограничения

    // Entry: значение и остаток его TTL
    struct Entry {
        Value value;
        Ttl ttlRemaining; // nullopt = без TTL или уровень не умеет его сообщить
    };

    virtual ~CacheBackend() = default;
    virtual std::optional<Value> get(const std::string& key) = 0; // Получить
    virtual void set(const std::string& key, const Value& value, Ttl ttl = std::nullopt) = 0; // Сохранить
    virtual void remove(const std::string& key) = 0; // Удалить
    virtual bool exists(const std::string& key) = 0; // Есть ли ключ
    virtual std::optional<Entry> getEntry(const std::string& key) = 0; // Значение + остаток TTL
    virtual size_t removeByPrefix(const std::string& prefix) = 0; // Кол-во удалённых ключей
    virtual CacheMetrics getMetrics() const = 0; // Метрики уровня
    virtual bool isEnabled() const { return true; } // Уровень подключён
    virtual std::string name() const = 0; // Имя уровня для диагностики
};

} // namespace cache
} // namespace core
} // namespace tiercache
