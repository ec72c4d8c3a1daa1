#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/base/CacheBackend.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"
#include "tiercache/core/cache/shared/KeyValueClient.hpp"

namespace tiercache {
namespace core {
namespace cache {

// SharedBackend: уровень поверх внешнего хранилища (Redis).
// Значения кодируются в компактный JSON. Каждая операция выполняется в пуле
// потоков и ожидается не дольше sharedTimeout; таймаут, ошибка связи или
// декодирования превращаются в промах/no-op.
class SharedBackend : public CacheBackend {
public:
    // client может быть nullptr: общий уровень отключён, все операции: промахи
    SharedBackend(std::shared_ptr<KeyValueClient> client, const CacheConfig& config);
    ~SharedBackend() override;
    SharedBackend(const SharedBackend&) = delete;
    SharedBackend& operator=(const SharedBackend&) = delete;

    std::optional<Value> get(const std::string& key) override;
    void set(const std::string& key, const Value& value, Ttl ttl = std::nullopt) override;
    void remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    std::string name() const override { return "shared"; }

    std::optional<Entry> getEntry(const std::string& key) override; // TTL от хранилища (PTTL)
    size_t removeByPrefix(const std::string& prefix) override;
    CacheMetrics getMetrics() const override;
    bool isEnabled() const override; // Есть ли клиент

    bool ping(); // Проверка связи

    static std::string encode(const Value& value); // SerializationFailure при ошибке
    static Value decode(const std::string& payload); // SerializationFailure при ошибке

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace tiercache
