#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <hiredis/hiredis.h>
#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/CacheErrors.hpp"
#include "tiercache/core/cache/shared/KeyValueClient.hpp"

namespace tiercache {
namespace core {
namespace cache {

// RedisClient: KeyValueClient поверх hiredis. Один redisContext,
// команды сериализуются мьютексом. После сетевой ошибки контекст
// сбрасывается и переподключается при следующей команде.
class RedisClient : public KeyValueClient {
public:
    explicit RedisClient(const RedisConfig& config); // Не подключается
    ~RedisClient() override;
    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    bool connect(); // Подключение; false при ошибке (логируется)
    void close(); // Закрыть соединение
    bool isConnected() const;

    std::optional<StoredValue> get(const std::string& key) override;
    void set(const std::string& key, const std::string& payload,
             std::optional<std::chrono::seconds> ttl) override;
    void remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    size_t removeByPrefix(const std::string& prefix) override;
    bool ping() override;

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const { freeReplyObject(reply); }
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;
    struct ContextDeleter {
        void operator()(redisContext* context) const { redisFree(context); }
    };
    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

    void connectLocked(); // BackendUnavailable при ошибке
    void ensureConnectedLocked();
    ReplyPtr commandLocked(const std::vector<std::string>& args);
    ReplyPtr readReplyLocked();
    BackendUnavailable connectionErrorLocked(const std::string& operation); // Сбрасывает контекст

    RedisConfig config_;
    ContextPtr context_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
