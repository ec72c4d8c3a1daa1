#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <cstddef>

namespace tiercache {
namespace core {
namespace cache {

// StoredValue: сырое значение из общего хранилища и остаток его TTL
struct StoredValue {
    std::string payload;
    std::optional<std::chrono::seconds> ttlRemaining; // nullopt = без TTL или неизвестно
};

// KeyValueClient: соединение с внешним key-value хранилищем.
// Создаётся и закрывается процессом, кэшу передаётся готовым.
// Ошибки связи выбрасываются как BackendUnavailable.
class KeyValueClient {
public:
    virtual ~KeyValueClient() = default;
    virtual std::optional<StoredValue> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& payload,
                     std::optional<std::chrono::seconds> ttl) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual size_t removeByPrefix(const std::string& prefix) = 0; // Кол-во удалённых ключей
    virtual bool ping() = 0;
};

} // namespace cache
} // namespace core
} // namespace tiercache
