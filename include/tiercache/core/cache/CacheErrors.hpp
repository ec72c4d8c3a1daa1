#pragma once
#include <stdexcept>
#include <string>

namespace tiercache {
namespace core {
namespace cache {

// CacheError: базовая ошибка кэша; наружу из бэкендов не выходит
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& what) : std::runtime_error(what) {}
};

// BackendUnavailable: общее хранилище недоступно (соединение, таймаут, протокол)
class BackendUnavailable : public CacheError {
public:
    explicit BackendUnavailable(const std::string& what) : CacheError(what) {}
};

// SerializationFailure: значение не удалось закодировать/декодировать
class SerializationFailure : public CacheError {
public:
    explicit SerializationFailure(const std::string& what) : CacheError(what) {}
};

} // namespace cache
} // namespace core
} // namespace tiercache
