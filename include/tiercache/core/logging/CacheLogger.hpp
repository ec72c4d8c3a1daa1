#pragma once
#include <string>
#include <memory>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tiercache {
namespace core {
namespace logging {

constexpr const char* kLoggerName = "tiercache";

// LoggingConfig: параметры логирования (уровень, файл, ротация)
struct LoggingConfig {
    std::string level = "info";       // trace/debug/info/warn/error/critical/off
    std::string filePath;             // Пустой путь = только консоль
    size_t maxFileSize = 1024 * 1024 * 5; // Макс. размер файла (5 MB)
    size_t maxFiles = 3;              // Кол-во файлов ротации
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    bool validate() const;
    nlohmann::json toJson() const;
    static LoggingConfig fromJson(const nlohmann::json& j);
};

// Создаёт (или пересоздаёт) логгер "tiercache" с консольным и, при необходимости, файловым sink
void initializeLogging(const LoggingConfig& config);

// Логгер подсистемы; если initializeLogging не вызывался, создаётся консольный
std::shared_ptr<spdlog::logger> getLogger();

} // namespace logging
} // namespace core
} // namespace tiercache
