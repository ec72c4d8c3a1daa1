#include "tiercache/core/logging/CacheLogger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace tiercache {
namespace core {
namespace logging {

namespace {

const std::array<const char*, 7> kLevelNames = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

bool LoggingConfig::validate() const {
    bool knownLevel = std::find(kLevelNames.begin(), kLevelNames.end(), level) != kLevelNames.end();
    return knownLevel && maxFileSize > 0 && maxFiles > 0 && !pattern.empty();
}

nlohmann::json LoggingConfig::toJson() const {
    return {
        {"level", level},
        {"filePath", filePath},
        {"maxFileSize", maxFileSize},
        {"maxFiles", maxFiles},
        {"pattern", pattern}
    };
}

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    LoggingConfig config;
    try {
        config.level = j.value("level", config.level);
        config.filePath = j.value("filePath", config.filePath);
        config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
        config.maxFiles = j.value("maxFiles", config.maxFiles);
        config.pattern = j.value("pattern", config.pattern);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Некорректная секция logging: ") + e.what());
    }
    if (!config.validate()) {
        throw std::invalid_argument("Некорректная конфигурация логирования (level='" + config.level + "')");
    }
    return config;
}

void initializeLogging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(loggerMutex());
    try {
        std::vector<spdlog::sink_ptr> sinks;
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern(config.pattern);
        sinks.push_back(consoleSink);

        if (!config.filePath.empty()) {
            // Создаём директорию для логов, если её нет
            auto parent = std::filesystem::path(config.filePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            rotatingSink->set_pattern(config.pattern);
            sinks.push_back(rotatingSink);
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.level));
        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger);
        logger->info("Логирование инициализировано: level={}, file='{}'", config.level, config.filePath);
    } catch (const std::exception& e) {
        std::cerr << "Ошибка инициализации логгера tiercache: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(loggerMutex());
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    try {
        return spdlog::stdout_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "tiercache: консольный логгер недоступен: " << e.what() << std::endl;
        return spdlog::default_logger();
    }
}

} // namespace logging
} // namespace core
} // namespace tiercache
