#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "tiercache/core/cache/CacheConfig.hpp"
#include "tiercache/core/cache/manager/CacheManager.hpp"
#include "tiercache/core/cache/shared/RedisClient.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"

using namespace tiercache::core;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitMissing = 2;

// Компоненты процесса: создаются в main и передаются командам явно
struct Components {
    std::shared_ptr<cache::RedisClient> redisClient;
    std::shared_ptr<cache::CacheManager> cacheManager;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> <command> [args]\n"
              << "Commands:\n"
              << "  ping\n"
              << "  get <domain> <id>\n"
              << "  set <domain> <id> <json> [ttlSeconds]\n"
              << "  invalidate <domain> <id>\n"
              << "  stats\n";
}

// Числовой идентификатор кладётся в ключ как число, иначе как строка
cache::KeyPart parseId(const std::string& raw) {
    auto value = nlohmann::json::parse(raw, nullptr, false);
    if (!value.is_discarded() && value.is_number_integer()) {
        return value;
    }
    return raw;
}

// Initialize components
Components initializeComponents(const cache::ServiceConfig& config) {
    auto logger = logging::getLogger();
    Components components;
    std::shared_ptr<cache::KeyValueClient> client;
    if (config.redis.enabled) {
        logger->info("[init] RedisClient {}:{}", config.redis.host, config.redis.port);
        components.redisClient = std::make_shared<cache::RedisClient>(config.redis);
        if (!components.redisClient->connect()) {
            // Кэш работает и без общего уровня: клиент переподключится при следующей команде
            logger->warn("[init] Redis недоступен, операции общего уровня будут промахами");
        }
        client = components.redisClient;
    } else {
        logger->info("[init] Redis отключён, только локальный уровень");
    }
    logger->info("[init] CacheManager");
    components.cacheManager = cache::createCacheManager(client, config.cache);
    return components;
}

void shutdown(Components& components) {
    components.cacheManager.reset();
    if (components.redisClient) {
        components.redisClient->close();
        components.redisClient.reset();
    }
    spdlog::shutdown();
}

int runCommand(const Components& components, const std::string& command, const std::vector<std::string>& args) {
    const auto& manager = components.cacheManager;
    if (command == "ping") {
        bool ok = components.redisClient && components.redisClient->ping();
        std::cout << (ok ? "PONG" : "UNAVAILABLE") << std::endl;
        return ok ? kExitOk : kExitMissing;
    }
    if (command == "stats") {
        std::cout << manager->getStats().dump(2) << std::endl;
        return kExitOk;
    }
    if (command == "get" && args.size() == 2) {
        auto value = manager->get(args[0], parseId(args[1]));
        if (!value) {
            return kExitMissing;
        }
        std::cout << value->dump() << std::endl;
        return kExitOk;
    }
    if (command == "set" && (args.size() == 3 || args.size() == 4)) {
        auto value = nlohmann::json::parse(args[2], nullptr, false);
        if (value.is_discarded()) {
            std::cerr << "Invalid JSON value: " << args[2] << std::endl;
            return kExitUsage;
        }
        cache::CacheManager::Ttl ttl;
        if (args.size() == 4) {
            ttl = std::chrono::seconds(std::stoll(args[3]));
        }
        manager->set(args[0], parseId(args[1]), value, ttl);
        return kExitOk;
    }
    if (command == "invalidate" && args.size() == 2) {
        manager->invalidate(args[0], parseId(args[1]));
        return kExitOk;
    }
    return -1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    const std::string configPath = argv[1];
    const std::string command = argv[2];
    const std::vector<std::string> args(argv + 3, argv + argc);

    Components components;
    try {
        auto config = cache::loadConfigFile(configPath);
        logging::initializeLogging(config.logging);
        components = initializeComponents(config);

        int code = runCommand(components, command, args);
        shutdown(components);
        if (code < 0) {
            printUsage(argv[0]);
            return kExitUsage;
        }
        return code;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get(logging::kLoggerName)) {
            spdlog::get(logging::kLoggerName)->critical("Fatal error: {}", e.what());
        }
        shutdown(components);
        return kExitUsage;
    }
}
