#include "tiercache/core/cache/shared/RedisClient.hpp"
#include "tiercache/core/logging/CacheLogger.hpp"
#include <sys/time.h>

namespace tiercache {
namespace core {
namespace cache {

namespace {

timeval toTimeval(std::chrono::milliseconds ms) {
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(ms.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((ms.count() % 1000) * 1000);
    return tv;
}

// Экранирование glob-символов для SCAN MATCH
std::string escapeGlob(const std::string& prefix) {
    std::string escaped;
    escaped.reserve(prefix.size());
    for (char c : prefix) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string replyText(const redisReply* reply) {
    return reply->str ? std::string(reply->str, reply->len) : std::string();
}

} // namespace

RedisClient::RedisClient(const RedisConfig& config) : config_(config) {}

RedisClient::~RedisClient() {
    close();
}

bool RedisClient::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        connectLocked();
        logging::getLogger()->info("RedisClient: подключен к {}:{} (db={})", config_.host, config_.port, config_.db);
        return true;
    } catch (const BackendUnavailable& e) {
        logging::getLogger()->warn("RedisClient: подключение не удалось: {}", e.what());
        return false;
    }
}

void RedisClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (context_) {
        context_.reset();
        logging::getLogger()->info("RedisClient: соединение с {}:{} закрыто", config_.host, config_.port);
    }
}

bool RedisClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_ != nullptr;
}

std::optional<StoredValue> RedisClient::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensureConnectedLocked();

    // GET и PTTL одним пайплайном
    const char* getArgv[] = {"GET", key.c_str()};
    const size_t getLen[] = {3, key.size()};
    const char* ttlArgv[] = {"PTTL", key.c_str()};
    const size_t ttlLen[] = {4, key.size()};
    if (redisAppendCommandArgv(context_.get(), 2, getArgv, getLen) != REDIS_OK ||
        redisAppendCommandArgv(context_.get(), 2, ttlArgv, ttlLen) != REDIS_OK) {
        throw connectionErrorLocked("GET");
    }
    auto value = readReplyLocked();
    auto pttl = readReplyLocked();

    if (value->type == REDIS_REPLY_ERROR) {
        throw BackendUnavailable("Redis GET: " + replyText(value.get()));
    }
    if (value->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (value->type != REDIS_REPLY_STRING) {
        throw BackendUnavailable("Redis GET: неожиданный тип ответа " + std::to_string(value->type));
    }

    StoredValue stored{replyText(value.get()), std::nullopt};
    // PTTL: -1 = без TTL, -2 = ключа нет
    if (pttl->type == REDIS_REPLY_INTEGER && pttl->integer >= 0) {
        stored.ttlRemaining = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::milliseconds(pttl->integer));
    }
    return stored;
}

void RedisClient::set(const std::string& key, const std::string& payload,
                      std::optional<std::chrono::seconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ttl && ttl->count() <= 0) {
        commandLocked({"DEL", key});
        return;
    }
    if (ttl) {
        commandLocked({"SET", key, payload, "EX", std::to_string(ttl->count())});
    } else {
        commandLocked({"SET", key, payload});
    }
}

void RedisClient::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    commandLocked({"DEL", key});
}

bool RedisClient::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = commandLocked({"EXISTS", key});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

size_t RedisClient::removeByPrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string pattern = escapeGlob(prefix) + "*";
    std::string cursor = "0";
    size_t removed = 0;
    do {
        auto reply = commandLocked({"SCAN", cursor, "MATCH", pattern, "COUNT", "200"});
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            throw BackendUnavailable("Redis SCAN: неожиданный формат ответа");
        }
        cursor = replyText(reply->element[0]);
        const redisReply* keys = reply->element[1];
        if (keys->elements > 0) {
            std::vector<std::string> del{"DEL"};
            del.reserve(keys->elements + 1);
            for (size_t i = 0; i < keys->elements; ++i) {
                del.push_back(replyText(keys->element[i]));
            }
            auto deleted = commandLocked(del);
            if (deleted->type == REDIS_REPLY_INTEGER) {
                removed += static_cast<size_t>(deleted->integer);
            }
        }
    } while (cursor != "0");
    return removed;
}

bool RedisClient::ping() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto reply = commandLocked({"PING"});
        return reply->type == REDIS_REPLY_STATUS && replyText(reply.get()) == "PONG";
    } catch (const BackendUnavailable& e) {
        logging::getLogger()->warn("RedisClient: PING не прошёл: {}", e.what());
        return false;
    }
}

void RedisClient::connectLocked() {
    ContextPtr context(redisConnectWithTimeout(config_.host.c_str(), config_.port, toTimeval(config_.connectTimeout)));
    if (!context) {
        throw BackendUnavailable("Redis: не удалось выделить контекст");
    }
    if (context->err) {
        throw BackendUnavailable("Redis " + config_.host + ":" + std::to_string(config_.port) + ": " + context->errstr);
    }
    if (redisSetTimeout(context.get(), toTimeval(config_.socketTimeout)) != REDIS_OK) {
        throw BackendUnavailable("Redis: не удалось установить таймаут сокета");
    }
    context_ = std::move(context);
    try {
        if (!config_.password.empty()) {
            commandLocked({"AUTH", config_.password});
        }
        if (config_.db != 0) {
            commandLocked({"SELECT", std::to_string(config_.db)});
        }
    } catch (const BackendUnavailable&) {
        context_.reset();
        throw;
    }
}

void RedisClient::ensureConnectedLocked() {
    if (!context_) {
        connectLocked();
    }
}

RedisClient::ReplyPtr RedisClient::commandLocked(const std::vector<std::string>& args) {
    ensureConnectedLocked();
    std::vector<const char*> argv;
    std::vector<size_t> argvLen;
    argv.reserve(args.size());
    argvLen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvLen.push_back(arg.size());
    }
    auto* raw = static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(args.size()), argv.data(), argvLen.data()));
    if (!raw) {
        throw connectionErrorLocked(args.front());
    }
    ReplyPtr reply(raw);
    if (reply->type == REDIS_REPLY_ERROR) {
        throw BackendUnavailable("Redis " + args.front() + ": " + replyText(reply.get()));
    }
    return reply;
}

RedisClient::ReplyPtr RedisClient::readReplyLocked() {
    void* raw = nullptr;
    if (redisGetReply(context_.get(), &raw) != REDIS_OK || !raw) {
        throw connectionErrorLocked("read");
    }
    return ReplyPtr(static_cast<redisReply*>(raw));
}

BackendUnavailable RedisClient::connectionErrorLocked(const std::string& operation) {
    std::string message = "Redis " + operation + ": ";
    message += (context_ && context_->err) ? context_->errstr : "соединение потеряно";
    // Контекст после ошибки ввода-вывода непригоден, переподключимся при следующей команде
    context_.reset();
    return BackendUnavailable(message);
}

} // namespace cache
} // namespace core
} // namespace tiercache
