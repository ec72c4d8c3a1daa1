#include "tiercache/core/cache/manager/CacheKey.hpp"
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace tiercache {
namespace core {
namespace cache {

std::string escapeKeyPart(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '%': escaped += "%25"; break;
            case kKeyDelimiter: escaped += "%3A"; break;
            case '=': escaped += "%3D"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string formatKeyPart(const KeyPart& part) {
    if (part.is_string()) {
        return escapeKeyPart(part.get<std::string>());
    }
    // replace: невалидный UTF-8 во вложенных строках не должен ронять построение ключа
    return escapeKeyPart(part.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string hashKey(const std::string& key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string buildCacheKey(const std::string& prefix,
                          const PositionalKeyParts& positional,
                          const NamedKeyParts& named,
                          size_t threshold) {
    std::string key = prefix;
    for (const auto& part : positional) {
        key += kKeyDelimiter;
        key += formatKeyPart(part);
    }
    // std::map уже упорядочен по имени
    for (const auto& [name, part] : named) {
        key += kKeyDelimiter;
        key += escapeKeyPart(name);
        key += '=';
        key += formatKeyPart(part);
    }
    if (key.size() > threshold) {
        return hashKey(key);
    }
    return key;
}

} // namespace cache
} // namespace core
} // namespace tiercache
