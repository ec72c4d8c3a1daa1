#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace core {
namespace cache {

using KeyPart = nlohmann::json;                          // Компонент ключа (строка, число, bool, объект)
using PositionalKeyParts = std::vector<KeyPart>;         // Позиционные компоненты, порядок важен
using NamedKeyParts = std::map<std::string, KeyPart>;    // Именованные компоненты, всегда отсортированы

constexpr char kKeyDelimiter = ':';
constexpr size_t kDefaultKeyHashThreshold = 250;

// Экранирует '%', ':' и '=' (%25, %3A, %3D), чтобы компонент не совпал со структурой ключа
std::string escapeKeyPart(const std::string& text);

// Строковое представление компонента: строки как есть, прочее: компактный JSON; всё экранировано
std::string formatKeyPart(const KeyPart& part);

// SHA-256 ключа в hex (64 символа)
std::string hashKey(const std::string& key);

// prefix:pos1:pos2:name1=v1:name2=v2; длиннее threshold: заменяется на hashKey()
std::string buildCacheKey(const std::string& prefix,
                          const PositionalKeyParts& positional,
                          const NamedKeyParts& named = {},
                          size_t threshold = kDefaultKeyHashThreshold);

} // namespace cache
} // namespace core
} // namespace tiercache
