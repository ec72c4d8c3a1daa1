#include <cassert>
#include <iostream>
#include <string>
#include "tiercache/core/cache/manager/CacheKey.hpp"

using namespace tiercache::core::cache;

void testKeyFormat() {
    std::cout << "Testing cache key format...\n";

    assert(buildCacheKey("user", {42}) == "user:42");
    assert(buildCacheKey("jobs", {"abc-1"}) == "jobs:abc-1");
    assert(buildCacheKey("applications", {7}, {{"page", 2}, {"limit", 20}}) == "applications:7:limit=20:page=2");
    assert(buildCacheKey("stats", {}) == "stats");
    assert(buildCacheKey("flags", {true, nullptr}) == "flags:true:null");

    std::cout << "[OK] cache key format test\n";
}

void testKeyDeterminism() {
    std::cout << "Testing cache key determinism...\n";

    // Порядок именованных компонентов не влияет на ключ
    NamedKeyParts first;
    first["status"] = "active";
    first["limit"] = 10;
    NamedKeyParts second;
    second["limit"] = 10;
    second["status"] = "active";
    assert(buildCacheKey("recommendations", {5}, first) == buildCacheKey("recommendations", {5}, second));

    // Порядок позиционных важен
    assert(buildCacheKey("pair", {1, 2}) != buildCacheKey("pair", {2, 1}));

    // Вложенные объекты: компактный JSON с отсортированными полями
    KeyPart filter = {{"b", 1}, {"a", 2}};
    assert(formatKeyPart(filter) == R"({"a"%3A2,"b"%3A1})");

    std::cout << "[OK] cache key determinism test\n";
}

void testKeyPartEscaping() {
    std::cout << "Testing cache key part escaping...\n";

    // Идентификатор с разделителями не совпадает со структурным ключом
    auto structured = buildCacheKey("apps", {7}, {{"page", 1}, {"limit", 20}});
    auto crafted = buildCacheKey("apps", {"7:limit=20:page=1"});
    assert(structured == "apps:7:limit=20:page=1");
    assert(crafted == "apps:7%3Alimit%3D20%3Apage%3D1");
    assert(crafted != structured);

    // Два позиционных компонента против одного с двоеточием
    assert(buildCacheKey("pair", {"a", "b"}) != buildCacheKey("pair", {"a:b"}));

    // Сам '%' тоже экранируется, иначе "%3A" совпал бы с ":"
    assert(buildCacheKey("jobs", {"%3A"}) == "jobs:%253A");
    assert(buildCacheKey("jobs", {"%3A"}) != buildCacheKey("jobs", {":"}));

    // Обычные идентификаторы не меняются
    assert(buildCacheKey("jobs", {"abc-1_x.y"}) == "jobs:abc-1_x.y");

    std::cout << "[OK] cache key part escaping test\n";
}

void testOversizedKeyIsHashed() {
    std::cout << "Testing oversized key hashing...\n";

    std::string longId(300, 'x');
    auto key = buildCacheKey("user", {longId});
    assert(key.size() == 64);
    assert(key.find_first_not_of("0123456789abcdef") == std::string::npos);
    assert(key == hashKey("user:" + longId));
    assert(key == buildCacheKey("user", {longId}));
    assert(key != buildCacheKey("user", {longId + "y"}));

    // Ключ ровно на пороге не хешируется
    std::string boundary = "p:" + std::string(248, 'z');
    assert(buildCacheKey("p", {std::string(248, 'z')}) == boundary);

    // Порог настраивается
    assert(buildCacheKey("user", {42}, {}, 5).size() == 64);

    // Известный вектор SHA-256
    assert(hashKey("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::cout << "[OK] oversized key hashing test\n";
}

int main() {
    try {
        testKeyFormat();
        testKeyDeterminism();
        testKeyPartEscaping();
        testOversizedKeyIsHashed();
        std::cout << "All CacheKey tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheKey test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
