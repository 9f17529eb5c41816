#include <cassert>
#include <iostream>
#include "core/cache/dynamic/DynamicCache.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <thread>

using cachekit::core::cache::DynamicCache;

void smokeTestDynamicCache() {
    std::cout << "Testing DynamicCache basic operations...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(4, 0, 0);
    cache.put("a", {1});
    cache.put("b", {2});
    cache.put("c", {3});
    cache.put("d", {4});
    assert(cache.size() == 4);

    // Обращение к "a" делает её свежей, вытесняется "b"
    assert(cache.get("a"));
    cache.put("e", {5});
    assert(cache.size() == 4);
    assert(cache.get("a"));
    assert(!cache.get("b"));

    auto v = cache.get("e");
    assert(v && (*v)[0] == 5);

    assert(cache.remove("e"));
    assert(!cache.remove("e"));
    assert(!cache.get("e"));

    auto stats = cache.stats();
    assert(stats.evictions == 1);
    assert(stats.capacity == 4);

    cache.clear();
    assert(cache.size() == 0);
    std::cout << "[OK] DynamicCache smoke test\n";
}

void stressTestDynamicCache() {
    std::cout << "Testing DynamicCache stress operations...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(128, 0, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                const auto key = std::to_string(t) + ":" + std::to_string(i);
                cache.put(key, {static_cast<uint8_t>(i % 256)});
                cache.get(key);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(cache.size() <= 128);

    for (const auto& key : cache.keys()) {
        cache.remove(key);
    }
    assert(cache.size() == 0);
    std::cout << "[OK] DynamicCache stress test\n";
}

void testDynamicCacheTTL() {
    std::cout << "Testing DynamicCache TTL functionality...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(10, 0, 0);
    size_t expiredCallbacks = 0;
    cache.setEvictionCallback([&expiredCallbacks](const std::string&, const std::vector<uint8_t>&) {
        ++expiredCallbacks;
    });
    cache.put("ttl_test", {42}, 1);
    cache.put("forever", {7});

    auto v = cache.get("ttl_test");
    assert(v && (*v)[0] == 42);

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    assert(!cache.contains("ttl_test"));
    assert(cache.cleanupExpired() == 1);
    assert(expiredCallbacks == 1);
    assert(!cache.get("ttl_test"));
    assert(cache.get("forever"));
    std::cout << "[OK] DynamicCache TTL test\n";
}

void testDynamicCacheWeightAndResize() {
    std::cout << "Testing DynamicCache weights and resize...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(10, 0, 0);
    cache.setWeightFunction([](const std::vector<uint8_t>& value) { return value.size(); });
    cache.put("small", std::vector<uint8_t>(10, 1));
    cache.put("large", std::vector<uint8_t>(100, 2));
    assert(cache.totalWeight() == 110);

    cache.put("small", std::vector<uint8_t>(20, 1));
    assert(cache.totalWeight() == 120);

    size_t removed = cache.removeIf([](const std::string& key) { return key == "large"; });
    assert(removed == 1);
    assert(cache.totalWeight() == 20);

    for (int i = 0; i < 9; ++i) {
        cache.put("k" + std::to_string(i), {1});
    }
    cache.resize(3);
    assert(cache.size() == 3);
    assert(cache.capacity() == 3);
    auto keys = cache.keys();
    assert(keys.front() == "k8");
    std::cout << "[OK] DynamicCache weight/resize test\n";
}

void testBackgroundCleanup() {
    std::cout << "Testing DynamicCache background cleanup...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(10, 1, 1);
    cache.put("short", {1});
    std::this_thread::sleep_for(std::chrono::milliseconds(2500));
    assert(cache.size() == 0);
    assert(cache.stats().expirations >= 1);
    std::cout << "[OK] DynamicCache background cleanup test\n";
}

int main() {
    try {
        smokeTestDynamicCache();
        stressTestDynamicCache();
        testDynamicCacheTTL();
        testDynamicCacheWeightAndResize();
        testBackgroundCleanup();
        std::cout << "All DynamicCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
