#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/redis/GenericRedisCache.hpp"

using namespace cachekit::core::cache;

// Двухуровневый кэш без доступного Redis: L2 отказывает, L1 продолжает обслуживать
namespace {

std::shared_ptr<remote::RedisConnectionPool> unreachablePool() {
    RedisEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = 1;
    return std::make_shared<remote::RedisConnectionPool>(endpoint, std::nullopt, 2, std::chrono::seconds(1));
}

CacheConfig offlineConfig() {
    auto config = CacheConfig::forStrategy(CacheStrategy::Balanced);
    config.remoteUrl = "redis://127.0.0.1:1";
    config.compressionThresholdBytes = 1024;
    config.connectionTimeoutSeconds = 1;
    return config;
}

size_t remoteErrors(const GenericRedisCache& cache) {
    return cache.getStats()["remote_errors"].get<size_t>();
}

} // namespace

void testMemoryTierServesWhenRemoteDown() {
    std::cout << "Testing GenericRedisCache with unreachable Redis...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    GenericRedisCache cache(unreachablePool(), offlineConfig(), monitor);
    assert(cache.cacheType() == "redis");
    assert(!cache.ping());

    assert(!cache.setString("user:1", "profile"));
    std::string value;
    assert(cache.getString("user:1", value) && value == "profile");
    assert(cache.getStats()["memory_hits"].get<size_t>() == 1);

    const size_t errorsBefore = remoteErrors(cache);
    cache.memoryTier().clear();
    assert(!cache.getString("user:1", value));
    assert(remoteErrors(cache) == errorsBefore + 1);
    assert(cache.getStats()["misses"].get<size_t>() == 1);

    auto stats = monitor->getStats();
    assert(stats["failed_cache_operations"].get<size_t>() >= 2);
    assert(stats["cache_hits"].get<size_t>() == 1);
    assert(stats["cache_misses"].get<size_t>() == 1);

    // Сжатие выполняется до записи в L2, даже если запись не удалась
    const std::string large(8192, 'z');
    assert(!cache.setString("large", large));
    assert(cache.getStats()["compression"]["compressed_writes"].get<size_t>() == 1);
    assert(cache.getString("large", value) && value == large);

    cache.close();
    assert(cache.isClosed());
    assert(cache.pool()->closed());
    std::cout << "[OK] GenericRedisCache unreachable Redis test\n";
}

void testCallbacks() {
    std::cout << "Testing GenericRedisCache callbacks...\n";
    GenericRedisCache cache(unreachablePool(), offlineConfig());
    std::vector<std::string> events;
    for (const char* event : {"get_success", "get_miss", "set_success", "set_failure", "delete_success"}) {
        cache.registerCallback(event, [&events](const std::string& name, const std::string& key) {
            events.push_back(name + ":" + key);
        });
    }

    cache.setString("k", "v");
    std::string value;
    cache.getString("k", value);
    cache.getString("absent", value);
    cache.remove("k");

    assert(events.size() == 3);
    assert(events[0] == "set_failure:k");
    assert(events[1] == "get_success:k");
    assert(events[2] == "get_miss:absent");

    bool thrown = false;
    try {
        cache.registerCallback("get_hit", [](const std::string&, const std::string&) {});
    } catch (const ValidationError& e) {
        thrown = e.field() == "event";
    }
    assert(thrown);

    thrown = false;
    try {
        cache.registerCallback("get_miss", GenericRedisCache::Callback());
    } catch (const ValidationError& e) {
        thrown = e.field() == "callback";
    }
    assert(thrown);
    std::cout << "[OK] GenericRedisCache callbacks test\n";
}

void testExistsRecorded() {
    std::cout << "Testing GenericRedisCache exists metrics...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    GenericRedisCache cache(unreachablePool(), offlineConfig(), monitor);
    cache.setString("local", "v");
    const size_t errorsBefore = remoteErrors(cache);

    assert(cache.exists("local"));
    assert(!cache.exists("remote-only"));
    assert(remoteErrors(cache) == errorsBefore + 1);

    auto stats = monitor->getStats();
    assert(stats["cache_operations"]["by_operation_type"]["exists"]["count"].get<size_t>() == 2);
    // Set и exists для remote-only завершились ошибкой L2
    assert(stats["failed_cache_operations"].get<size_t>() == 2);
    std::cout << "[OK] GenericRedisCache exists metrics test\n";
}

void testEncryptionConfigured() {
    std::cout << "Testing GenericRedisCache value encryption...\n";
    auto config = offlineConfig();
    cachekit::core::security::SecurityConfig security;
    security.environment = cachekit::core::security::SecurityEnvironment::Testing;
    security.encryptionKey = ValueCodec::generateEncryptionKey();
    config.securityConfig = security;

    GenericRedisCache cache(unreachablePool(), config);
    assert(cache.codec().encryptionEnabled());
    cache.setString("secret", "value");
    cache.setString("other", "value");
    auto stats = cache.getStats();
    assert(stats["encryption"]["enabled"].get<bool>());
    assert(stats["encryption"]["algorithm"] == "AES-256-GCM");
    assert(stats["encryption"]["encrypted_writes"].get<size_t>() == 2);

    GenericRedisCache plain(unreachablePool(), offlineConfig());
    assert(!plain.getStats()["encryption"]["enabled"].get<bool>());

    config.securityConfig->encryptionKey = "too-short";
    bool thrown = false;
    try {
        GenericRedisCache broken(unreachablePool(), config);
    } catch (const ConfigurationError& e) {
        thrown = !e.issues().empty();
    }
    assert(thrown);
    std::cout << "[OK] GenericRedisCache value encryption test\n";
}

int main() {
    try {
        testMemoryTierServesWhenRemoteDown();
        testCallbacks();
        testExistsRecorded();
        testEncryptionConfigured();
        std::cout << "All GenericRedisCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
