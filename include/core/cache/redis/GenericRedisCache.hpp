#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/base/MemoryCache.hpp"
#include "core/cache/compression/ValueCodec.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"
#include "core/cache/remote/RedisConnectionPool.hpp"

namespace cachekit {
namespace core {
namespace cache {

// GenericRedisCache: двухуровневый кэш, L1 в памяти + L2 Redis (сжатие, промоушен)
// Сбой L2 не бросает исключений: чтение = промах, запись = false + лог
class GenericRedisCache : public ICache {
public:
    // get_success | get_miss | set_success | set_failure | delete_success
    using Callback = std::function<void(const std::string& event, const std::string& key)>;

    GenericRedisCache(std::shared_ptr<remote::RedisConnectionPool> pool, const CacheConfig& config,
                      std::shared_ptr<IPerformanceMonitor> monitor = nullMonitor(), bool ownsPool = true);
    ~GenericRedisCache() override;

    bool get(const std::string& key, Bytes& value) override;
    bool set(const std::string& key, const Bytes& value, int ttlSeconds = 0) override; // true = записано в L2
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    size_t invalidatePattern(const std::string& pattern, const std::string& operationContext = {}) override;
    bool ping() override;
    void close() override;
    bool isClosed() const override;

    size_t size() const override;
    nlohmann::json getStats() const override;
    MemoryUsageMeasurement memoryUsage() const override;
    std::string cacheType() const override { return "redis"; }

    void registerCallback(const std::string& event, Callback callback); // ValidationError для неизвестного события
    std::optional<size_t> remoteMemoryBytes() const; // INFO memory -> used_memory
    security::ConnectionSecurityInfo securityInfo() const;
    std::shared_ptr<remote::RedisConnectionPool> pool() const { return pool_; }
    MemoryCache& memoryTier() { return memory_; }
    const ValueCodec& codec() const { return codec_; }

private:
    void fireCallbacks(const std::string& event, const std::string& key);
    void recordRemoteError(const std::string& operation, const std::string& key, const std::exception& e);
    std::vector<std::string> scanKeys(const std::string& pattern);

    std::shared_ptr<remote::RedisConnectionPool> pool_;
    CacheConfig config_;
    std::shared_ptr<IPerformanceMonitor> monitor_;
    MemoryCache memory_;
    ValueCodec codec_;
    bool ownsPool_;
    std::atomic<bool> closed_{false};
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> memoryHits_{0};
    std::atomic<size_t> remoteHits_{0};
    mutable std::atomic<size_t> remoteErrors_{0};
    std::atomic<size_t> compressedWrites_{0};
    std::atomic<size_t> bytesSaved_{0};
    std::atomic<size_t> encryptedWrites_{0};
    std::mutex callbacksMutex_;
    std::map<std::string, std::vector<Callback>> callbacks_;
};

} // namespace cache
} // namespace core
} // namespace cachekit
