#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/dynamic/DynamicCache.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"

namespace cachekit {
namespace core {
namespace cache {

// MemoryCache: кэш в памяти процесса (LRU + TTL), универсальный fallback
class MemoryCache : public ICache {
public:
    MemoryCache(size_t maxEntries, int defaultTtlSeconds,
                std::shared_ptr<IPerformanceMonitor> monitor = nullMonitor());
    ~MemoryCache() override;

    bool get(const std::string& key, Bytes& value) override;
    bool set(const std::string& key, const Bytes& value, int ttlSeconds = 0) override;
    bool remove(const std::string& key) override;
    bool exists(const std::string& key) override;
    size_t invalidatePattern(const std::string& pattern, const std::string& operationContext = {}) override;
    bool ping() override;
    void close() override;
    bool isClosed() const override;

    size_t size() const override;
    nlohmann::json getStats() const override;
    MemoryUsageMeasurement memoryUsage() const override;
    std::string cacheType() const override { return "memory"; }

    std::vector<std::string> keys() const; // Свежие первыми
    void clear();
    int defaultTtl() const { return defaultTtl_; }

private:
    DefaultDynamicCache store_;
    int defaultTtl_;
    std::shared_ptr<IPerformanceMonitor> monitor_;
    std::atomic<bool> closed_{false};
};

} // namespace cache
} // namespace core
} // namespace cachekit
