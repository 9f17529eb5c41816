#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/key/CacheKeyGenerator.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"

namespace cachekit {
namespace core {
namespace cache {

// AIResponseCache: кэш ответов AI-операций поверх любого ICache
// (GenericRedisCache или MemoryCache после деградации): ключи от CacheKeyGenerator,
// TTL по операции, счётчики попаданий по операциям
class AIResponseCache : public ICache {
public:
    AIResponseCache(std::shared_ptr<ICache> inner, CacheConfig config,
                    std::shared_ptr<IPerformanceMonitor> monitor = nullMonitor());
    ~AIResponseCache() override;

    // ValidationError: пустой текст/операция, текст длиннее maxTextLength, options/response не объект
    bool cacheResponse(const std::string& text, const std::string& operation, const nlohmann::json& options,
                       const nlohmann::json& response, const std::optional<std::string>& question = std::nullopt);
    std::optional<nlohmann::json> getCachedResponse(const std::string& text, const std::string& operation,
                                                    const nlohmann::json& options = nlohmann::json::object(),
                                                    const std::optional<std::string>& question = std::nullopt);
    size_t invalidateByOperation(const std::string& operation, const std::string& operationContext = {});
    size_t invalidateAll(const std::string& operationContext = {});
    nlohmann::json getAiPerformanceSummary() const;

    std::string buildKey(const std::string& text, const std::string& operation, const nlohmann::json& options,
                         const std::optional<std::string>& question = std::nullopt) const;
    const CacheKeyGenerator& keyGenerator() const { return keyGenerator_; }
    std::shared_ptr<ICache> inner() const { return inner_; }
    const CacheConfig& config() const { return config_; }

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
    std::string cacheType() const override; // ai_redis | ai_memory

private:
    struct OperationCounters {
        size_t hits = 0;
        size_t misses = 0;
        size_t sets = 0;
        size_t failedSets = 0;
        double totalGetSeconds = 0.0;
        size_t gets = 0;
    };
    void validateRequest(const std::string& text, const std::string& operation, const nlohmann::json& options) const;

    std::shared_ptr<ICache> inner_;
    CacheConfig config_;
    std::shared_ptr<IPerformanceMonitor> monitor_;
    CacheKeyGenerator keyGenerator_;
    std::map<std::string, OperationCounters> operations_;
    std::map<std::string, size_t> tierDistribution_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace cachekit
