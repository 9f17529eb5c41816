#include "core/cache/base/MemoryCache.hpp"
#include "core/cache/CacheLogger.hpp"
#include <chrono>

namespace cachekit {
namespace core {
namespace cache {

namespace {
double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}
}

MemoryCache::MemoryCache(size_t maxEntries, int defaultTtlSeconds, std::shared_ptr<IPerformanceMonitor> monitor)
    : store_(maxEntries, static_cast<size_t>(std::max(defaultTtlSeconds, 0))),
      defaultTtl_(defaultTtlSeconds),
      monitor_(monitor ? std::move(monitor) : nullMonitor()) {
    store_.setWeightFunction([](const Bytes& value) { return value.size(); });
    cacheLogger()->info("MemoryCache: создан maxEntries={}, defaultTTL={}s", maxEntries, defaultTtlSeconds);
}

MemoryCache::~MemoryCache() = default;

bool MemoryCache::get(const std::string& key, Bytes& value) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), false, false, 0, "memory");
        return false;
    }
    auto found = store_.get(key);
    if (found) {
        value = std::move(*found);
    }
    monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), true, found.has_value(),
                                   found ? value.size() : 0, "memory");
    return found.has_value();
}

bool MemoryCache::set(const std::string& key, const Bytes& value, int ttlSeconds) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        monitor_->recordCacheOperation(MeasurementCategory::Set, secondsSince(start), false, std::nullopt, value.size(), "memory");
        return false;
    }
    const int ttl = ttlSeconds > 0 ? ttlSeconds : defaultTtl_;
    store_.put(key, value, static_cast<size_t>(std::max(ttl, 0)));
    monitor_->recordCacheOperation(MeasurementCategory::Set, secondsSince(start), true, std::nullopt, value.size(), "memory");
    return true;
}

bool MemoryCache::remove(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    const bool removed = !closed_ && store_.remove(key);
    monitor_->recordCacheOperation(MeasurementCategory::Delete, secondsSince(start), !closed_, std::nullopt, 0, "memory");
    return removed;
}

bool MemoryCache::exists(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    const bool found = !closed_ && store_.contains(key);
    monitor_->recordCacheOperation(MeasurementCategory::Exists, secondsSince(start), !closed_, std::nullopt, 0, "memory",
                                   {{"found", found}});
    return found;
}

size_t MemoryCache::invalidatePattern(const std::string& pattern, const std::string& operationContext) {
    validatePattern(pattern);
    const auto start = std::chrono::steady_clock::now();
    const size_t removed = store_.removeIf([&pattern](const std::string& key) { return globMatch(pattern, key); });
    monitor_->recordInvalidation(pattern, removed, secondsSince(start), "manual", operationContext);
    cacheLogger()->info("MemoryCache: инвалидировано {} ключей по шаблону '{}'", removed, pattern);
    return removed;
}

bool MemoryCache::ping() {
    return !closed_;
}

void MemoryCache::close() {
    if (closed_.exchange(true)) {
        return;
    }
    store_.clear();
    cacheLogger()->info("MemoryCache: закрыт");
}

bool MemoryCache::isClosed() const {
    return closed_;
}

size_t MemoryCache::size() const {
    return store_.size();
}

std::vector<std::string> MemoryCache::keys() const {
    return store_.keys();
}

void MemoryCache::clear() {
    store_.clear();
}

nlohmann::json MemoryCache::getStats() const {
    const auto s = store_.stats();
    CacheMetrics metrics;
    metrics.memoryEntries = s.entries;
    metrics.memoryCapacity = s.capacity;
    metrics.memoryBytes = s.totalWeight;
    metrics.hits = s.hits;
    metrics.memoryHits = s.hits;
    metrics.misses = s.misses;
    metrics.evictions = s.evictions;
    metrics.lastUpdate = MetricsClock::now();
    auto j = metrics.toJson();
    j["cache_type"] = cacheType();
    j["closed"] = isClosed();
    j["expirations"] = s.expirations;
    j["default_ttl"] = defaultTtl_;
    return j;
}

MemoryUsageMeasurement MemoryCache::memoryUsage() const {
    const auto s = store_.stats();
    MemoryUsageMeasurement m;
    m.memoryCacheSizeBytes = s.totalWeight;
    m.memoryCacheEntryCount = s.entries;
    m.memoryCacheCapacity = s.capacity;
    m.totalCacheSizeBytes = s.totalWeight;
    m.cacheEntryCount = s.entries;
    return m;
}

} // namespace cache
} // namespace core
} // namespace cachekit
