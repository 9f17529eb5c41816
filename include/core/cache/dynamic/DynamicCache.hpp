#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/cache/CacheLogger.hpp"

namespace cachekit {
namespace core {
namespace cache {

constexpr size_t MIN_CLEANUP_INTERVAL = 1;
constexpr size_t MAX_CLEANUP_INTERVAL = 60;

// DynamicCache: потокобезопасный LRU с TTL от момента записи и фоновой очисткой
// Вытесняется запись, к которой дольше всего не обращались (чтение или запись)
template<typename Key, typename Value>
class DynamicCache {
public:
    using Clock = std::chrono::steady_clock;
    using EvictionCallback = std::function<void(const Key&, const Value&)>;
    using WeightFunction = std::function<size_t(const Value&)>;

    struct Stats {
        size_t hits = 0;
        size_t misses = 0;
        size_t evictions = 0;
        size_t expirations = 0;
        size_t entries = 0;
        size_t capacity = 0;
        size_t totalWeight = 0;
    };

    // cleanupIntervalSeconds = 0 отключает фоновый поток
    explicit DynamicCache(size_t capacity, size_t defaultTtlSeconds = 0, size_t cleanupIntervalSeconds = 5);
    ~DynamicCache();
    DynamicCache(const DynamicCache&) = delete;
    DynamicCache& operator=(const DynamicCache&) = delete;

    std::optional<Value> get(const Key& key); // Получить (обновляет LRU)
    bool contains(const Key& key) const; // Есть и не истекла
    void put(const Key& key, const Value& value); // Сохранить с TTL по умолчанию
    void put(const Key& key, const Value& value, size_t ttlSeconds); // 0 = бессрочно
    bool remove(const Key& key); // Удалить
    size_t removeIf(const std::function<bool(const Key&)>& predicate); // Удалить по условию
    void clear(); // Очистить
    std::vector<Key> keys() const; // Ключи в порядке LRU (свежие первыми)
    size_t size() const;
    size_t capacity() const;
    void resize(size_t newCapacity); // Изменить ёмкость
    size_t totalWeight() const; // Сумма весов записей
    void setEvictionCallback(EvictionCallback cb);
    void setWeightFunction(WeightFunction fn);
    size_t cleanupExpired(); // Синхронная очистка истёкших
    Stats stats() const;

private:
    struct Entry {
        Value data;
        Clock::time_point createdAt;
        size_t ttlSeconds;
        size_t weight;
        typename std::list<Key>::iterator lruPos;
    };

    bool isExpired(const Entry& entry, Clock::time_point now) const;
    void eraseLocked(typename std::unordered_map<Key, Entry>::iterator it, bool notify);
    void evictLRULocked();
    void cleanupThreadFunc();
    void stopCleanupThread();

    size_t capacity_;
    size_t defaultTtl_;
    size_t cleanupIntervalSeconds_;
    std::unordered_map<Key, Entry> cache_;
    std::list<Key> lruList_;
    size_t totalWeight_ = 0;
    mutable std::shared_mutex mutex_;
    EvictionCallback evictionCallback_;
    WeightFunction weightFunction_;

    std::thread cleanupThread_;
    std::mutex cleanupMutex_; // Только для ожидания на cleanupCv_
    std::condition_variable cleanupCv_;
    bool stopCleanup_ = false;

    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> evictions_{0};
    std::atomic<size_t> expirations_{0};
};

template<typename Key, typename Value>
DynamicCache<Key, Value>::DynamicCache(size_t capacity, size_t defaultTtlSeconds, size_t cleanupIntervalSeconds)
    : capacity_(std::max<size_t>(capacity, 1)), defaultTtl_(defaultTtlSeconds),
      cleanupIntervalSeconds_(cleanupIntervalSeconds == 0 ? 0
          : std::clamp(cleanupIntervalSeconds, MIN_CLEANUP_INTERVAL, MAX_CLEANUP_INTERVAL)) {
    cache_.reserve(capacity_);
    if (cleanupIntervalSeconds_ > 0) {
        cleanupThread_ = std::thread([this] { cleanupThreadFunc(); });
    }
    cacheLogger()->debug("DynamicCache: создан capacity={}, defaultTTL={}, cleanupInterval={}s",
                         capacity_, defaultTtl_, cleanupIntervalSeconds_);
}

template<typename Key, typename Value>
DynamicCache<Key, Value>::~DynamicCache() {
    stopCleanupThread();
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::isExpired(const Entry& entry, Clock::time_point now) const {
    return entry.ttlSeconds > 0 && now - entry.createdAt >= std::chrono::seconds(entry.ttlSeconds);
}

template<typename Key, typename Value>
std::optional<Value> DynamicCache<Key, Value>::get(const Key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (isExpired(it->second, Clock::now())) {
        eraseLocked(it, false);
        expirations_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    // TTL не продлевается чтением, меняется только позиция в LRU
    lruList_.splice(lruList_.begin(), lruList_, it->second.lruPos);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.data;
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::contains(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    return it != cache_.end() && !isExpired(it->second, Clock::now());
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::put(const Key& key, const Value& value) {
    put(key, value, defaultTtl_);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::put(const Key& key, const Value& value, size_t ttlSeconds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const size_t weight = weightFunction_ ? weightFunction_(value) : 0;
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        totalWeight_ -= it->second.weight;
        it->second.data = value;
        it->second.createdAt = Clock::now();
        it->second.ttlSeconds = ttlSeconds;
        it->second.weight = weight;
        totalWeight_ += weight;
        lruList_.splice(lruList_.begin(), lruList_, it->second.lruPos);
        return;
    }
    while (cache_.size() >= capacity_ && !lruList_.empty()) {
        evictLRULocked();
    }
    lruList_.push_front(key);
    cache_.emplace(key, Entry{value, Clock::now(), ttlSeconds, weight, lruList_.begin()});
    totalWeight_ += weight;
}

template<typename Key, typename Value>
bool DynamicCache<Key, Value>::remove(const Key& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    const bool live = !isExpired(it->second, Clock::now());
    eraseLocked(it, false);
    return live;
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::removeIf(const std::function<bool(const Key&)>& predicate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (predicate(it->first)) {
            auto next = std::next(it);
            eraseLocked(it, false);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    totalWeight_ = 0;
}

template<typename Key, typename Value>
std::vector<Key> DynamicCache<Key, Value>::keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto now = Clock::now();
    std::vector<Key> result;
    result.reserve(lruList_.size());
    for (const auto& key : lruList_) {
        auto it = cache_.find(key);
        if (it != cache_.end() && !isExpired(it->second, now)) {
            result.push_back(key);
        }
    }
    return result;
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::capacity() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return capacity_;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::resize(size_t newCapacity) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    capacity_ = std::max<size_t>(newCapacity, 1);
    while (cache_.size() > capacity_ && !lruList_.empty()) {
        evictLRULocked();
    }
    cacheLogger()->debug("DynamicCache: ёмкость изменена на {} записей", capacity_);
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::totalWeight() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalWeight_;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::setEvictionCallback(EvictionCallback cb) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    evictionCallback_ = std::move(cb);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::setWeightFunction(WeightFunction fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    weightFunction_ = std::move(fn);
    totalWeight_ = 0;
    for (auto& [key, entry] : cache_) {
        entry.weight = weightFunction_ ? weightFunction_(entry.data) : 0;
        totalWeight_ += entry.weight;
    }
}

template<typename Key, typename Value>
size_t DynamicCache<Key, Value>::cleanupExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto now = Clock::now();
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (isExpired(it->second, now)) {
            auto next = std::next(it);
            eraseLocked(it, true);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    expirations_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

template<typename Key, typename Value>
typename DynamicCache<Key, Value>::Stats DynamicCache<Key, Value>::stats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.expirations = expirations_.load(std::memory_order_relaxed);
    s.entries = cache_.size();
    s.capacity = capacity_;
    s.totalWeight = totalWeight_;
    return s;
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::eraseLocked(typename std::unordered_map<Key, Entry>::iterator it, bool notify) {
    if (notify && evictionCallback_) {
        evictionCallback_(it->first, it->second.data);
    }
    totalWeight_ -= it->second.weight;
    lruList_.erase(it->second.lruPos);
    cache_.erase(it);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::evictLRULocked() {
    auto it = cache_.find(lruList_.back());
    if (it == cache_.end()) {
        lruList_.pop_back();
        return;
    }
    eraseLocked(it, true);
    evictions_.fetch_add(1, std::memory_order_relaxed);
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::cleanupThreadFunc() {
    std::unique_lock<std::mutex> lock(cleanupMutex_);
    while (!stopCleanup_) {
        cleanupCv_.wait_for(lock, std::chrono::seconds(cleanupIntervalSeconds_), [this] { return stopCleanup_; });
        if (stopCleanup_) {
            break;
        }
        lock.unlock();
        auto removed = cleanupExpired();
        if (removed > 0) {
            cacheLogger()->debug("DynamicCache: удалено {} истёкших записей", removed);
        }
        lock.lock();
    }
}

template<typename Key, typename Value>
void DynamicCache<Key, Value>::stopCleanupThread() {
    {
        std::lock_guard<std::mutex> lock(cleanupMutex_);
        stopCleanup_ = true;
    }
    cleanupCv_.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
}

using DefaultDynamicCache = DynamicCache<std::string, std::vector<uint8_t>>;

} // namespace cache
} // namespace core
} // namespace cachekit
