#include "core/cache/manager/CacheRegistry.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include "core/cache/key/CacheKeyGenerator.hpp"
#include <set>

namespace cachekit {
namespace core {
namespace cache {

namespace {

double millisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

bool usesRemoteTier(const ICache& cache) {
    return cache.cacheType().find("redis") != std::string::npos;
}

} // namespace

CacheRegistry::CacheRegistry(std::shared_ptr<CacheFactory> factory)
    : factory_(factory ? std::move(factory) : std::make_shared<CacheFactory>()) {}

CacheRegistry::~CacheRegistry() {
    shutdown();
}

std::string CacheRegistry::configKey(const CacheConfig& config) {
    return CacheKeyGenerator::sha256Hex(config.toJson().dump()).substr(0, 32);
}

std::string CacheRegistry::poolKey(const CacheConfig& config) {
    if (!config.remoteUrl) {
        return {};
    }
    const nlohmann::json identity = {
        {"url", *config.remoteUrl},
        {"security", config.securityConfig ? config.securityConfig->toJson() : nlohmann::json(nullptr)},
        {"max_connections", config.maxConnections},
        {"timeout", config.connectionTimeoutSeconds}
    };
    return CacheKeyGenerator::sha256Hex(identity.dump()).substr(0, 32);
}

std::shared_ptr<ICache> CacheRegistry::liveEntryLocked(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (auto existing = it->second.cache.lock(); existing && !existing->isClosed()) {
        return existing;
    }
    entries_.erase(it);
    return nullptr;
}

bool CacheRegistry::detachPoolLocked(const std::string& pkey,
                                     const std::shared_ptr<remote::RedisConnectionPool>& pool) {
    auto it = pools_.find(pkey);
    if (it == pools_.end() || it->second != pool) {
        return false;
    }
    // Ссылки держат только реестр и вызывающий: пул никем не подхвачен
    if (pool.use_count() > 2) {
        return false;
    }
    pools_.erase(it);
    return true;
}

std::shared_ptr<ICache> CacheRegistry::getOrCreate(const CacheConfig& config) {
    const std::string key = configKey(config);
    const std::string pkey = poolKey(config);
    std::shared_ptr<remote::RedisConnectionPool> pool;
    bool newPool = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto existing = liveEntryLocked(key)) {
            cacheLogger()->debug("CacheRegistry: используется существующий кэш {}", key);
            return existing;
        }
        if (!pkey.empty()) {
            auto poolIt = pools_.find(pkey);
            if (poolIt != pools_.end() && !poolIt->second->closed()) {
                pool = poolIt->second;
            } else {
                pool = CacheFactory::makePool(config);
                pools_[pkey] = pool;
                newPool = true;
            }
        }
    }

    // Сборка с пробным PING идёт без блокировки реестра
    std::shared_ptr<ICache> cache;
    try {
        cache = pool ? factory_->createCache(config, pool) : factory_->createCache(config);
    } catch (const CacheError&) {
        if (newPool) {
            bool detached = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                detached = detachPoolLocked(pkey, pool);
            }
            if (detached) {
                pool->closeAll();
            }
        }
        throw;
    }

    const bool remoteTier = usesRemoteTier(*cache);
    std::shared_ptr<ICache> winner;
    bool releasePool = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        winner = liveEntryLocked(key);
        if (!winner) {
            Entry entry;
            entry.cache = cache;
            entry.poolKey = remoteTier ? pkey : std::string();
            entry.createdAt = std::chrono::steady_clock::now();
            entries_[key] = std::move(entry);
            cacheLogger()->info("CacheRegistry: зарегистрирован кэш {} ({}), всего {}", key, cache->cacheType(),
                                entries_.size());
        }
        if (newPool && !remoteTier) {
            releasePool = detachPoolLocked(pkey, pool);
        }
    }
    if (releasePool) {
        cacheLogger()->info("CacheRegistry: пул {} не используется после перехода на память, закрыт", pool->name());
        pool->closeAll();
    }
    if (winner) {
        // Параллельный вызов успел первым; свой экземпляр закрываем
        cache->close();
        return winner;
    }
    return cache;
}

void CacheRegistry::registerCache(const std::string& key, std::shared_ptr<ICache> cache) {
    if (!cache) {
        throw ValidationError("CacheRegistry: попытка зарегистрировать пустой кэш", "cache");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && !it->second.cache.expired()) {
        cacheLogger()->warn("CacheRegistry: ключ '{}' уже занят, запись заменена", key);
    }
    Entry entry;
    entry.cache = cache;
    entry.createdAt = std::chrono::steady_clock::now();
    entries_[key] = std::move(entry);
}

std::shared_ptr<ICache> CacheRegistry::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : it->second.cache.lock();
}

size_t CacheRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> CacheRegistry::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        out.push_back(key);
    }
    return out;
}

nlohmann::json CacheRegistry::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json caches = nlohmann::json::array();
    const auto now = std::chrono::steady_clock::now();
    for (const auto& [key, entry] : entries_) {
        auto cache = entry.cache.lock();
        caches.push_back({
            {"key", key},
            {"alive", cache != nullptr},
            {"cache_type", cache ? cache->cacheType() : std::string("unknown")},
            {"closed", cache ? cache->isClosed() : true},
            {"age_seconds", std::chrono::duration_cast<std::chrono::seconds>(now - entry.createdAt).count()}
        });
    }
    nlohmann::json pools = nlohmann::json::object();
    for (const auto& [key, pool] : pools_) {
        pools[pool->name() + "#" + key.substr(0, 8)] = pool->stats().toJson();
    }
    return {{"caches", caches}, {"pools", pools}};
}

size_t CacheRegistry::closeUnusedPoolsLocked(CleanupStats& stats) {
    std::set<std::string> used;
    for (const auto& [key, entry] : entries_) {
        if (!entry.poolKey.empty()) {
            used.insert(entry.poolKey);
        }
    }
    size_t closed = 0;
    for (auto it = pools_.begin(); it != pools_.end();) {
        if (used.count(it->first) > 0) {
            ++it;
            continue;
        }
        try {
            it->second->closeAll();
            ++closed;
        } catch (const std::exception& e) {
            stats.errors.push_back("pool " + it->second->name() + ": " + e.what());
            cacheLogger()->error("CacheRegistry: ошибка закрытия пула {}: {}", it->second->name(), e.what());
        }
        it = pools_.erase(it);
    }
    return closed;
}

CleanupStats CacheRegistry::cleanup() {
    std::lock_guard<std::mutex> cleanupLock(cleanupMutex_);
    const auto start = std::chrono::steady_clock::now();
    CleanupStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.totalEntries = entries_.size();
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto cache = it->second.cache.lock();
            if (!cache) {
                ++stats.deadReferences;
            } else if (!cache->isClosed()) {
                ++it;
                continue;
            }
            ++stats.cleaned;
            it = entries_.erase(it);
        }
        stats.disconnected = closeUnusedPoolsLocked(stats);
        stats.remaining = entries_.size();
    }
    stats.durationMs = millisecondsSince(start);
    cacheLogger()->info("CacheRegistry: очистка завершена, удалено {}, осталось {}, закрыто пулов {} ({:.2f} мс)",
                        stats.cleaned, stats.remaining, stats.disconnected, stats.durationMs);
    return stats;
}

CleanupStats CacheRegistry::shutdown() {
    std::lock_guard<std::mutex> cleanupLock(cleanupMutex_);
    const auto start = std::chrono::steady_clock::now();
    CleanupStats stats;
    std::map<std::string, Entry> entries;
    std::map<std::string, std::shared_ptr<remote::RedisConnectionPool>> pools;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
        pools.swap(pools_);
    }
    stats.totalEntries = entries.size();
    for (auto& [key, entry] : entries) {
        auto cache = entry.cache.lock();
        if (!cache) {
            ++stats.deadReferences;
            continue;
        }
        try {
            if (!cache->isClosed()) {
                cache->close();
                ++stats.disconnected;
            }
        } catch (const std::exception& e) {
            stats.errors.push_back("cache " + key + ": " + e.what());
            cacheLogger()->error("CacheRegistry: ошибка закрытия кэша {}: {}", key, e.what());
        }
    }
    for (auto& [key, pool] : pools) {
        try {
            pool->closeAll();
            ++stats.disconnected;
        } catch (const std::exception& e) {
            stats.errors.push_back("pool " + pool->name() + ": " + e.what());
            cacheLogger()->error("CacheRegistry: ошибка закрытия пула {}: {}", pool->name(), e.what());
        }
    }
    stats.cleaned = entries.size();
    stats.remaining = 0;
    stats.durationMs = millisecondsSince(start);
    if (stats.totalEntries > 0 || !pools.empty()) {
        cacheLogger()->info("CacheRegistry: остановлен, закрыто {} (ошибок {}) за {:.2f} мс",
                            stats.disconnected, stats.errors.size(), stats.durationMs);
    }
    return stats;
}

} // namespace cache
} // namespace core
} // namespace cachekit
