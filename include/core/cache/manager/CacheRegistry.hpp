#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/manager/CacheFactory.hpp"
#include "core/cache/remote/RedisConnectionPool.hpp"

namespace cachekit {
namespace core {
namespace cache {

// Итог прохода очистки реестра
struct CleanupStats {
    size_t totalEntries = 0;   // До очистки
    size_t cleaned = 0;        // Удалено записей
    size_t remaining = 0;
    size_t deadReferences = 0; // Кэш уже уничтожен владельцем
    size_t disconnected = 0;   // Закрыто кэшей и пулов
    std::vector<std::string> errors;
    double durationMs = 0.0;
    nlohmann::json toJson() const {
        return {{"total_entries", totalEntries}, {"cleaned", cleaned}, {"remaining", remaining},
                {"dead_references", deadReferences}, {"disconnected", disconnected},
                {"errors", errors}, {"duration_ms", durationMs}};
    }
};

// CacheRegistry: реестр живых кэшей хост-приложения (передаётся явно, не singleton)
// Кэши с одинаковой конфигурацией разделяют экземпляр, с одинаковым endpoint: пул соединений
class CacheRegistry {
public:
    explicit CacheRegistry(std::shared_ptr<CacheFactory> factory);
    ~CacheRegistry();
    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    // Сборка кэша (с сетевой проверкой) идёт вне блокировки; исключения CacheFactory
    std::shared_ptr<ICache> getOrCreate(const CacheConfig& config);
    void registerCache(const std::string& key, std::shared_ptr<ICache> cache); // Кэш извне
    std::shared_ptr<ICache> find(const std::string& key) const; // nullptr если нет или мёртв
    size_t size() const;
    std::vector<std::string> keys() const;
    nlohmann::json status() const;

    CleanupStats cleanup();  // Удаляет закрытые/мёртвые записи и неиспользуемые пулы
    CleanupStats shutdown(); // Закрывает всё; повторный вызов безопасен

    static std::string configKey(const CacheConfig& config); // SHA-256 канонической конфигурации
    static std::string poolKey(const CacheConfig& config);

private:
    struct Entry {
        std::weak_ptr<ICache> cache;
        std::string poolKey;   // Пусто для кэша без пула
        std::chrono::steady_clock::time_point createdAt;
    };
    size_t closeUnusedPoolsLocked(CleanupStats& stats);
    std::shared_ptr<ICache> liveEntryLocked(const std::string& key); // Удаляет мёртвую запись
    bool detachPoolLocked(const std::string& pkey, const std::shared_ptr<remote::RedisConnectionPool>& pool);

    std::shared_ptr<CacheFactory> factory_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::shared_ptr<remote::RedisConnectionPool>> pools_;
    mutable std::mutex mutex_;
    std::mutex cleanupMutex_; // Одна очистка одновременно
};

} // namespace cache
} // namespace core
} // namespace cachekit
