#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/remote/RedisConnection.hpp"

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

class RedisConnectionPool;

// PooledConnection: RAII-аренда соединения, возвращается в пул в деструкторе
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;
    ~PooledConnection();

    bool valid() const { return conn_ != nullptr; }
    RedisConnection& get() { return *conn_; }
    RedisConnection* operator->() { return conn_.get(); }

private:
    friend class RedisConnectionPool;
    PooledConnection(RedisConnectionPool* pool, std::unique_ptr<RedisConnection> conn)
        : pool_(pool), conn_(std::move(conn)) {}
    void release();

    RedisConnectionPool* pool_ = nullptr;
    std::unique_ptr<RedisConnection> conn_;
};

struct PoolStats {
    size_t maxSize = 0;
    size_t open = 0;            // idle + inUse
    size_t idle = 0;
    size_t created = 0;
    size_t discarded = 0;       // Закрыты после сетевой ошибки
    size_t acquireTimeouts = 0;
    size_t connectRetries = 0;  // Повторные попытки первого подключения
    bool closed = false;
    nlohmann::json toJson() const {
        return {{"max_size", maxSize}, {"open", open}, {"idle", idle}, {"in_use", open - idle},
                {"created", created}, {"discarded", discarded}, {"acquire_timeouts", acquireTimeouts},
                {"connect_retries", connectRetries}, {"closed", closed}};
    }
};

// RedisConnectionPool: ограниченный пул соединений (maxConnections), потокобезопасный.
// Пока ни одно соединение не установлено, подключение повторяется до SecurityConfig::maxRetries раз
// с паузой retryDelaySeconds * 2^n; после первого успеха сбой подключения сразу идёт вызывающему
class RedisConnectionPool {
public:
    RedisConnectionPool(RedisEndpoint endpoint, std::optional<security::SecurityConfig> security,
                        size_t maxSize, std::chrono::seconds timeout);
    ~RedisConnectionPool();
    RedisConnectionPool(const RedisConnectionPool&) = delete;
    RedisConnectionPool& operator=(const RedisConnectionPool&) = delete;

    // Бросает InfrastructureError (пул закрыт, таймаут ожидания, сбой подключения)
    PooledConnection acquire();
    RespValue execute(const std::vector<std::string>& args); // acquire + command
    size_t closeAll(); // Закрывает свободные соединения, занятые закрываются при возврате

    bool closed() const;
    PoolStats stats() const;
    security::ConnectionSecurityInfo lastSecurityInfo() const; // Последнего установленного соединения
    const RedisEndpoint& endpoint() const { return endpoint_; }
    std::string name() const; // host:port/db
    std::chrono::seconds timeout() const { return timeout_; }

private:
    friend class PooledConnection;
    void release(std::unique_ptr<RedisConnection> conn);
    std::unique_ptr<RedisConnection> connectWithRetry(bool allowRetry);

    RedisEndpoint endpoint_;
    std::optional<security::SecurityConfig> security_;
    size_t maxSize_;
    std::chrono::seconds timeout_;
    std::vector<std::unique_ptr<RedisConnection>> idle_;
    size_t open_ = 0;
    size_t created_ = 0;
    size_t discarded_ = 0;
    size_t acquireTimeouts_ = 0;
    size_t connectRetries_ = 0;
    bool closed_ = false;
    security::ConnectionSecurityInfo lastSecurityInfo_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
