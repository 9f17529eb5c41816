#include "core/cache/remote/RedisConnectionPool.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <algorithm>
#include <cmath>
#include <thread>

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        other.pool_ = nullptr;
    }
    return *this;
}

PooledConnection::~PooledConnection() {
    release();
}

void PooledConnection::release() {
    if (pool_ && conn_) {
        pool_->release(std::move(conn_));
    }
    pool_ = nullptr;
}

RedisConnectionPool::RedisConnectionPool(RedisEndpoint endpoint, std::optional<security::SecurityConfig> security,
                                         size_t maxSize, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)),
      security_(std::move(security)),
      maxSize_(std::max<size_t>(maxSize, 1)),
      timeout_(timeout) {
    idle_.reserve(maxSize_);
    cacheLogger()->info("RedisConnectionPool: создан для {} (maxSize={}, timeout={}s)", name(), maxSize_, timeout_.count());
}

RedisConnectionPool::~RedisConnectionPool() {
    closeAll();
}

std::string RedisConnectionPool::name() const {
    return endpoint_.host + ":" + std::to_string(endpoint_.port) + "/" + std::to_string(endpoint_.database);
}

PooledConnection RedisConnectionPool::acquire() {
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (closed_) {
            throw InfrastructureError("Пул соединений " + name() + " закрыт", name());
        }
        while (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            if (conn->healthy()) {
                return PooledConnection(this, std::move(conn));
            }
            --open_;
            ++discarded_;
        }
        if (open_ < maxSize_) {
            ++open_;
            const bool firstConnection = created_ == 0;
            lock.unlock();
            std::unique_ptr<RedisConnection> conn;
            try {
                conn = connectWithRetry(firstConnection);
            } catch (const std::exception&) {
                lock.lock();
                --open_;
                available_.notify_one();
                throw;
            }
            lock.lock();
            ++created_;
            lastSecurityInfo_ = conn->securityInfo();
            return PooledConnection(this, std::move(conn));
        }
        if (available_.wait_until(lock, deadline) == std::cv_status::timeout) {
            ++acquireTimeouts_;
            throw InfrastructureError("Таймаут ожидания соединения из пула " + name(), name());
        }
    }
}

std::unique_ptr<RedisConnection> RedisConnectionPool::connectWithRetry(bool allowRetry) {
    const int retries = allowRetry && security_ ? std::max(security_->maxRetries, 0) : 0;
    const double baseDelay = security_ ? std::max(security_->retryDelaySeconds, 0.0) : 0.0;
    for (int attempt = 0;; ++attempt) {
        try {
            return RedisConnection::connect(endpoint_, security_, timeout_);
        } catch (const InfrastructureError& e) {
            if (attempt >= retries || closed()) {
                if (retries > 0) {
                    throw InfrastructureError("Подключение к " + name() + " не удалось после " +
                                              std::to_string(attempt + 1) + " попыток: " + e.what(), name());
                }
                throw;
            }
            const double delay = std::ldexp(baseDelay, std::min(attempt, 16));
            cacheLogger()->warn("RedisConnectionPool: попытка {}/{} подключения к {} не удалась ({}), повтор через {:.2f}s",
                                attempt + 1, retries + 1, name(), e.what(), delay);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++connectRetries_;
            }
            std::this_thread::sleep_for(std::chrono::duration<double>(delay));
        }
    }
}

void RedisConnectionPool::release(std::unique_ptr<RedisConnection> conn) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || !conn->healthy()) {
        if (!conn->healthy()) {
            ++discarded_;
        }
        --open_;
        lock.unlock();
        conn->close();
        available_.notify_one();
        return;
    }
    idle_.push_back(std::move(conn));
    lock.unlock();
    available_.notify_one();
}

RespValue RedisConnectionPool::execute(const std::vector<std::string>& args) {
    auto conn = acquire();
    return conn->command(args);
}

size_t RedisConnectionPool::closeAll() {
    std::vector<std::unique_ptr<RedisConnection>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        closed_ = true;
        toClose.swap(idle_);
        open_ -= toClose.size();
    }
    available_.notify_all();
    for (auto& conn : toClose) {
        conn->close();
    }
    cacheLogger()->info("RedisConnectionPool: {} закрыт, соединений закрыто: {}", name(), toClose.size());
    return toClose.size();
}

bool RedisConnectionPool::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

PoolStats RedisConnectionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats s;
    s.maxSize = maxSize_;
    s.open = open_;
    s.idle = idle_.size();
    s.created = created_;
    s.discarded = discarded_;
    s.acquireTimeouts = acquireTimeouts_;
    s.connectRetries = connectRetries_;
    s.closed = closed_;
    return s;
}

security::ConnectionSecurityInfo RedisConnectionPool::lastSecurityInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSecurityInfo_;
}

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
