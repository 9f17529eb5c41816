#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/remote/RespProtocol.hpp"
#include "core/security/SecurityConfig.hpp"
#include "core/security/SecurityManager.hpp"

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

// RedisConnection: одно соединение с Redis-совместимым сервером (TCP/TLS, AUTH, SELECT)
// Не потокобезопасно: используется одним вызывающим через пул
class RedisConnection {
    // Конструктор открыт только для connect()
    class ConnectKey {
        friend class RedisConnection;
        ConnectKey() {}
    };

public:
    // Бросает InfrastructureError при сбое разрешения имени, подключения, TLS или AUTH.
    // timeout ограничивает каждую команду целиком; подключение ограничено
    // security->connectionTimeoutSeconds, если SecurityConfig задан
    static std::unique_ptr<RedisConnection> connect(const RedisEndpoint& endpoint,
                                                    const std::optional<security::SecurityConfig>& security,
                                                    std::chrono::seconds timeout);
    RedisConnection(ConnectKey, int fd, std::string endpointName, std::chrono::seconds commandTimeout);
    ~RedisConnection();
    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    // Ответ-ошибка сервера возвращается как RespValue::Error; сетевой сбой или таймаут -> InfrastructureError
    RespValue command(const std::vector<std::string>& args);
    bool healthy() const { return healthy_; } // false после сетевой ошибки
    const security::ConnectionSecurityInfo& securityInfo() const { return securityInfo_; }
    std::chrono::steady_clock::time_point lastUsed() const { return lastUsed_; }
    void close();

private:
    using Deadline = std::chrono::steady_clock::time_point;

    void startTls(const RedisEndpoint& endpoint, const security::SecurityConfig& security);
    void authenticate(const RedisEndpoint& endpoint, const std::optional<security::SecurityConfig>& security);
    void waitReady(short events, Deadline deadline);
    void sendAll(const std::string& data, Deadline deadline);
    size_t receiveSome(char* buffer, size_t size, Deadline deadline);

    int fd_ = -1;
    SSL_CTX* sslCtx_ = nullptr;
    SSL* ssl_ = nullptr;
    std::string endpointName_;
    std::chrono::seconds commandTimeout_;
    RespParser parser_;
    bool healthy_ = true;
    security::ConnectionSecurityInfo securityInfo_;
    std::chrono::steady_clock::time_point lastUsed_;
};

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
