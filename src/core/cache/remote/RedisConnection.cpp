#include "core/cache/remote/RedisConnection.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <arpa/inet.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <pthread.h>
#include <thread>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

namespace {

std::string sslErrorString() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown TLS error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

bool connectWithTimeout(int fd, const sockaddr* addr, socklen_t len, std::chrono::seconds timeout,
                        std::string& error) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = std::strerror(errno);
        return false;
    }
    int rc = ::connect(fd, addr, len);
    if (rc < 0 && errno != EINPROGRESS) {
        error = std::strerror(errno);
        return false;
    }
    if (rc < 0) {
        pollfd pfd{fd, POLLOUT, 0};
        rc = ::poll(&pfd, 1, static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()));
        if (rc == 0) {
            error = "connect timed out";
            return false;
        }
        if (rc < 0) {
            error = std::strerror(errno);
            return false;
        }
        int soError = 0;
        socklen_t soLen = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0 || soError != 0) {
            error = std::strerror(soError != 0 ? soError : errno);
            return false;
        }
    }
    if (fcntl(fd, F_SETFL, flags) < 0) {
        error = std::strerror(errno);
        return false;
    }
    return true;
}

// OpenSSL пишет в сокет через write(): SIGPIPE блокируется на время вызова
// и снимается, если был порождён этим вызовом
class SigpipeBlock {
public:
    SigpipeBlock() {
        sigemptyset(&pipeSet_);
        sigaddset(&pipeSet_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        wasPending_ = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        pthread_sigmask(SIG_BLOCK, &pipeSet_, &oldMask_);
    }
    ~SigpipeBlock() {
        const int savedErrno = errno;
        if (!wasPending_) {
            sigset_t pending;
            sigemptyset(&pending);
            if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                const timespec zero{0, 0};
                while (sigtimedwait(&pipeSet_, nullptr, &zero) < 0 && errno == EINTR) {
                }
            }
        }
        pthread_sigmask(SIG_SETMASK, &oldMask_, nullptr);
        errno = savedErrno;
    }
    SigpipeBlock(const SigpipeBlock&) = delete;
    SigpipeBlock& operator=(const SigpipeBlock&) = delete;

private:
    sigset_t pipeSet_;
    sigset_t oldMask_;
    bool wasPending_ = false;
};

using AddressList = std::shared_ptr<addrinfo>;

struct Resolution {
    AddressList addresses;
    int rc = 0;
};

Resolution resolveBlocking(const std::string& host, const std::string& port, int flags) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = flags;
    addrinfo* result = nullptr;
    Resolution out;
    out.rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &result);
    if (out.rc == 0) {
        out.addresses = AddressList(result, &freeaddrinfo);
    }
    return out;
}

// getaddrinfo не принимает таймаут: имя разрешается в отдельном потоке,
// ожидание ограничено timeout. Числовой адрес разрешается сразу
AddressList resolve(const std::string& host, int port, std::chrono::seconds timeout, const std::string& name) {
    const std::string service = std::to_string(port);
    auto numeric = resolveBlocking(host, service, AI_NUMERICHOST);
    if (numeric.rc == 0) {
        return numeric.addresses;
    }
    auto promise = std::make_shared<std::promise<Resolution>>();
    auto future = promise->get_future();
    std::thread([host, service, promise] {
        promise->set_value(resolveBlocking(host, service, 0));
    }).detach();
    if (future.wait_for(timeout) != std::future_status::ready) {
        throw InfrastructureError("Таймаут разрешения адреса " + name, name);
    }
    auto resolved = future.get();
    if (resolved.rc != 0) {
        throw InfrastructureError("Не удалось разрешить адрес " + name + ": " + gai_strerror(resolved.rc), name);
    }
    return resolved.addresses;
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() <= 0 ? 0 : static_cast<int>(left.count()) + 1;
}

void applySocketTimeouts(int fd, std::chrono::seconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count());
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

} // namespace

RedisConnection::RedisConnection(ConnectKey, int fd, std::string endpointName, std::chrono::seconds commandTimeout)
    : fd_(fd),
      endpointName_(std::move(endpointName)),
      commandTimeout_(commandTimeout),
      lastUsed_(std::chrono::steady_clock::now()) {
    securityInfo_.connected = true;
}

RedisConnection::~RedisConnection() {
    close();
}

std::unique_ptr<RedisConnection> RedisConnection::connect(const RedisEndpoint& endpoint,
                                                          const std::optional<security::SecurityConfig>& security,
                                                          std::chrono::seconds timeout) {
    const std::string name = endpoint.host + ":" + std::to_string(endpoint.port);
    const auto connectTimeout = security ? std::chrono::seconds(security->connectionTimeoutSeconds) : timeout;
    auto addresses = resolve(endpoint.host, endpoint.port, connectTimeout, name);

    std::string lastError = "no addresses";
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        if (!connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, connectTimeout, lastError)) {
            ::close(fd);
            continue;
        }
        applySocketTimeouts(fd, timeout);
        auto connection = std::make_unique<RedisConnection>(ConnectKey(), fd, name, timeout);
        const bool useTls = endpoint.tls || (security && security->tlsEnabled);
        if (useTls) {
            connection->startTls(endpoint, security ? *security : security::SecurityConfig{});
        }
        connection->authenticate(endpoint, security);
        cacheLogger()->debug("RedisConnection: подключено к {} (tls={}, auth={})", name,
                             connection->securityInfo_.tlsActive, connection->securityInfo_.authenticated);
        return connection;
    }
    throw InfrastructureError("Не удалось подключиться к " + name + ": " + lastError, name);
}

void RedisConnection::startTls(const RedisEndpoint& endpoint, const security::SecurityConfig& security) {
    sslCtx_ = SSL_CTX_new(TLS_client_method());
    if (!sslCtx_) {
        throw InfrastructureError("SSL_CTX_new failed: " + sslErrorString(), endpointName_);
    }
    SSL_CTX_set_min_proto_version(sslCtx_, security.minTlsVersion == "1.3" ? TLS1_3_VERSION : TLS1_2_VERSION);
    if (!security.tlsCaPath.empty()) {
        if (SSL_CTX_load_verify_locations(sslCtx_, security.tlsCaPath.c_str(), nullptr) != 1) {
            throw InfrastructureError("Не удалось загрузить CA " + security.tlsCaPath + ": " + sslErrorString(), endpointName_);
        }
    } else if (SSL_CTX_set_default_verify_paths(sslCtx_) != 1) {
        cacheLogger()->warn("RedisConnection: системные CA недоступны: {}", sslErrorString());
    }
    if (!security.tlsCertPath.empty() &&
        SSL_CTX_use_certificate_chain_file(sslCtx_, security.tlsCertPath.c_str()) != 1) {
        throw InfrastructureError("Не удалось загрузить сертификат " + security.tlsCertPath + ": " + sslErrorString(), endpointName_);
    }
    if (!security.tlsKeyPath.empty() &&
        SSL_CTX_use_PrivateKey_file(sslCtx_, security.tlsKeyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        throw InfrastructureError("Не удалось загрузить ключ " + security.tlsKeyPath + ": " + sslErrorString(), endpointName_);
    }
    SSL_CTX_set_verify(sslCtx_, security.verifyCertificates ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, nullptr);

    ssl_ = SSL_new(sslCtx_);
    if (!ssl_ || SSL_set_fd(ssl_, fd_) != 1) {
        throw InfrastructureError("SSL_new failed: " + sslErrorString(), endpointName_);
    }
    SSL_set_tlsext_host_name(ssl_, endpoint.host.c_str());
    if (security.verifyCertificates) {
        SSL_set1_host(ssl_, endpoint.host.c_str());
    }
    int rc;
    {
        SigpipeBlock block;
        rc = SSL_connect(ssl_);
    }
    if (rc != 1) {
        healthy_ = false;
        throw InfrastructureError("TLS handshake с " + endpointName_ + " не удался: " + sslErrorString(), endpointName_);
    }
    securityInfo_.tlsActive = true;
    securityInfo_.tlsVersion = SSL_get_version(ssl_);
    securityInfo_.peerVerified = security.verifyCertificates && SSL_get_verify_result(ssl_) == X509_V_OK;
}

void RedisConnection::authenticate(const RedisEndpoint& endpoint,
                                   const std::optional<security::SecurityConfig>& security) {
    std::vector<std::string> auth;
    if (security && !security->aclUsername.empty() && !security->aclPassword.empty()) {
        auth = {"AUTH", security->aclUsername, security->aclPassword};
        securityInfo_.aclUsed = true;
    } else if (security && !security->authPassword.empty()) {
        auth = {"AUTH", security->authPassword};
    } else if (!endpoint.password.empty()) {
        if (endpoint.username.empty()) {
            auth = {"AUTH", endpoint.password};
        } else {
            auth = {"AUTH", endpoint.username, endpoint.password};
            securityInfo_.aclUsed = true;
        }
    }
    if (!auth.empty()) {
        auto reply = command(auth);
        if (reply.isError()) {
            securityInfo_.aclUsed = false;
            throw InfrastructureError("AUTH отклонён сервером " + endpointName_ + ": " + reply.str, endpointName_);
        }
        securityInfo_.authenticated = true;
    }
    if (endpoint.database != 0) {
        auto reply = command({"SELECT", std::to_string(endpoint.database)});
        if (reply.isError()) {
            throw InfrastructureError("SELECT " + std::to_string(endpoint.database) + " не выполнен: " + reply.str, endpointName_);
        }
    }
}

void RedisConnection::waitReady(short events, Deadline deadline) {
    while (true) {
        const int timeoutMs = remainingMs(deadline);
        if (timeoutMs == 0) {
            throw InfrastructureError("Таймаут команды к " + endpointName_ + " (" +
                                      std::to_string(commandTimeout_.count()) + "s)", endpointName_);
        }
        pollfd pfd{fd_, events, 0};
        const int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc > 0) {
            return;
        }
        if (rc < 0 && errno != EINTR) {
            throw InfrastructureError("Ошибка ожидания сокета " + endpointName_ + ": " + std::strerror(errno), endpointName_);
        }
    }
}

void RedisConnection::sendAll(const std::string& data, Deadline deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        waitReady(POLLOUT, deadline);
        ssize_t n;
        if (ssl_) {
            {
                SigpipeBlock block;
                n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            }
            if (n <= 0) {
                throw InfrastructureError("Ошибка записи TLS в " + endpointName_ + ": " + sslErrorString(), endpointName_);
            }
        } else {
            n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                throw InfrastructureError("Ошибка записи в " + endpointName_ + ": " + std::strerror(errno), endpointName_);
            }
        }
        sent += static_cast<size_t>(n);
    }
}

size_t RedisConnection::receiveSome(char* buffer, size_t size, Deadline deadline) {
    while (true) {
        // Расшифрованные данные уже в буфере OpenSSL: сокет может быть пуст
        if (!ssl_ || SSL_pending(ssl_) == 0) {
            waitReady(POLLIN, deadline);
        }
        ssize_t n;
        if (ssl_) {
            {
                SigpipeBlock block;
                n = SSL_read(ssl_, buffer, static_cast<int>(size));
            }
            if (n <= 0) {
                const int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    continue;
                }
                if (err == SSL_ERROR_ZERO_RETURN) {
                    throw InfrastructureError("Сервер " + endpointName_ + " закрыл TLS-соединение", endpointName_);
                }
                throw InfrastructureError("Ошибка чтения TLS из " + endpointName_ + " (таймаут или сбой)", endpointName_);
            }
        } else {
            n = ::recv(fd_, buffer, size, 0);
            if (n == 0) {
                throw InfrastructureError("Сервер " + endpointName_ + " закрыл соединение", endpointName_);
            }
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    throw InfrastructureError("Таймаут чтения из " + endpointName_, endpointName_);
                }
                throw InfrastructureError("Ошибка чтения из " + endpointName_ + ": " + std::strerror(errno), endpointName_);
            }
        }
        return static_cast<size_t>(n);
    }
}

RespValue RedisConnection::command(const std::vector<std::string>& args) {
    if (fd_ < 0 || !healthy_) {
        throw InfrastructureError("Соединение с " + endpointName_ + " недоступно", endpointName_);
    }
    lastUsed_ = std::chrono::steady_clock::now();
    // Один срок на отправку и весь ответ, а не на каждый recv
    const Deadline deadline = lastUsed_ + commandTimeout_;
    try {
        sendAll(encodeCommand(args), deadline);
        char buffer[16384];
        while (true) {
            if (auto reply = parser_.next()) {
                return std::move(*reply);
            }
            const size_t n = receiveSome(buffer, sizeof(buffer), deadline);
            parser_.feed(buffer, n);
        }
    } catch (const InfrastructureError&) {
        healthy_ = false;
        throw;
    } catch (const std::runtime_error& e) {
        healthy_ = false;
        throw InfrastructureError(std::string("Ошибка протокола RESP: ") + e.what(), endpointName_);
    }
}

void RedisConnection::close() {
    if (ssl_) {
        {
            SigpipeBlock block;
            SSL_shutdown(ssl_);
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (sslCtx_) {
        SSL_CTX_free(sslCtx_);
        sslCtx_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    healthy_ = false;
    securityInfo_.connected = false;
}

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
