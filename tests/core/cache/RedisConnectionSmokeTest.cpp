#include <arpa/inet.h>
#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/remote/RedisConnection.hpp"
#include "core/cache/remote/RedisConnectionPool.hpp"

using namespace cachekit::core::cache;
using namespace cachekit::core::cache::remote;
using cachekit::core::security::SecurityConfig;

namespace {

// Однократный TCP-сервер на 127.0.0.1 с произвольным поведением для принятого клиента
class LocalServer {
public:
    explicit LocalServer(std::function<void(int)> handler) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        assert(listenFd_ >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        int rc = ::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = ::listen(listenFd_, 4);
        assert(rc == 0);
        socklen_t len = sizeof(addr);
        rc = ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        assert(rc == 0);
        port_ = ntohs(addr.sin_port);
        worker_ = std::thread([this, handler] {
            const int client = ::accept(listenFd_, nullptr, nullptr);
            if (client >= 0) {
                handler(client);
                ::close(client);
            }
        });
    }
    ~LocalServer() {
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        if (worker_.joinable()) {
            worker_.join();
        }
    }
    int port() const { return port_; }

private:
    int listenFd_ = -1;
    int port_ = 0;
    std::thread worker_;
};

RedisEndpoint localEndpoint(int port) {
    RedisEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    return endpoint;
}

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

void testCommandDeadline() {
    std::cout << "Testing RedisConnection command deadline...\n";
    std::atomic<bool> stop{false};
    // Ответ идёт по байту: каждый recv укладывается в таймаут, команда целиком нет
    LocalServer server([&stop](int client) {
        char buffer[256];
        ::recv(client, buffer, sizeof(buffer), 0);
        const std::string partial = "+PONGPONGPONGPONG";
        for (char c : partial) {
            if (stop) {
                break;
            }
            ::send(client, &c, 1, MSG_NOSIGNAL);
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
    });
    auto connection = RedisConnection::connect(localEndpoint(server.port()), std::nullopt, std::chrono::seconds(1));
    const auto start = std::chrono::steady_clock::now();
    bool timedOut = false;
    try {
        connection->command({"PING"});
    } catch (const InfrastructureError& e) {
        timedOut = std::string(e.what()).find("Таймаут") != std::string::npos;
    }
    const double elapsed = secondsSince(start);
    stop = true;
    assert(timedOut);
    assert(elapsed < 2.0);
    assert(!connection->healthy());
    std::cout << "[OK] RedisConnection command deadline test\n";
}

void testPlainReply() {
    std::cout << "Testing RedisConnection plain reply...\n";
    LocalServer server([](int client) {
        char buffer[256];
        ::recv(client, buffer, sizeof(buffer), 0);
        const std::string reply = "+PONG\r\n";
        ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
    });
    auto connection = RedisConnection::connect(localEndpoint(server.port()), std::nullopt, std::chrono::seconds(2));
    auto reply = connection->command({"PING"});
    assert(reply.str == "PONG");
    assert(connection->healthy());
    assert(!connection->securityInfo().tlsActive);
    std::cout << "[OK] RedisConnection plain reply test\n";
}

void testTlsAgainstClosingPeer() {
    std::cout << "Testing RedisConnection TLS with closing peer...\n";
    // Сервер сбрасывает соединение; процесс не должен получить SIGPIPE
    LocalServer server([](int client) {
        linger hard{1, 0};
        ::setsockopt(client, SOL_SOCKET, SO_LINGER, &hard, sizeof(hard));
    });
    auto endpoint = localEndpoint(server.port());
    endpoint.tls = true;
    bool failed = false;
    try {
        RedisConnection::connect(endpoint, std::nullopt, std::chrono::seconds(2));
    } catch (const InfrastructureError&) {
        failed = true;
    }
    assert(failed);
    std::cout << "[OK] RedisConnection TLS closing peer test\n";
}

void testBoundedResolution() {
    std::cout << "Testing RedisConnection name resolution bound...\n";
    RedisEndpoint endpoint;
    endpoint.host = "cachekit-unresolvable.invalid";
    endpoint.port = 6379;
    const auto start = std::chrono::steady_clock::now();
    bool failed = false;
    try {
        RedisConnection::connect(endpoint, std::nullopt, std::chrono::seconds(1));
    } catch (const InfrastructureError&) {
        failed = true;
    }
    assert(failed);
    assert(secondsSince(start) < 2.0);
    std::cout << "[OK] RedisConnection name resolution bound test\n";
}

void testConnectRetries() {
    std::cout << "Testing RedisConnectionPool connect retries...\n";
    SecurityConfig security;
    security.environment = cachekit::core::security::SecurityEnvironment::Testing;
    security.maxRetries = 2;
    security.retryDelaySeconds = 0.1;
    security.connectionTimeoutSeconds = 1;
    RedisConnectionPool pool(localEndpoint(1), security, 2, std::chrono::seconds(1));

    const auto start = std::chrono::steady_clock::now();
    bool failed = false;
    try {
        pool.acquire();
    } catch (const InfrastructureError& e) {
        failed = std::string(e.what()).find("после 3 попыток") != std::string::npos;
    }
    assert(failed);
    // Паузы 0.1 + 0.2 секунды между тремя попытками
    assert(secondsSince(start) >= 0.3);
    auto stats = pool.stats();
    assert(stats.connectRetries == 2);
    assert(stats.open == 0);
    assert(stats.toJson()["connect_retries"].get<size_t>() == 2);

    // Без SecurityConfig попытка одна
    RedisConnectionPool single(localEndpoint(1), std::nullopt, 1, std::chrono::seconds(1));
    failed = false;
    try {
        single.execute({"PING"});
    } catch (const InfrastructureError&) {
        failed = true;
    }
    assert(failed);
    assert(single.stats().connectRetries == 0);

    // Закрытый пул не ждёт следующей попытки
    pool.closeAll();
    failed = false;
    try {
        pool.acquire();
    } catch (const InfrastructureError&) {
        failed = true;
    }
    assert(failed);
    assert(pool.stats().connectRetries == 2);
    std::cout << "[OK] RedisConnectionPool connect retries test\n";
}

int main() {
    try {
        testPlainReply();
        testCommandDeadline();
        testTlsAgainstClosingPeer();
        testBoundedResolution();
        testConnectRetries();
        std::cout << "All RedisConnection tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
