#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cachekit {
namespace core {
namespace security {

// Окружение, для которого проверяются обязательные требования безопасности
enum class SecurityEnvironment {
    Testing,
    Development,
    Staging,
    Production
};

std::string toString(SecurityEnvironment env);
// ConfigurationError с полем environment для неизвестного имени
SecurityEnvironment securityEnvironmentFromString(const std::string& name);

// SecurityConfig: параметры защищённого подключения к удалённому хранилищу
struct SecurityConfig {
    std::string authPassword;              // AUTH <password>
    std::string aclUsername;               // ACL пользователь
    std::string aclPassword;               // ACL пароль
    bool tlsEnabled = false;               // TLS
    std::string tlsCertPath;               // Клиентский сертификат (при TLS обязателен, как и ключ и CA)
    std::string tlsKeyPath;                // Приватный ключ
    std::string tlsCaPath;                 // CA
    bool verifyCertificates = true;        // Проверка сертификата сервера
    std::string minTlsVersion = "1.2";     // "1.2" | "1.3"
    int connectionTimeoutSeconds = 5;      // Таймаут подключения
    int maxRetries = 3;                    // Повторы подключения
    double retryDelaySeconds = 1.0;        // Базовая пауза, удваивается с каждой попыткой
    std::string encryptionKey;             // base64, 32 байта; пусто = значения без шифрования
    SecurityEnvironment environment = SecurityEnvironment::Development;

    bool hasAuthentication() const;
    std::string securityLevel() const; // HIGH | MEDIUM | LOW
    std::vector<std::string> validate() const; // Пустой список = корректно

    // Чтение REDIS_* переменных; nullopt если ничего не задано
    // ConfigurationError с именем переменной при неверном значении
    static std::optional<SecurityConfig> fromEnvironment();

    nlohmann::json toJson() const;       // Полная форма, обратима через fromJson
    nlohmann::json toMaskedJson() const; // Для логов и отчётов: пароли заменены на ***
    static SecurityConfig fromJson(const nlohmann::json& j);
    bool operator==(const SecurityConfig& other) const;

private:
    nlohmann::json serialize(bool maskSecrets) const;
};

} // namespace security
} // namespace core
} // namespace cachekit
