#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/security/SecurityConfig.hpp"

namespace cachekit {
namespace core {
namespace security {

// Фактическое состояние установленного соединения
struct ConnectionSecurityInfo {
    bool connected = false;
    bool authenticated = false;  // AUTH выполнен успешно
    bool aclUsed = false;        // AUTH <user> <pass>
    bool tlsActive = false;      // Сессия идёт через TLS
    bool peerVerified = false;   // Сертификат сервера проверен
    std::string tlsVersion;      // Например "TLSv1.3"
};

struct SecurityRecommendation {
    std::string severity; // critical | high | medium | optimization
    std::string message;
    nlohmann::json toJson() const { return {{"severity", severity}, {"message", message}}; }
};

// Результат проверки безопасности соединения
struct SecurityValidationResult {
    int score = 0;                 // 0-100
    std::string level = "LOW";     // HIGH | MEDIUM | LOW
    bool isSecure = false;
    bool authConfigured = false;
    bool aclEnabled = false;
    bool tlsEnabled = false;
    bool certificateValid = false;
    bool connectionEncrypted = false;
    std::vector<std::string> vulnerabilities;
    std::vector<SecurityRecommendation> recommendations;
    std::vector<std::string> warnings;
    std::chrono::system_clock::time_point timestamp;
    nlohmann::json toJson() const;
};

struct SecurityEvent {
    std::chrono::system_clock::time_point timestamp;
    std::string type;
    std::string details;
    std::string securityLevel;
};

constexpr size_t MAX_SECURITY_EVENTS = 1000;

// SecurityManager: политика безопасности подключения, оценка, аудит событий
class SecurityManager {
public:
    explicit SecurityManager(SecurityConfig config);
    ~SecurityManager();
    const SecurityConfig& config() const { return config_; } // Конфигурация

    // Обязательные требования окружения (бросает ConfigurationError)
    void validateMandatorySecurity(const std::string& url);
    static bool isSecureUrl(const std::string& url);

    SecurityValidationResult validateConnectionSecurity(const ConnectionSecurityInfo& info); // Оценка соединения
    std::vector<SecurityRecommendation> getSecurityRecommendations() const; // Рекомендации по конфигу
    nlohmann::json getSecurityStatus() const; // Текущий статус
    std::string generateSecurityReport(const std::optional<SecurityValidationResult>& result = std::nullopt) const;

    void auditEvent(const std::string& event, const std::string& details); // Аудит события
    std::vector<SecurityEvent> recentEvents() const; // Журнал событий
private:
    SecurityConfig config_;
    std::optional<SecurityValidationResult> lastValidation_;
    std::deque<SecurityEvent> events_;
    mutable std::mutex mutex_;
};

} // namespace security
} // namespace core
} // namespace cachekit
