#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cachekit {
namespace core {
namespace cache {

// CacheError: базовое исключение подсистемы кэширования
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message, std::string context = {})
        : std::runtime_error(message), context_(std::move(context)) {}
    const std::string& context() const noexcept { return context_; } // Контекст (url, операция)
private:
    std::string context_;
};

// ConfigurationError: некорректная конфигурация, не восстанавливается
class ConfigurationError : public CacheError {
public:
    explicit ConfigurationError(const std::string& message, std::vector<std::string> issues = {})
        : CacheError(message), issues_(std::move(issues)) {}
    const std::vector<std::string>& issues() const noexcept { return issues_; } // Ошибки по полям
private:
    std::vector<std::string> issues_;
};

// InfrastructureError: недоступность удалённого хранилища
class InfrastructureError : public CacheError {
public:
    using CacheError::CacheError;
};

// ValidationError: неверный аргумент вызова
class ValidationError : public CacheError {
public:
    ValidationError(const std::string& message, std::string field)
        : CacheError(message), field_(std::move(field)) {}
    const std::string& field() const noexcept { return field_; } // Имя поля
private:
    std::string field_;
};

} // namespace cache
} // namespace core
} // namespace cachekit
