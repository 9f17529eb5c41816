#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

// Типы ответа RESP2
enum class RespType {
    SimpleString, // +
    Error,        // -
    Integer,      // :
    BulkString,   // $
    Array,        // *
    Null          // $-1 / *-1
};

struct RespValue {
    RespType type = RespType::Null;
    std::string str;             // SimpleString / Error / BulkString
    long long integer = 0;       // Integer
    std::vector<RespValue> elements; // Array

    bool isError() const { return type == RespType::Error; }
    bool isNull() const { return type == RespType::Null; }
    bool isOk() const { return type == RespType::SimpleString && str == "OK"; }
};

// Команда в формате массива bulk-строк
std::string encodeCommand(const std::vector<std::string>& args);

// RespParser: инкрементальный разбор потока ответов
class RespParser {
public:
    void feed(const char* data, size_t size); // Добавить байты
    std::optional<RespValue> next(); // Следующий полный ответ; бросает std::runtime_error при ошибке протокола
    size_t buffered() const { return buffer_.size() - offset_; }
    void reset();
private:
    std::optional<RespValue> parseAt(size_t& pos) const;
    std::optional<std::string_view> readLine(size_t& pos) const;
    std::string buffer_;
    size_t offset_ = 0;
};

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
