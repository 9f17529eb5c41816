#include "core/cache/remote/RespProtocol.hpp"
#include <algorithm>
#include <stdexcept>

namespace cachekit {
namespace core {
namespace cache {
namespace remote {

namespace {

constexpr size_t MAX_BULK_LENGTH = 512 * 1024 * 1024;
constexpr size_t COMPACT_THRESHOLD = 64 * 1024;

long long parseInteger(std::string_view s) {
    if (s.empty()) {
        throw std::runtime_error("RESP: empty integer");
    }
    size_t i = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        i = 1;
    }
    if (i == s.size()) {
        throw std::runtime_error("RESP: malformed integer");
    }
    long long value = 0;
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') {
            throw std::runtime_error("RESP: malformed integer '" + std::string(s) + "'");
        }
        value = value * 10 + (s[i] - '0');
    }
    return negative ? -value : value;
}

} // namespace

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out = "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& arg : args) {
        out += "$" + std::to_string(arg.size()) + "\r\n";
        out += arg;
        out += "\r\n";
    }
    return out;
}

void RespParser::feed(const char* data, size_t size) {
    if (offset_ > COMPACT_THRESHOLD && offset_ * 2 > buffer_.size()) {
        buffer_.erase(0, offset_);
        offset_ = 0;
    }
    buffer_.append(data, size);
}

void RespParser::reset() {
    buffer_.clear();
    offset_ = 0;
}

std::optional<RespValue> RespParser::next() {
    size_t pos = offset_;
    auto value = parseAt(pos);
    if (value) {
        offset_ = pos;
    }
    return value;
}

std::optional<std::string_view> RespParser::readLine(size_t& pos) const {
    const auto end = buffer_.find("\r\n", pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string_view line(buffer_.data() + pos, end - pos);
    pos = end + 2;
    return line;
}

std::optional<RespValue> RespParser::parseAt(size_t& pos) const {
    if (pos >= buffer_.size()) {
        return std::nullopt;
    }
    const char marker = buffer_[pos];
    size_t cursor = pos + 1;
    auto line = readLine(cursor);
    if (!line) {
        return std::nullopt;
    }
    RespValue value;
    switch (marker) {
        case '+':
            value.type = RespType::SimpleString;
            value.str = std::string(*line);
            break;
        case '-':
            value.type = RespType::Error;
            value.str = std::string(*line);
            break;
        case ':':
            value.type = RespType::Integer;
            value.integer = parseInteger(*line);
            break;
        case '$': {
            const long long length = parseInteger(*line);
            if (length < 0) {
                value.type = RespType::Null;
                break;
            }
            if (static_cast<size_t>(length) > MAX_BULK_LENGTH) {
                throw std::runtime_error("RESP: bulk string too large");
            }
            if (buffer_.size() < cursor + static_cast<size_t>(length) + 2) {
                return std::nullopt;
            }
            value.type = RespType::BulkString;
            value.str = buffer_.substr(cursor, static_cast<size_t>(length));
            cursor += static_cast<size_t>(length) + 2;
            break;
        }
        case '*': {
            const long long count = parseInteger(*line);
            if (count < 0) {
                value.type = RespType::Null;
                break;
            }
            value.type = RespType::Array;
            value.elements.reserve(static_cast<size_t>(std::min<long long>(count, 1024)));
            for (long long i = 0; i < count; ++i) {
                auto element = parseAt(cursor);
                if (!element) {
                    return std::nullopt;
                }
                value.elements.push_back(std::move(*element));
            }
            break;
        }
        default:
            throw std::runtime_error(std::string("RESP: unexpected type marker '") + marker + "'");
    }
    pos = cursor;
    return value;
}

} // namespace remote
} // namespace cache
} // namespace core
} // namespace cachekit
