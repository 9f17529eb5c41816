#include "core/cache/base/BaseCache.hpp"
#include "core/cache/CacheErrors.hpp"
#include <algorithm>
#include <utility>

namespace cachekit {
namespace core {
namespace cache {

bool ICache::getString(const std::string& key, std::string& value) {
    Bytes raw;
    if (!get(key, raw)) {
        return false;
    }
    value.assign(raw.begin(), raw.end());
    return true;
}

bool ICache::setString(const std::string& key, const std::string& value, int ttlSeconds) {
    return set(key, Bytes(value.begin(), value.end()), ttlSeconds);
}

namespace {

bool matchClass(const std::string& pattern, size_t& p, char c) {
    // p указывает на символ после '['
    bool negate = false;
    if (p < pattern.size() && pattern[p] == '^') {
        negate = true;
        ++p;
    }
    bool matched = false;
    while (p < pattern.size() && pattern[p] != ']') {
        if (pattern[p] == '\\' && p + 1 < pattern.size()) {
            ++p;
            matched = matched || pattern[p] == c;
            ++p;
        } else if (p + 2 < pattern.size() && pattern[p + 1] == '-' && pattern[p + 2] != ']') {
            char lo = pattern[p];
            char hi = pattern[p + 2];
            if (lo > hi) std::swap(lo, hi);
            matched = matched || (c >= lo && c <= hi);
            p += 3;
        } else {
            matched = matched || pattern[p] == c;
            ++p;
        }
    }
    if (p < pattern.size()) {
        ++p; // ']'
    }
    return negate ? !matched : matched;
}

// Один элемент шаблона (литерал, ?, класс, экранированный символ); p сдвигается за элемент
bool matchOne(const std::string& pattern, size_t& p, char c) {
    const char pc = pattern[p];
    if (pc == '?') {
        ++p;
        return true;
    }
    if (pc == '[') {
        ++p;
        return matchClass(pattern, p, c);
    }
    if (pc == '\\' && p + 1 < pattern.size()) {
        p += 2;
        return pattern[p - 1] == c;
    }
    ++p;
    return pc == c;
}

} // namespace

// Итеративный разбор с возвратом только к последней '*': O(len(pattern) * len(text))
bool globMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0;
    size_t t = 0;
    size_t starP = std::string::npos;
    size_t starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            while (p < pattern.size() && pattern[p] == '*') ++p;
            starP = p;
            starT = t;
            continue;
        }
        size_t next = p;
        if (p < pattern.size() && matchOne(pattern, next, text[t])) {
            p = next;
            ++t;
            continue;
        }
        if (starP == std::string::npos) {
            return false;
        }
        p = starP;
        t = ++starT;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

void validatePattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw ValidationError("Invalidation pattern must not be empty", "pattern");
    }
    if (pattern.size() > MAX_PATTERN_LENGTH) {
        throw ValidationError("Invalidation pattern is longer than " + std::to_string(MAX_PATTERN_LENGTH) +
                              " characters", "pattern");
    }
    const auto wildcards = static_cast<size_t>(std::count(pattern.begin(), pattern.end(), '*'));
    if (wildcards > MAX_PATTERN_WILDCARDS) {
        throw ValidationError("Invalidation pattern has more than " + std::to_string(MAX_PATTERN_WILDCARDS) +
                              " '*' wildcards", "pattern");
    }
}

} // namespace cache
} // namespace core
} // namespace cachekit
