#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/base/MemoryCache.hpp"
#include "core/cache/redis/AIResponseCache.hpp"

using namespace cachekit::core::cache;

namespace {

std::shared_ptr<AIResponseCache> makeAiCache(size_t maxTextLength = 100000) {
    auto config = CacheConfig::forStrategy(CacheStrategy::AiOptimized);
    config.textHashThreshold = 50;
    config.maxTextLength = maxTextLength;
    auto inner = std::make_shared<MemoryCache>(config.memoryCacheSize, config.defaultTtlSeconds);
    return std::make_shared<AIResponseCache>(inner, config);
}

template<typename Fn>
bool throwsValidation(Fn&& fn, const std::string& field) {
    try {
        fn();
    } catch (const ValidationError& e) {
        return e.field() == field;
    }
    return false;
}

} // namespace

void smokeTestAIResponseCache() {
    std::cout << "Testing AIResponseCache basic operations...\n";
    auto cache = makeAiCache();
    assert(cache->cacheType() == "ai_memory");

    const std::string text = "Caching makes repeated AI requests cheap.";
    const nlohmann::json options = {{"max_length", 50}};
    assert(!cache->getCachedResponse(text, "summarize", options));

    assert(cache->cacheResponse(text, "summarize", options, {{"summary", "Caching is cheap."}}));
    auto cached = cache->getCachedResponse(text, "summarize", options);
    assert(cached);
    assert((*cached)["summary"] == "Caching is cheap.");
    assert((*cached)["cache_hit"].get<bool>());
    assert((*cached)["operation"] == "summarize");
    assert((*cached)["text_tier"] == "small");
    assert((*cached)["text_length"].get<size_t>() == text.size());
    assert(cached->contains("cached_at"));

    // Другие параметры дают другой ключ
    assert(!cache->getCachedResponse(text, "summarize", {{"max_length", 100}}));
    assert(!cache->getCachedResponse(text, "sentiment", options));
    std::cout << "[OK] AIResponseCache smoke test\n";
}

void testQuestionAnswering() {
    std::cout << "Testing AIResponseCache qa responses...\n";
    auto cache = makeAiCache();
    const std::string text = "The meeting is on Tuesday at 10:00 in room 4.";
    cache->cacheResponse(text, "qa", nlohmann::json::object(), {{"answer", "Tuesday"}}, std::string("When?"));
    cache->cacheResponse(text, "qa", nlohmann::json::object(), {{"answer", "Room 4"}}, std::string("Where?"));

    auto when = cache->getCachedResponse(text, "qa", nlohmann::json::object(), std::string("When?"));
    auto where = cache->getCachedResponse(text, "qa", {{"question", "Where?"}});
    assert(when && (*when)["answer"] == "Tuesday");
    assert((*when)["question_provided"].get<bool>());
    assert(where && (*where)["answer"] == "Room 4");
    std::cout << "[OK] AIResponseCache qa test\n";
}

void testOperationTtlAndLongText() {
    std::cout << "Testing AIResponseCache long text keys...\n";
    auto cache = makeAiCache();
    const std::string longText(500, 'w');
    assert(cache->buildKey(longText, "summarize", nlohmann::json::object()).find("hash:") != std::string::npos);
    cache->cacheResponse(longText, "summarize", nlohmann::json::object(), {{"summary", "w"}});
    auto cached = cache->getCachedResponse(longText, "summarize");
    assert(cached && (*cached)["text_tier"] == "small");
    assert(cache->config().ttlFor("summarize") == 14400);
    std::cout << "[OK] AIResponseCache long text test\n";
}

void testValidation() {
    std::cout << "Testing AIResponseCache request validation...\n";
    auto cache = makeAiCache(20);
    const nlohmann::json response = {{"summary", "x"}};
    assert(throwsValidation([&] { cache->cacheResponse("", "summarize", nlohmann::json::object(), response); }, "text"));
    assert(throwsValidation([&] { cache->cacheResponse("text", "", nlohmann::json::object(), response); }, "operation"));
    assert(throwsValidation([&] { cache->cacheResponse("text", "summarize", nlohmann::json::array(), response); }, "options"));
    assert(throwsValidation([&] { cache->cacheResponse("text", "summarize", nlohmann::json::object(), "plain"); }, "response"));
    assert(throwsValidation([&] { cache->getCachedResponse(std::string(21, 'x'), "summarize"); }, "text"));
    // 20 символов кириллицы укладываются в лимит, хотя байт 40
    std::string cyrillic;
    for (int i = 0; i < 20; ++i) {
        cyrillic += "ж";
    }
    assert(!cache->getCachedResponse(cyrillic, "summarize"));

    const nlohmann::json badOptions = {{"style", "\xff\xfe"}};
    assert(throwsValidation([&] { cache->cacheResponse("text", "summarize", badOptions, response); }, "options"));
    assert(throwsValidation([&] { cache->getCachedResponse("text", "summarize", badOptions); }, "options"));
    // Невалидные байты в ответе заменяются при сериализации, запись проходит
    assert(cache->cacheResponse("text", "summarize", nlohmann::json::object(), {{"summary", "\xff ok"}}));
    assert(cache->getCachedResponse("text", "summarize"));
    std::cout << "[OK] AIResponseCache validation test\n";
}

void testInvalidation() {
    std::cout << "Testing AIResponseCache invalidation...\n";
    auto cache = makeAiCache();
    const nlohmann::json response = {{"result", "ok"}};
    cache->cacheResponse("first text", "summarize", nlohmann::json::object(), response);
    cache->cacheResponse("second text", "summarize", nlohmann::json::object(), response);
    cache->cacheResponse("first text", "sentiment", nlohmann::json::object(), response);
    cache->setString("user:1", "unrelated");

    assert(cache->invalidateByOperation("summarize") == 2);
    assert(!cache->getCachedResponse("first text", "summarize"));
    assert(cache->getCachedResponse("first text", "sentiment"));

    assert(cache->invalidateAll() == 1);
    assert(cache->exists("user:1"));
    assert(cache->invalidateByOperation("key*points") == 0);
    std::cout << "[OK] AIResponseCache invalidation test\n";
}

void testPerformanceSummary() {
    std::cout << "Testing AIResponseCache performance summary...\n";
    auto cache = makeAiCache();
    cache->cacheResponse("text", "summarize", nlohmann::json::object(), {{"summary", "t"}});
    cache->getCachedResponse("text", "summarize");
    cache->getCachedResponse("text", "summarize");
    cache->getCachedResponse("other", "summarize");
    cache->getCachedResponse("text", "sentiment");

    auto summary = cache->getAiPerformanceSummary();
    assert(summary["total_lookups"].get<size_t>() == 4);
    assert(summary["cache_hits"].get<size_t>() == 2);
    assert(summary["hit_rate"].get<double>() == 50.0);
    assert(summary["operations"]["summarize"]["sets"].get<size_t>() == 1);
    assert(summary["operations"]["sentiment"]["misses"].get<size_t>() == 1);
    assert(summary["text_tier_distribution"]["small"].get<size_t>() == 1);
    assert(summary["backend"] == "memory");

    auto stats = cache->getStats();
    assert(stats["cache_type"] == "ai_memory");
    assert(stats.contains("ai"));
    std::cout << "[OK] AIResponseCache performance summary test\n";
}

int main() {
    try {
        smokeTestAIResponseCache();
        testQuestionAnswering();
        testOperationTtlAndLongText();
        testValidation();
        testInvalidation();
        testPerformanceSummary();
        std::cout << "All AIResponseCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
