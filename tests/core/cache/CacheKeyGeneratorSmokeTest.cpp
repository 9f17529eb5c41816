#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/key/CacheKeyGenerator.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"

using namespace cachekit::core::cache;

void testDeterministicKeys() {
    std::cout << "Testing CacheKeyGenerator determinism...\n";
    CacheKeyGenerator generator(1000);
    auto options = nlohmann::json{{"max_length", 100}};
    auto first = generator.generateKey("summarize", "Short text", options);
    auto second = generator.generateKey("summarize", "Short text", options);
    assert(first == second);
    assert(first.rfind("ai_cache:op:summarize|txt:Short text|opts:", 0) == 0);

    // Разные операции и тексты дают разные ключи
    assert(generator.generateKey("sentiment", "Short text", options) != first);
    assert(generator.generateKey("summarize", "Other text", options) != first);
    assert(generator.generateKey("summarize", "Short text") != first);
    std::cout << "[OK] CacheKeyGenerator determinism test\n";
}

void testOptionOrderIndependence() {
    std::cout << "Testing CacheKeyGenerator option ordering...\n";
    CacheKeyGenerator generator;
    auto a = nlohmann::json::parse(R"({"max_length": 100, "style": "brief"})");
    auto b = nlohmann::json::parse(R"({"style": "brief", "max_length": 100})");
    assert(generator.generateKey("summarize", "text", a) == generator.generateKey("summarize", "text", b));
    assert(generator.generateKey("summarize", "text", nlohmann::json::object()) ==
           generator.generateKey("summarize", "text"));
    std::cout << "[OK] CacheKeyGenerator option ordering test\n";
}

void testHashThresholdBoundary() {
    std::cout << "Testing CacheKeyGenerator hash threshold...\n";
    CacheKeyGenerator generator(10);
    auto atLimit = generator.generateKey("summarize", std::string(10, 'a'));
    auto overLimit = generator.generateKey("summarize", std::string(11, 'a'));
    assert(atLimit == "ai_cache:op:summarize|txt:aaaaaaaaaa");
    assert(overLimit.find("|txt:hash:") != std::string::npos);
    // hash: + 16 hex
    auto hashPart = overLimit.substr(overLimit.find("hash:") + 5);
    assert(hashPart.size() == KEY_HASH_LENGTH);
    std::cout << "[OK] CacheKeyGenerator hash threshold test\n";
}

void testSeparatorsSanitized() {
    std::cout << "Testing CacheKeyGenerator separator sanitizing...\n";
    CacheKeyGenerator generator;
    auto key = generator.generateKey("my:op", "a|b:c");
    assert(key == "ai_cache:op:my_op|txt:a_b_c");
    std::cout << "[OK] CacheKeyGenerator separator test\n";
}

void testQuestionIsolation() {
    std::cout << "Testing CacheKeyGenerator qa question handling...\n";
    CacheKeyGenerator generator;
    const std::string text = "The quick brown fox";
    auto first = generator.generateKey("qa", text, nlohmann::json::object(), std::string("Who jumps?"));
    auto second = generator.generateKey("qa", text, nlohmann::json::object(), std::string("What colour?"));
    assert(first != second);
    assert(first.find("|q:") != std::string::npos);

    // Вопрос в options для qa эквивалентен явному вопросу
    auto fromOptions = generator.generateKey("qa", text, {{"question", "Who jumps?"}});
    assert(fromOptions == first);
    assert(fromOptions.find("|opts:") == std::string::npos);

    // Для других операций question остаётся частью options
    auto summarize = generator.generateKey("summarize", text, {{"question", "Who jumps?"}});
    assert(summarize.find("|opts:") != std::string::npos);
    assert(summarize.find("|q:") == std::string::npos);
    std::cout << "[OK] CacheKeyGenerator qa test\n";
}

void testUnicodeAndLargeText() {
    std::cout << "Testing CacheKeyGenerator unicode and large text...\n";
    const std::string cyrillic = "привет"; // 6 символов, 12 байт
    assert(CacheKeyGenerator::utf8Length(cyrillic) == 6);
    CacheKeyGenerator generator(6);
    assert(generator.generateKey("sentiment", cyrillic) == "ai_cache:op:sentiment|txt:привет");
    assert(generator.generateKey("sentiment", cyrillic + "!").find("hash:") != std::string::npos);

    CacheKeyGenerator defaults;
    const std::string large(2 * 1024 * 1024, 'x');
    auto key = defaults.generateKey("summarize", large);
    assert(key.size() < 100);
    assert(key == defaults.generateKey("summarize", large));
    std::string changed = large;
    changed[changed.size() / 2] = 'y';
    assert(defaults.generateKey("summarize", changed) != key);
    std::cout << "[OK] CacheKeyGenerator unicode/large text test\n";
}

void testTiersAndValidation() {
    std::cout << "Testing CacheKeyGenerator tiers and validation...\n";
    CacheKeyGenerator generator(1000, nullMonitor(), TextSizeTiers{10, 20, 30});
    assert(generator.textTier(std::string(5, 'a')) == "small");
    assert(generator.textTier(std::string(10, 'a')) == "medium");
    assert(generator.textTier(std::string(25, 'a')) == "large");
    assert(generator.textTier(std::string(30, 'a')) == "xlarge");

    bool thrown = false;
    try {
        generator.generateKey("", "text");
    } catch (const ValidationError& e) {
        thrown = e.field() == "operation";
    }
    assert(thrown);
    thrown = false;
    try {
        generator.generateKey("summarize", "text", nlohmann::json::array({1, 2}));
    } catch (const ValidationError& e) {
        thrown = e.field() == "options";
    }
    assert(thrown);

    // Невалидный UTF-8 в options: ошибка поля, а не исключение json
    thrown = false;
    try {
        generator.generateKey("summarize", "text", {{"style", "\xff\xfe"}});
    } catch (const ValidationError& e) {
        thrown = e.field() == "options";
    }
    assert(thrown);
    thrown = false;
    try {
        generator.generateKey("qa", "text", {{"question", {{"nested", "\xff"}}}});
    } catch (const ValidationError& e) {
        thrown = e.field() == "options";
    }
    assert(thrown);
    // Сырые байты текста и вопроса хешируются без сериализации
    assert(!generator.generateKey("qa", "\xff text", nlohmann::json::object(), std::string("\xfe?")).empty());
    std::cout << "[OK] CacheKeyGenerator tiers/validation test\n";
}

void testMonitorIntegration() {
    std::cout << "Testing CacheKeyGenerator monitor integration...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    CacheKeyGenerator generator(100, monitor);
    for (int i = 0; i < 3; ++i) {
        generator.generateKey("summarize", "text " + std::to_string(i));
    }
    auto stats = monitor->getStats();
    assert(stats.contains("key_generation"));
    assert(stats["key_generation"]["total_operations"].get<size_t>() == 3);
    std::cout << "[OK] CacheKeyGenerator monitor test\n";
}

int main() {
    try {
        testDeterministicKeys();
        testOptionOrderIndependence();
        testHashThresholdBoundary();
        testSeparatorsSanitized();
        testQuestionIsolation();
        testUnicodeAndLargeText();
        testTiersAndValidation();
        testMonitorIntegration();
        std::cout << "All CacheKeyGenerator tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
