#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "core/cache/remote/RespProtocol.hpp"

using namespace cachekit::core::cache::remote;

namespace {
void feed(RespParser& parser, const std::string& data) {
    parser.feed(data.data(), data.size());
}
}

void testEncodeCommand() {
    std::cout << "Testing RESP command encoding...\n";
    assert(encodeCommand({"PING"}) == "*1\r\n$4\r\nPING\r\n");
    assert(encodeCommand({"SET", "key", "va\r\nlue"}) == "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$7\r\nva\r\nlue\r\n");
    assert(encodeCommand({"GET", ""}) == "*2\r\n$3\r\nGET\r\n$0\r\n\r\n");
    std::cout << "[OK] RESP encoding test\n";
}

void testParseReplyTypes() {
    std::cout << "Testing RESP reply parsing...\n";
    RespParser parser;
    feed(parser, "+PONG\r\n-ERR unknown command\r\n:42\r\n$5\r\nhello\r\n$-1\r\n*2\r\n$1\r\na\r\n:7\r\n");

    auto pong = parser.next();
    assert(pong && pong->type == RespType::SimpleString && pong->str == "PONG");
    auto error = parser.next();
    assert(error && error->isError() && error->str == "ERR unknown command");
    auto integer = parser.next();
    assert(integer && integer->type == RespType::Integer && integer->integer == 42);
    auto bulk = parser.next();
    assert(bulk && bulk->type == RespType::BulkString && bulk->str == "hello");
    auto null = parser.next();
    assert(null && null->isNull());
    auto array = parser.next();
    assert(array && array->type == RespType::Array && array->elements.size() == 2);
    assert(array->elements[0].str == "a" && array->elements[1].integer == 7);
    assert(!parser.next());
    assert(parser.buffered() == 0);
    std::cout << "[OK] RESP reply parsing test\n";
}

void testIncrementalFeed() {
    std::cout << "Testing RESP incremental parsing...\n";
    RespParser parser;
    static const char reply[] = "*2\r\n$4\r\nbi\0y\r\n$-1\r\n";
    const std::string data(reply, sizeof(reply) - 1);
    for (size_t i = 0; i + 1 < data.size(); ++i) {
        parser.feed(&data[i], 1);
        assert(!parser.next());
    }
    parser.feed(&data[data.size() - 1], 1);
    auto value = parser.next();
    assert(value && value->elements.size() == 2);
    assert(value->elements[0].str.size() == 4);
    assert(value->elements[1].isNull());
    std::cout << "[OK] RESP incremental parsing test\n";
}

void testProtocolErrors() {
    std::cout << "Testing RESP protocol errors...\n";
    RespParser parser;
    feed(parser, "?oops\r\n");
    bool thrown = false;
    try {
        parser.next();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);

    parser.reset();
    feed(parser, ":12x\r\n");
    thrown = false;
    try {
        parser.next();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] RESP protocol errors test\n";
}

int main() {
    try {
        testEncodeCommand();
        testParseReplyTypes();
        testIncrementalFeed();
        testProtocolErrors();
        std::cout << "All RespProtocol tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
