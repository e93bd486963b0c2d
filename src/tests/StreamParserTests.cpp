// SPDX-License-Identifier: Apache-2.0
#include <protocol/StreamParser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace agentlink;

namespace
{

    struct Collector
    {
        std::vector<StreamMessage> messages;

        auto callback() -> MessageCallback
        {
            return [this](StreamMessage message) { messages.push_back(std::move(message)); };
        }
    };

    auto const sampleStream = std::string {
        R"({"type":"system","subtype":"init","session_id":"abc","cwd":"/work"})"
        "\n"
        R"({"type":"assistant","message":{"content":[{"type":"text","text":"Grüße"},{"type":"tool_use","id":"tu1","name":"Read"}]}})"
        "\n"
        R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"tu1","content":"ok"}]}})"
        "\n"
        R"({"type":"result","subtype":"success","is_error":false,"session_id":"abc","usage":{"input_tokens":100,"output_tokens":50}})"
        "\n"
    };

} // namespace

TEST_CASE("StreamParser decodes complete lines in order", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());
    parser.feed(sampleStream);

    REQUIRE(collector.messages.size() == 4);
    CHECK(collector.messages[0].type == MessageType::System);
    CHECK(collector.messages[0].resumeId == "abc");
    CHECK(collector.messages[1].type == MessageType::Assistant);
    CHECK(collector.messages[1].text() == "Grüße");
    CHECK(collector.messages[1].toolUseIds == std::vector<std::string> { "tu1" });
    CHECK(collector.messages[2].type == MessageType::User);
    CHECK(collector.messages[2].parentToolUseId == "tu1");
    CHECK(collector.messages[3].type == MessageType::Result);
    REQUIRE(collector.messages[3].usage.has_value());
    CHECK(collector.messages[3].usage->total() == 150);
    CHECK(parser.pendingBytes() == 0);
    CHECK(parser.decodedMessages() == 4);
}

TEST_CASE("StreamParser output does not depend on chunk boundaries", "[parser]")
{
    auto reference = Collector {};
    auto referenceParser = StreamParser(reference.callback());
    referenceParser.feed(sampleStream);

    for (auto const chunkSize: { size_t { 1 }, size_t { 2 }, size_t { 3 }, size_t { 7 }, size_t { 64 } })
    {
        INFO("chunk size " << chunkSize);
        auto collector = Collector {};
        auto parser = StreamParser(collector.callback());
        for (auto offset = size_t { 0 }; offset < sampleStream.size(); offset += chunkSize)
            parser.feed(std::string_view(sampleStream).substr(offset, chunkSize));

        REQUIRE(collector.messages.size() == reference.messages.size());
        for (auto i = size_t { 0 }; i < collector.messages.size(); ++i)
            CHECK(collector.messages[i].raw == reference.messages[i].raw);
    }
}

TEST_CASE("StreamParser buffers an object split across chunks", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed(R"({"type":"assi)");
    CHECK(collector.messages.empty());
    CHECK(parser.pendingBytes() > 0);

    parser.feed("stant\"}\n");
    REQUIRE(collector.messages.size() == 1);
    CHECK(collector.messages[0].type == MessageType::Assistant);
}

TEST_CASE("StreamParser drops a malformed line and keeps going", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("{\"type\":\"assistant\"}\n{bad json\n{\"type\":\"result\"}\n");

    REQUIRE(collector.messages.size() == 2);
    CHECK(collector.messages[0].type == MessageType::Assistant);
    CHECK(collector.messages[1].type == MessageType::Result);
    CHECK(parser.droppedLines() == 1);
}

TEST_CASE("StreamParser drops JSON that is not a typed object", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("[1,2,3]\n{\"no_type\":true}\n{\"type\":42}\n\"text\"\n");

    CHECK(collector.messages.empty());
    CHECK(parser.droppedLines() == 4);
}

TEST_CASE("StreamParser ignores blank lines, CRLF endings and the legacy terminator", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("\n  \n{\"type\":\"system\"}\r\n$\n\r\n");

    REQUIRE(collector.messages.size() == 1);
    CHECK(collector.messages[0].type == MessageType::System);
    CHECK(parser.droppedLines() == 0);
}

TEST_CASE("StreamParser hands plain-text lines to the unparsed line handler", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());
    auto unparsed = std::vector<std::string> {};
    parser.setUnparsedLineHandler([&](std::string_view line) { unparsed.emplace_back(line); });

    parser.feed("No conversation found with session ID: abc\r\n\n$\n{\"type\":\"system\"}\n[1]\n");

    REQUIRE(collector.messages.size() == 1);
    CHECK(unparsed == std::vector<std::string> { "No conversation found with session ID: abc", "[1]" });
    CHECK(parser.droppedLines() == 2);
}

TEST_CASE("StreamParser keeps unknown message types", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("{\"type\":\"stream_event\",\"data\":1}\n");

    REQUIRE(collector.messages.size() == 1);
    CHECK(collector.messages[0].type == MessageType::Unknown);
    CHECK(collector.messages[0].raw["data"] == 1);
}

TEST_CASE("StreamParser flushes an unterminated final line on finish", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("{\"type\":\"result\",\"is_error\":true,\"result\":\"boom\"}");
    CHECK(collector.messages.empty());

    parser.finish();
    REQUIRE(collector.messages.size() == 1);
    CHECK(collector.messages[0].isError);
    CHECK(collector.messages[0].errorText() == "boom");
    CHECK(parser.pendingBytes() == 0);
}

TEST_CASE("StreamParser discards lines exceeding the size cap", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback(), StreamParserConfig { .maxLineBytes = 32 });

    auto const longLine = "{\"type\":\"assistant\",\"pad\":\"" + std::string(64, 'x') + "\"}";
    parser.feed(longLine.substr(0, 20));
    parser.feed(longLine.substr(20));
    parser.feed("\n{\"type\":\"result\"}\n");

    REQUIRE(collector.messages.size() == 1);
    CHECK(collector.messages[0].type == MessageType::Result);
    CHECK(parser.droppedLines() == 1);
    CHECK(parser.pendingBytes() == 0);
}

TEST_CASE("StreamParser reset discards a partial line", "[parser]")
{
    auto collector = Collector {};
    auto parser = StreamParser(collector.callback());

    parser.feed("{\"type\":");
    parser.reset();
    parser.feed("{\"type\":\"system\"}\n");

    REQUIRE(collector.messages.size() == 1);
    CHECK(parser.droppedLines() == 0);
}

TEST_CASE("decodeStreamMessage reads usage with cache counters", "[parser]")
{
    auto message = decodeStreamMessage(nlohmann::json::parse(R"({
        "type": "result",
        "usage": {
            "input_tokens": 10,
            "output_tokens": 20,
            "cache_creation_input_tokens": 30,
            "cache_read_input_tokens": 40
        }
    })"));

    REQUIRE(message.has_value());
    REQUIRE(message->usage.has_value());
    auto const expected = TokenUsage { .input = 10, .output = 20, .cacheCreate = 30, .cacheRead = 40 };
    CHECK(*message->usage == expected);
    CHECK(message->usage->total() == 100);
}
