#include <doctest/doctest.h>

#include <string>

#include "common/message.h"

using namespace maxpy_debugger::serialization;

TEST_CASE("frame prefixes content with its byte length")
{
    CHECK(frame("{}") == "Content-Length: 2\r\n\r\n{}");
    CHECK(frame("") == "Content-Length: 0\r\n\r\n");

    message msg = make_message("{\"seq\":1}");
    CHECK(msg.header_ == "Content-Length: 9\r\n\r\n");
    CHECK(msg.content_ == "{\"seq\":1}");
}

TEST_CASE("frame_reader extracts several messages from one chunk")
{
    frame_reader reader;
    reader.feed(frame("{\"a\":1}") + frame("{\"b\":2}"));

    std::string content;
    REQUIRE(reader.next(content));
    CHECK(content == "{\"a\":1}");
    REQUIRE(reader.next(content));
    CHECK(content == "{\"b\":2}");
    CHECK_FALSE(reader.next(content));
    CHECK(reader.buffered() == 0);
}

TEST_CASE("frame_reader waits for split headers and bodies")
{
    frame_reader reader;
    std::string wire = frame("{\"command\":\"threads\"}");
    std::string content;

    reader.feed(wire.substr(0, 10));
    CHECK_FALSE(reader.next(content));

    reader.feed(wire.substr(10, 15));
    CHECK_FALSE(reader.next(content));

    reader.feed(wire.substr(25));
    REQUIRE(reader.next(content));
    CHECK(content == "{\"command\":\"threads\"}");
}

TEST_CASE("frame_reader counts bytes, not characters")
{
    // "é" is two bytes of UTF-8.
    std::string body = "{\"output\":\"caf\xc3\xa9\"}";
    frame_reader reader;
    reader.feed(frame(body));

    std::string content;
    REQUIRE(reader.next(content));
    CHECK(content == body);
}

TEST_CASE("frame_reader skips unrelated header lines")
{
    frame_reader reader;
    reader.feed("Content-Type: application/vscode-jsonrpc; charset=utf-8\r\nContent-Length: 2\r\n\r\n{}");

    std::string content;
    REQUIRE(reader.next(content));
    CHECK(content == "{}");
}

TEST_CASE("frame_reader rejects malformed headers")
{
    std::string content;

    SUBCASE("missing length")
    {
        frame_reader reader;
        reader.feed("Content-Type: text\r\n\r\n{}");
        CHECK_THROWS_AS(reader.next(content), protocol_error);
    }

    SUBCASE("non-numeric length")
    {
        frame_reader reader;
        reader.feed("Content-Length: ten\r\n\r\n{}");
        CHECK_THROWS_AS(reader.next(content), protocol_error);
    }

    SUBCASE("negative length")
    {
        frame_reader reader;
        reader.feed("Content-Length: -4\r\n\r\n{}");
        CHECK_THROWS_AS(reader.next(content), protocol_error);
    }
}

TEST_CASE("locked_message_queue reports emptiness transitions")
{
    locked_message_queue queue;
    CHECK(queue.empty());

    CHECK(queue.push(make_message("1")));
    CHECK_FALSE(queue.push(make_message("2")));
    CHECK(queue.size() == 2);

    CHECK(queue.top().content_ == "1");
    CHECK_FALSE(queue.pop());
    CHECK(queue.top().content_ == "2");
    CHECK(queue.pop());
    CHECK(queue.empty());
}

TEST_CASE("frame_reader never asks for bytes past the current message")
{
    frame_reader reader;
    std::string wire = frame("{\"seq\":1}");
    std::string content;

    // The header is read a byte at a time.
    std::size_t header_len = wire.find("\r\n\r\n") + 4;
    for (std::size_t i = 0; i < header_len; ++i)
    {
        CHECK(reader.wanted() == 1);
        reader.feed(wire.substr(i, 1));
        CHECK_FALSE(reader.next(content));
    }

    // Then exactly the body.
    CHECK(reader.wanted() == 9);
    reader.feed(wire.substr(header_len, 4));
    CHECK_FALSE(reader.next(content));
    CHECK(reader.wanted() == 5);

    reader.feed(wire.substr(header_len + 4));
    REQUIRE(reader.next(content));
    CHECK(content == "{\"seq\":1}");
    CHECK(reader.wanted() == 1);
}

TEST_CASE("frame_reader rejects oversized messages")
{
    frame_reader reader;
    reader.feed("Content-Length: " + std::to_string(max_content_length + 1) + "\r\n\r\n");

    std::string content;
    CHECK_THROWS_AS(reader.next(content), protocol_error);
}
