// Stdio message framing tests

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

#include <devscope/mcp/message_framing.h>
#include <devscope/mcp/transport.h>

using namespace devscope::mcp;

TEST_CASE("MessageFramer - line-delimited messages", "[mcp][framing][catch2]") {
    MessageFramer framer;
    std::istringstream in("{\"a\":1}\n\n  {\"b\":2}\r\n");

    auto first = framer.readOneMessage(in);
    REQUIRE(first.isMessage());
    CHECK(first.mode == FramingMode::LineDelimited);
    CHECK(first.payload == "{\"a\":1}");

    // Blank lines are skipped and the CR is stripped
    auto second = framer.readOneMessage(in);
    REQUIRE(second.isMessage());
    CHECK(second.payload == "{\"b\":2}");

    auto end = framer.readOneMessage(in);
    CHECK(end.status == FrameStatus::EndOfStream);
}

TEST_CASE("MessageFramer - Content-Length messages", "[mcp][framing][catch2]") {
    MessageFramer framer;
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

    SECTION("exact body length") {
        std::istringstream in("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" +
                              body);
        auto frame = framer.readOneMessage(in);
        REQUIRE(frame.isMessage());
        CHECK(frame.mode == FramingMode::ContentLength);
        CHECK(frame.payload == body);
    }

    SECTION("header name is case-insensitive and extra headers are ignored") {
        std::istringstream in("content-length: " + std::to_string(body.size()) +
                              "\r\nContent-Type: application/vscode-jsonrpc\r\n\r\n" + body);
        auto frame = framer.readOneMessage(in);
        REQUIRE(frame.isMessage());
        CHECK(frame.payload == body);
    }

    SECTION("mixed framings on one stream") {
        std::istringstream in("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" +
                              body + "\n{\"x\":true}\n");
        auto a = framer.readOneMessage(in);
        auto b = framer.readOneMessage(in);
        REQUIRE(a.isMessage());
        REQUIRE(b.isMessage());
        CHECK(a.mode == FramingMode::ContentLength);
        CHECK(b.mode == FramingMode::LineDelimited);
        CHECK(b.payload == "{\"x\":true}");
    }
}

TEST_CASE("MessageFramer - malformed Content-Length input", "[mcp][framing][catch2]") {
    SECTION("non-numeric length") {
        MessageFramer framer;
        std::istringstream in("Content-Length: abc\r\n\r\n{}");
        auto frame = framer.readOneMessage(in);
        CHECK(frame.status == FrameStatus::FramingError);
        CHECK(frame.error.find("Invalid Content-Length") != std::string::npos);
    }

    SECTION("length above the configured limit") {
        MessageFramer framer(16);
        std::istringstream in("Content-Length: 17\r\n\r\n{}");
        auto frame = framer.readOneMessage(in);
        CHECK(frame.status == FrameStatus::FramingError);
    }

    SECTION("stream closes inside the body") {
        MessageFramer framer;
        std::istringstream in("Content-Length: 50\r\n\r\n{\"short\":1}");
        auto frame = framer.readOneMessage(in);
        CHECK(frame.status == FrameStatus::EndOfStream);
    }

    SECTION("garbage inside the header block") {
        MessageFramer framer;
        std::istringstream in("Content-Length: 2\r\nnot a header\r\n\r\n{}");
        auto frame = framer.readOneMessage(in);
        CHECK(frame.status == FrameStatus::FramingError);
    }
}

TEST_CASE("MessageFramer - framing output", "[mcp][framing][catch2]") {
    CHECK(MessageFramer::frame("{}", FramingMode::LineDelimited) == "{}\n");
    CHECK(MessageFramer::frame("{}", FramingMode::ContentLength) ==
          "Content-Length: 2\r\n\r\n{}");
}

TEST_CASE("OutputFraming - names parse back", "[mcp][framing][catch2]") {
    CHECK(parseOutputFraming("ndjson") == OutputFraming::Ndjson);
    CHECK(parseOutputFraming("content-length") == OutputFraming::ContentLength);
    CHECK(parseOutputFraming("mirror") == OutputFraming::Mirror);
    CHECK_FALSE(parseOutputFraming("xml").has_value());
}
