#include <catch2/catch_test_macros.hpp>

#include "soon/errors.h"
#include "soon/stream_parser.h"

#include <string>
#include <vector>

using namespace soon;

namespace {

struct Collector {
    std::vector<Chunk> chunks;
    std::vector<ErrorCode> errors;
    int ends = 0;

    void attach(StreamParser& stream) {
        stream.on_chunk([this](const Chunk& chunk) { chunks.push_back(chunk); });
        stream.on_error([this](const DecodeError& e) { errors.push_back(e.code()); });
        stream.on_end([this]() { ++ends; });
    }

    std::vector<std::string> ids() const {
        std::vector<std::string> result;
        for (const auto& chunk : chunks) {
            result.push_back(chunk.id);
        }
        return result;
    }
};

} // namespace

TEST_CASE("StreamParser emits chunks in order", "[stream]") {
    StreamParser stream;
    Collector out;
    out.attach(stream);

    stream.write("|c1|\nname John");
    CHECK(out.chunks.empty());

    stream.write("|c2|\nage 30");
    REQUIRE(out.chunks.size() == 1);
    CHECK(out.chunks[0].id == "c1");
    CHECK(out.chunks[0].value == Value(Object{{"name", "John"}}));

    stream.end();
    REQUIRE(out.chunks.size() == 2);
    CHECK(out.chunks[1].id == "c2");
    CHECK(out.chunks[1].value == Value(Object{{"age", 30}}));
    CHECK(out.ends == 1);
}

TEST_CASE("StreamParser output does not depend on how input is split", "[stream]") {
    const std::string text =
        "|a|\nuser\n  name Alice\n  tags x y\n"
        "|b|\nmsg \"pipe | inside\"\n"
        "|c|\nitems 1 2 3\n";

    StreamParser whole;
    Collector whole_out;
    whole_out.attach(whole);
    whole.write(text);
    whole.end();

    StreamParser bytewise;
    Collector bytewise_out;
    bytewise_out.attach(bytewise);
    for (char c : text) {
        bytewise.write(std::string(1, c));
    }
    bytewise.end();

    REQUIRE(whole_out.chunks.size() == 3);
    REQUIRE(bytewise_out.chunks.size() == 3);
    for (size_t i = 0; i < 3; ++i) {
        CHECK(whole_out.chunks[i].id == bytewise_out.chunks[i].id);
        CHECK(whole_out.chunks[i].value == bytewise_out.chunks[i].value);
    }
    CHECK(whole_out.chunks[1].value == Value(Object{{"msg", "pipe | inside"}}));
}

TEST_CASE("StreamParser ignores pipes inside comments", "[stream]") {
    auto chunks = parse_stream({"|a|\nk 1 # a|b\n|b|\nn 2"});

    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0].value == Value(Object{{"k", 1}}));
    CHECK(chunks[1].value == Value(Object{{"n", 2}}));
}

TEST_CASE("StreamParser numbers chunks without an id", "[stream]") {
    auto chunks = parse_stream({"||\na 1\n||\nb 2\n|named|\nc 3\n||\nd 4"});

    StreamParser stream;
    Collector out;
    out.attach(stream);
    stream.write("||\na 1\n||\nb 2\n|named|\nc 3\n||\nd 4");
    stream.end();

    CHECK(out.ids() == std::vector<std::string>{"0", "1", "named", "2"});
    CHECK(chunks.size() == 4);
}

TEST_CASE("StreamParser decodes undelimited text at end", "[stream]") {
    StreamParser stream;
    Collector out;
    out.attach(stream);

    stream.write("name John");
    CHECK(stream.state() == StreamState::Buffering);
    CHECK(stream.buffered_size() == 9);

    stream.end();
    REQUIRE(out.chunks.size() == 1);
    CHECK(out.chunks[0].id == "0");
    CHECK(out.chunks[0].value == Value(Object{{"name", "John"}}));
}

TEST_CASE("StreamParser drops undecodable trailing text silently", "[stream]") {
    StreamParser stream;
    Collector out;
    out.attach(stream);

    stream.write("a \"unterminated");
    stream.end();

    CHECK(out.chunks.empty());
    CHECK(out.errors.empty());
    CHECK(stream.errors_emitted() == 0);
    CHECK(out.ends == 1);
}

TEST_CASE("StreamParser reports bad chunks and keeps going", "[stream][errors]") {
    StreamParser stream;
    Collector out;
    out.attach(stream);

    stream.write("|bad|\na 1\na 2\n|ok|\nb 1");
    stream.end();

    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorCode::DuplicateKey);
    REQUIRE(out.chunks.size() == 1);
    CHECK(out.chunks[0].id == "ok");
    CHECK(stream.chunks_emitted() == 1);
    CHECK(stream.errors_emitted() == 1);
}

TEST_CASE("StreamParser applies parser options to every chunk", "[stream]") {
    StreamOptions options;
    options.parser.allow_duplicate_keys = true;

    auto chunks = parse_stream({"|x|\na 1\na 2"}, options);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].value == Value(Object{{"a", 2}}));
}

TEST_CASE("parse_stream rethrows the first chunk error", "[stream][errors]") {
    try {
        parse_stream({"|a|\nx *nowhere\n|b|\ny 1"});
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        CHECK(e.code() == ErrorCode::UndefinedAnchor);
        CHECK(e.line() == 2);
    }
}

TEST_CASE("parse_stream rethrows chunk errors with their own type", "[stream][errors]") {
    try {
        parse_stream({"|a|\nx 1\nx 2|b|\ny 1"});
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        CHECK(e.code() == ErrorCode::DuplicateKey);
        CHECK(std::string(e.kind()) == "ParseError");
    }

    try {
        parse_stream({"|a|\nx *nowhere\n"});
        FAIL("expected EvalError");
    } catch (const EvalError& e) {
        CHECK(std::string(e.kind()) == "EvalError");
    }
}

TEST_CASE("StreamParser refuses writes after end", "[stream][state]") {
    StreamParser stream;
    Collector out;
    out.attach(stream);

    CHECK(stream.state() == StreamState::Idle);
    stream.end();
    CHECK(stream.is_ended());
    CHECK(stream.state() == StreamState::Ended);

    try {
        stream.write("|a|\nx 1");
        FAIL("expected StreamError");
    } catch (const StreamError& e) {
        CHECK(e.code() == ErrorCode::StreamClosed);
    }

    // A second end() is a no-op
    stream.end();
    CHECK(out.ends == 1);
}

TEST_CASE("StreamParser refuses writes from its own callbacks", "[stream][state]") {
    StreamParser stream;
    stream.on_chunk([&stream](const Chunk&) {
        CHECK(stream.state() == StreamState::Emitting);
        stream.write("more");
    });

    CHECK_THROWS_AS(stream.write("|a|\nx 1|b|\ny 2"), StreamError);
}

TEST_CASE("StreamParser state names", "[stream][state]") {
    CHECK(std::string(stream_state_name(StreamState::Buffering)) == "buffering");
    CHECK(std::string(stream_state_name(StreamState::Ended)) == "ended");
}
