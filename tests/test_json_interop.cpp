#include <catch2/catch_test_macros.hpp>

#include "soon/errors.h"
#include "soon/json_interop.h"
#include "soon/soon.h"

#include <limits>
#include <string>

using namespace soon;
using ordered_json = nlohmann::ordered_json;

TEST_CASE("to_json keeps member order", "[json]") {
    CHECK(to_json("name John\nage 30", ParserOptions{}, -1) == R"({"name":"John","age":30})");
    CHECK(to_json("b 1\na 2", ParserOptions{}, -1) == R"({"b":1,"a":2})");
}

TEST_CASE("to_json pretty prints with the requested indent", "[json]") {
    CHECK(to_json("a 1") == "{\n  \"a\": 1\n}");
    CHECK(to_json("a 1", ParserOptions{}, 4) == "{\n    \"a\": 1\n}");
}

TEST_CASE("to_json writes dates as ISO strings", "[json]") {
    CHECK(to_json("d 2024-01-15", ParserOptions{}, -1) == R"({"d":"2024-01-15T00:00:00.000Z"})");
}

TEST_CASE("to_json propagates decode errors", "[json]") {
    CHECK_THROWS_AS(to_json("a 1\na 2"), ParseError);

    ParserOptions options;
    options.allow_duplicate_keys = true;
    CHECK(to_json("a 1\na 2", options, -1) == R"({"a":2})");
}

TEST_CASE("from_json writes SOON text", "[json]") {
    SerializerOptions compact;
    compact.compact = true;
    CHECK(from_json(R"({"x":10,"y":20})", compact) == "x:10 y:20");
    CHECK(from_json(R"({"name":"John","tags":["a","b"]})") == "name John\ntags a b");
    CHECK(from_json("\"true\"") == "\"true\"");
}

TEST_CASE("from_json rejects malformed JSON", "[json][errors]") {
    try {
        from_json("{\"a\": ");
        FAIL("expected JsonError");
    } catch (const JsonError& e) {
        CHECK(e.code() == ErrorCode::InvalidJson);
    }
}

TEST_CASE("JSON to SOON to JSON preserves the document", "[json]") {
    const std::string json_text =
        R"({"users":[{"name":"Alice","age":25},{"name":"Bob","age":30}],)"
        R"("tags":["a","b"],"nested":{"deep":{"flag":true,"none":null}},"ratio":0.25})";

    std::string soon_text = from_json(json_text);
    CHECK(to_json(soon_text, ParserOptions{}, -1) == json_text);
}

TEST_CASE("to_json_value maps special values", "[json]") {
    CHECK(to_json_value(Value(std::numeric_limits<double>::infinity())).is_null());
    CHECK(to_json_value(Value(DateTime::invalid())).is_null());
    CHECK(to_json_value(Value(Binary{'M', 'a', 'n'})) == "TWFu");
    CHECK(to_json_value(Value(3.0)).is_number_integer());
    CHECK(to_json_value(Value(3.5)).is_number_float());
    CHECK(to_json_value(Value(1e300)).is_number_float());
}

TEST_CASE("from_json_value maps every JSON kind", "[json]") {
    ordered_json json = ordered_json::parse(R"({"n":null,"b":false,"i":-7,"u":7,"f":1.5,"s":"x","a":[1],"o":{}})");
    Value value = from_json_value(json);

    REQUIRE(value.is_object());
    CHECK(value["n"].is_null());
    CHECK(value["b"] == Value(false));
    CHECK(value["i"] == Value(-7));
    CHECK(value["u"] == Value(7));
    CHECK(value["f"] == Value(1.5));
    CHECK(value["s"] == Value("x"));
    CHECK(value["a"] == Value(Array{1}));
    CHECK(value["o"] == Value(Object{}));
    CHECK(value.as_object().keys().front() == "n");
}
