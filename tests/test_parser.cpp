#include <catch2/catch_test_macros.hpp>

#include "soon/errors.h"
#include "soon/lexer.h"
#include "soon/parser.h"

#include <string>

using namespace soon;

namespace {

std::unique_ptr<RootNode> parse_text(const std::string& text, const ParserOptions& options = ParserOptions{}) {
    Lexer lexer(text);
    Parser parser(lexer.tokenize(), options);
    return parser.parse();
}

ErrorCode parse_error_code(const std::string& text, const ParserOptions& options = ParserOptions{}) {
    try {
        parse_text(text, options);
    } catch (const ParseError& e) {
        return e.code();
    }
    FAIL("expected ParseError for: " << text);
    return ErrorCode::UnexpectedToken;
}

const PropertyNode& property_at(const RootNode& root, size_t index) {
    REQUIRE(root.body.size() > index);
    REQUIRE(root.body[index]->type == NodeType::Property);
    return static_cast<const PropertyNode&>(*root.body[index]);
}

ParserOptions strict_options() {
    ParserOptions options;
    options.strict = true;
    return options;
}

} // namespace

TEST_CASE("Parser builds a property per key line", "[parser]") {
    auto root = parse_text("name John\nage 30");

    REQUIRE(root->body.size() == 2);
    const auto& name = property_at(*root, 0);
    CHECK(name.key == "name");
    REQUIRE(name.value->type == NodeType::Literal);
    CHECK(static_cast<const LiteralNode&>(*name.value).value.as_string() == "John");

    const auto& age = property_at(*root, 1);
    REQUIRE(age.value->type == NodeType::Literal);
    const auto& literal = static_cast<const LiteralNode&>(*age.value);
    CHECK(literal.source_token == TokenType::Number);
    CHECK(literal.value.as_number() == 30);
}

TEST_CASE("Parser marks a bare key as an implicit null", "[parser]") {
    auto root = parse_text("flag");
    const auto& flag = property_at(*root, 0);
    CHECK(flag.implicit_value);
    CHECK(static_cast<const LiteralNode&>(*flag.value).value.is_null());

    auto explicit_null = parse_text("flag null");
    CHECK_FALSE(property_at(*explicit_null, 0).implicit_value);
}

TEST_CASE("Parser turns a key with a block into an object", "[parser]") {
    auto root = parse_text("user\n  name Alice\n  city NYC");
    const auto& user = property_at(*root, 0);

    REQUIRE(user.value->type == NodeType::Object);
    const auto& object = static_cast<const ObjectNode&>(*user.value);
    REQUIRE(object.properties.size() == 2);
    CHECK(object.properties[0]->key == "name");
    CHECK(object.properties[1]->key == "city");
}

TEST_CASE("Parser turns several values into an array", "[parser]") {
    auto root = parse_text("items 1 2 3");
    const auto& items = property_at(*root, 0);

    REQUIRE(items.value->type == NodeType::Array);
    CHECK(static_cast<const ArrayNode&>(*items.value).elements.size() == 3);
}

TEST_CASE("Parser reads identifier headers with rows as a table", "[parser][table]") {
    auto root = parse_text("users name age\n  Alice 25\n  Bob 30");
    const auto& users = property_at(*root, 0);

    REQUIRE(users.value->type == NodeType::Array);
    const auto& rows = static_cast<const ArrayNode&>(*users.value);
    REQUIRE(rows.elements.size() == 2);
    REQUIRE(rows.elements[0]->type == NodeType::Object);
    const auto& first = static_cast<const ObjectNode&>(*rows.elements[0]);
    REQUIRE(first.properties.size() == 2);
    CHECK(first.properties[0]->key == "name");
    CHECK(first.properties[1]->key == "age");
}

TEST_CASE("Parser table rows are positional", "[parser][table]") {
    auto root = parse_text("t a b c\n  1 2\n  1 2 3 4");
    const auto& rows = static_cast<const ArrayNode&>(*property_at(*root, 0).value);

    REQUIRE(rows.elements.size() == 2);
    CHECK(static_cast<const ObjectNode&>(*rows.elements[0]).properties.size() == 2);
    CHECK(static_cast<const ObjectNode&>(*rows.elements[1]).properties.size() == 3);

    CHECK(parse_error_code("t a b\n  1 2 3", strict_options()) == ErrorCode::UnexpectedToken);
}

TEST_CASE("Parser rejects duplicate table headers", "[parser][table]") {
    CHECK(parse_error_code("t a a\n  1 2") == ErrorCode::DuplicateKey);
}

TEST_CASE("Parser reads inline records", "[parser][inline]") {
    auto root = parse_text("point x:10 y:20");
    const auto& point = property_at(*root, 0);

    // A single inline record on a key line is an array of one record
    REQUIRE(point.value->type == NodeType::Array);
    const auto& rows = static_cast<const ArrayNode&>(*point.value);
    REQUIRE(rows.elements.size() == 1);
    CHECK(static_cast<const ObjectNode&>(*rows.elements[0]).properties.size() == 2);
}

TEST_CASE("Parser collects inline rows under a key", "[parser][inline]") {
    auto root = parse_text("events kind:open at:1\n  kind:close\n  kind:open at:5");
    const auto& rows = static_cast<const ArrayNode&>(*property_at(*root, 0).value);
    CHECK(rows.elements.size() == 3);
}

TEST_CASE("Parser merges inline pairs inside an object block", "[parser][inline]") {
    auto root = parse_text("point\n  x:10 y:20\n  label origin");
    const auto& point = property_at(*root, 0);

    REQUIRE(point.value->type == NodeType::Object);
    const auto& object = static_cast<const ObjectNode&>(*point.value);
    REQUIRE(object.properties.size() == 3);
    CHECK(object.properties[0]->key == "x");
    CHECK(object.properties[1]->key == "y");
    CHECK(object.properties[2]->key == "label");
}

TEST_CASE("Parser fills missing inline values with null unless strict", "[parser][inline]") {
    auto root = parse_text("p x: y:2");
    const auto& rows = static_cast<const ArrayNode&>(*property_at(*root, 0).value);
    const auto& record = static_cast<const ObjectNode&>(*rows.elements[0]);
    REQUIRE(record.properties.size() == 2);
    CHECK(static_cast<const LiteralNode&>(*record.properties[0]->value).value.is_null());

    CHECK(parse_error_code("p x: y:2", strict_options()) == ErrorCode::MalformedInlineRow);
}

TEST_CASE("Parser merges a root inline record into the root", "[parser][inline]") {
    auto root = parse_text("x:10 y:20");
    REQUIRE(root->body.size() == 2);
    CHECK(property_at(*root, 0).key == "x");
    CHECK(property_at(*root, 1).key == "y");
}

TEST_CASE("Parser rejects duplicate keys by default", "[parser][duplicates]") {
    CHECK(parse_error_code("a 1\na 2") == ErrorCode::DuplicateKey);
    CHECK(parse_error_code("obj\n  a 1\n  a 2") == ErrorCode::DuplicateKey);
    CHECK(parse_error_code("p a:1 a:2") == ErrorCode::DuplicateKey);

    try {
        parse_text("obj\n  a 1\n  a 2");
    } catch (const ParseError& e) {
        CHECK(e.line() == 3);
        CHECK(e.column() == 3);
    }
}

TEST_CASE("Parser keeps the last duplicate in the first slot when allowed", "[parser][duplicates]") {
    ParserOptions options;
    options.allow_duplicate_keys = true;
    auto root = parse_text("a 1\nb 2\na 3", options);

    REQUIRE(root->body.size() == 2);
    const auto& a = property_at(*root, 0);
    CHECK(a.key == "a");
    CHECK(static_cast<const LiteralNode&>(*a.value).value.as_number() == 3);
}

TEST_CASE("Parser enforces the maximum depth", "[parser]") {
    ParserOptions options;
    options.max_depth = 2;

    CHECK_NOTHROW(parse_text("a\n  b\n    c 1", options));
    CHECK(parse_error_code("a\n  b\n    c\n      d 1", options) == ErrorCode::MaxDepthExceeded);
}

TEST_CASE("Parser does not count row blocks against the maximum depth", "[parser]") {
    ParserOptions options;
    options.max_depth = 1;

    CHECK_NOTHROW(parse_text("a\n  b 1", options));

    auto table = parse_text("a\n  t x y\n    1 2", options);
    const auto& a = property_at(*table, 0);
    const auto& t = *static_cast<const ObjectNode&>(*a.value).properties.front();
    CHECK(t.key == "t");
    CHECK(static_cast<const ArrayNode&>(*t.value).elements.size() == 1);

    auto rows = parse_text("a\n  t x:1\n    x:2", options);
    const auto& r = *static_cast<const ObjectNode&>(*property_at(*rows, 0).value).properties.front();
    CHECK(static_cast<const ArrayNode&>(*r.value).elements.size() == 2);

    CHECK(parse_error_code("a\n  b\n    c 1", options) == ErrorCode::MaxDepthExceeded);
}

TEST_CASE("Parser rejects invalid dates and out of range numbers", "[parser][literals]") {
    CHECK(parse_error_code("d 2024-02-30") == ErrorCode::InvalidDate);
    CHECK(parse_error_code("n 1e999") == ErrorCode::NumberOutOfRange);

    auto big = parse_text("n 12345678901234567890");
    const auto& n = static_cast<const LiteralNode&>(*property_at(*big, 0).value);
    CHECK(n.value.as_number() > 1.2e19);
}

TEST_CASE("Parser skips chunk delimiters outside a stream", "[parser][stream]") {
    auto root = parse_text("|c1|\nname John");
    REQUIRE(root->body.size() == 1);
    CHECK(property_at(*root, 0).key == "name");

    ParserOptions options;
    options.streaming = true;
    CHECK(parse_error_code("|c1|\nname John", options) == ErrorCode::UnexpectedToken);
}

TEST_CASE("Parser skips stray blocks unless strict", "[parser][strict]") {
    auto root = parse_text("a 1\n  b 2\nc 3");
    REQUIRE(root->body.size() == 2);
    CHECK(property_at(*root, 1).key == "c");

    CHECK(parse_error_code("a 1\n  b 2", strict_options()) == ErrorCode::UnexpectedToken);
}

TEST_CASE("Parser rejects a line starting with a colon", "[parser]") {
    CHECK(parse_error_code(": x") == ErrorCode::UnexpectedToken);
}

TEST_CASE("Parser builds anchor nodes", "[parser][anchors]") {
    auto root = parse_text("base &b 1\ncopy *b");

    const auto& base = property_at(*root, 0);
    REQUIRE(base.value->type == NodeType::AnchorDef);
    CHECK(static_cast<const AnchorDefNode&>(*base.value).name == "b");

    const auto& copy = property_at(*root, 1);
    REQUIRE(copy.value->type == NodeType::AnchorRef);
    CHECK(static_cast<const AnchorRefNode&>(*copy.value).name == "b");
}

TEST_CASE("Parser treats a lone quoted string as a literal line", "[parser]") {
    auto root = parse_text("\"just text\"");
    REQUIRE(root->body.size() == 1);
    CHECK(root->body[0]->type == NodeType::Literal);
}

TEST_CASE("Node type names", "[parser]") {
    CHECK(std::string(node_type_name(NodeType::AnchorRef)) == "AnchorRef");
}
