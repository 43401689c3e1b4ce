#include <catch2/catch_test_macros.hpp>

#include "soon/errors.h"
#include "soon/lexer.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace soon;

namespace {

std::vector<TokenType> types_of(const std::string& source) {
    Lexer lexer(source);
    std::vector<TokenType> types;
    for (const auto& token : lexer.tokenize()) {
        types.push_back(token.type);
    }
    return types;
}

long count_of(const std::vector<TokenType>& types, TokenType type) {
    return std::count(types.begin(), types.end(), type);
}

} // namespace

TEST_CASE("Lexer splits a key line into words", "[lexer]") {
    Lexer lexer("name John");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].type == TokenType::Identifier);
    CHECK(tokens[0].text == "name");
    CHECK(tokens[1].type == TokenType::Identifier);
    CHECK(tokens[1].text == "John");
    CHECK(tokens[2].type == TokenType::Eof);
}

TEST_CASE("Lexer emits INDENT and DEDENT around blocks", "[lexer][indent]") {
    auto types = types_of("a\n  b 1\nc 2");
    std::vector<TokenType> expected{
        TokenType::Identifier, TokenType::Newline,
        TokenType::Indent, TokenType::Identifier, TokenType::Number, TokenType::Newline,
        TokenType::Dedent, TokenType::Identifier, TokenType::Number,
        TokenType::Eof,
    };
    CHECK(types == expected);
}

TEST_CASE("Lexer closes open blocks at end of input", "[lexer][indent]") {
    auto types = types_of("a\n  b\n    c");
    CHECK(count_of(types, TokenType::Indent) == 2);
    CHECK(count_of(types, TokenType::Dedent) == 2);
    CHECK(types.back() == TokenType::Eof);
}

TEST_CASE("Lexer ignores blank and comment-only lines for indentation", "[lexer][indent]") {
    auto types = types_of("a\n  b 1\n\n# note\n  c 2");
    CHECK(count_of(types, TokenType::Indent) == 1);
    CHECK(count_of(types, TokenType::Dedent) == 1);
}

TEST_CASE("Lexer rejects a dedent to an unknown level", "[lexer][indent]") {
    Lexer lexer("a\n    b\n  c");
    try {
        lexer.tokenize();
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.code() == ErrorCode::InconsistentIndentation);
        CHECK(e.line() == 3);
    }
}

TEST_CASE("Lexer recognizes literal kinds", "[lexer][literals]") {
    Lexer lexer("true false null 42 -3.5 1e10 2024-01-15 \"hi there\"");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens.size() == 9);
    CHECK(tokens[0].type == TokenType::Boolean);
    CHECK(tokens[1].type == TokenType::Boolean);
    CHECK(tokens[2].type == TokenType::Null);
    CHECK(tokens[3].type == TokenType::Number);
    CHECK(tokens[4].type == TokenType::Number);
    CHECK(tokens[4].text == "-3.5");
    CHECK(tokens[5].type == TokenType::Number);
    CHECK(tokens[6].type == TokenType::Date);
    CHECK(tokens[7].type == TokenType::String);
    CHECK(tokens[7].text == "hi there");
    REQUIRE(tokens[7].raw);
    CHECK(*tokens[7].raw == "\"hi there\"");
}

TEST_CASE("Lexer reads full timestamps as one DATE", "[lexer][literals]") {
    Lexer lexer("at 2024-01-15T10:30:00.250+01:00 next");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens.size() == 4);
    CHECK(tokens[1].type == TokenType::Date);
    CHECK(tokens[1].text == "2024-01-15T10:30:00.250+01:00");
    CHECK(tokens[2].text == "next");
}

TEST_CASE("Lexer treats numbers glued to word characters as strings", "[lexer][literals]") {
    Lexer lexer("1e 123abc 1.2.3 2024-01-15x");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens.size() == 5);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(tokens[i].type == TokenType::String);
    }
    CHECK(tokens[0].text == "1e");
    CHECK(tokens[1].text == "123abc");
    CHECK(tokens[2].text == "1.2.3");
    CHECK(tokens[3].text == "2024-01-15x");
}

TEST_CASE("Lexer resolves string escapes", "[lexer][strings]") {
    Lexer lexer("\"a\\\"b\\\\c\\nd\\te\"");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens[0].type == TokenType::String);
    CHECK(tokens[0].text == "a\"b\\c\nd\te");
}

TEST_CASE("Lexer reports unterminated strings at the opening quote", "[lexer][strings]") {
    Lexer lexer("x \"abc\ny 1");
    try {
        lexer.tokenize();
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.code() == ErrorCode::UnterminatedString);
        CHECK(e.line() == 1);
        CHECK(e.column() == 3);
    }
}

TEST_CASE("Lexer reads anchors and references", "[lexer]") {
    Lexer lexer("&base *base");
    auto tokens = lexer.tokenize();

    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].type == TokenType::Anchor);
    CHECK(tokens[0].text == "base");
    CHECK(tokens[1].type == TokenType::Reference);
    CHECK(tokens[1].text == "base");

    Lexer bare("& x");
    CHECK_THROWS_AS(bare.tokenize(), LexError);
}

TEST_CASE("Lexer emits colons and pipes", "[lexer]") {
    auto inline_types = types_of("x:10");
    CHECK(inline_types == std::vector<TokenType>{
        TokenType::Identifier, TokenType::Colon, TokenType::Number, TokenType::Eof});

    auto chunk_types = types_of("|c1|");
    CHECK(chunk_types == std::vector<TokenType>{
        TokenType::Pipe, TokenType::Identifier, TokenType::Pipe, TokenType::Eof});
}

TEST_CASE("Lexer drops comments from tokenize but next_token returns them", "[lexer][comments]") {
    auto types = types_of("a 1 # note\nb 2");
    CHECK(count_of(types, TokenType::Comment) == 0);
    CHECK(types == std::vector<TokenType>{
        TokenType::Identifier, TokenType::Number, TokenType::Newline,
        TokenType::Identifier, TokenType::Number, TokenType::Eof});

    Lexer lexer("# hello");
    Token comment = lexer.next_token();
    CHECK(comment.type == TokenType::Comment);
    CHECK(comment.text == " hello");
    CHECK(lexer.next_token().type == TokenType::Eof);
}

TEST_CASE("Lexer rejects characters outside the grammar", "[lexer]") {
    Lexer lexer("a $");
    try {
        lexer.tokenize();
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.code() == ErrorCode::UnexpectedCharacter);
        CHECK(e.column() == 3);
    }
}

TEST_CASE("Lexer tracks positions", "[lexer]") {
    Lexer lexer("a\n  bb");
    auto tokens = lexer.tokenize();

    auto it = std::find_if(tokens.begin(), tokens.end(),
                           [](const Token& t) { return t.text == "bb"; });
    REQUIRE(it != tokens.end());
    CHECK(it->line() == 2);
    CHECK(it->column() == 3);
    CHECK(it->position.offset == 4);
}

TEST_CASE("Lexer accepts CRLF line endings and UTF-8 words", "[lexer]") {
    auto types = types_of("a 1\r\nb 2");
    CHECK(types == std::vector<TokenType>{
        TokenType::Identifier, TokenType::Number, TokenType::Newline,
        TokenType::Identifier, TokenType::Number, TokenType::Eof});

    Lexer lexer("name Zo\xC3\xAB");
    auto tokens = lexer.tokenize();
    REQUIRE(tokens.size() == 3);
    CHECK(tokens[1].type == TokenType::Identifier);
    CHECK(tokens[1].text == "Zo\xC3\xAB");
}

TEST_CASE("Token type names", "[lexer]") {
    CHECK(std::string(token_type_name(TokenType::Indent)) == "INDENT");
    CHECK(std::string(token_type_name(TokenType::Reference)) == "REFERENCE");
}
