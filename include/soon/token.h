/**
 * @file token.h
 * @brief Lexical tokens produced by the Lexer
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace soon {

enum class TokenType {
    Null,
    Boolean,
    Number,
    String,
    Date,
    Identifier,
    Colon,
    Pipe,
    Anchor,      // &name
    Reference,   // *name
    Newline,
    Indent,
    Dedent,
    Eof,
    Comment
};

const char* token_type_name(TokenType type);

/**
 * @brief Source location, 1-based line/column plus byte offset
 */
struct Position {
    int line = 1;
    int column = 1;
    size_t offset = 0;
};

struct Token {
    TokenType type = TokenType::Eof;
    std::string text;                 // decoded text (escapes resolved for strings)
    Position position;
    std::optional<std::string> raw;   // original quoted form of a String token

    Token() = default;
    Token(TokenType type, std::string text, Position position)
        : type(type), text(std::move(text)), position(position) {}

    int line() const { return position.line; }
    int column() const { return position.column; }

    /// Tokens that can appear as a value: literals, identifiers, references
    bool is_value() const {
        return type == TokenType::Null || type == TokenType::Boolean ||
               type == TokenType::Number || type == TokenType::String ||
               type == TokenType::Date || type == TokenType::Identifier ||
               type == TokenType::Reference;
    }

    /// Tokens that end the current line
    bool ends_line() const {
        return type == TokenType::Newline || type == TokenType::Indent ||
               type == TokenType::Dedent || type == TokenType::Eof;
    }
};

} // namespace soon
