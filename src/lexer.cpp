/**
 * @file lexer.cpp
 * @brief SOON tokenizer
 */

#include "soon/lexer.h"
#include "soon/date_time.h"
#include "soon/errors.h"

#include <cctype>

namespace soon {

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::Null:       return "NULL";
        case TokenType::Boolean:    return "BOOLEAN";
        case TokenType::Number:     return "NUMBER";
        case TokenType::String:     return "STRING";
        case TokenType::Date:       return "DATE";
        case TokenType::Identifier: return "IDENTIFIER";
        case TokenType::Colon:      return "COLON";
        case TokenType::Pipe:       return "PIPE";
        case TokenType::Anchor:     return "ANCHOR";
        case TokenType::Reference:  return "REFERENCE";
        case TokenType::Newline:    return "NEWLINE";
        case TokenType::Indent:     return "INDENT";
        case TokenType::Dedent:     return "DEDENT";
        case TokenType::Eof:        return "EOF";
        case TokenType::Comment:    return "COMMENT";
    }
    return "UNKNOWN";
}

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string describe_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (std::isprint(uc)) {
        return std::string("'") + c + "'";
    }
    static const char* hex = "0123456789ABCDEF";
    return std::string("0x") + hex[uc >> 4] + hex[uc & 0xF];
}

} // anonymous namespace

Lexer::Lexer(std::string source) : source_(std::move(source)) {}

bool Lexer::is_word_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 0x80) return true;  // UTF-8 continuation and lead bytes
    return std::isalnum(uc) || c == '_' || c == '-' || c == '.' ||
           c == '/' || c == '@' || c == '+';
}

char Lexer::peek(size_t ahead) const {
    size_t p = pos_ + ahead;
    return p < source_.size() ? source_[p] : '\0';
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

Position Lexer::here() const {
    Position p;
    p.line = line_;
    p.column = column_;
    p.offset = pos_;
    return p;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        Token tok = next_token();
        if (tok.type == TokenType::Comment) {
            continue;
        }
        bool done = tok.type == TokenType::Eof;
        tokens.push_back(std::move(tok));
        if (done) break;
    }
    return tokens;
}

Token Lexer::next_token() {
    if (pending_dedents_ > 0) {
        --pending_dedents_;
        return Token(TokenType::Dedent, "", pending_position_);
    }

    while (true) {
        if (at_line_start_) {
            Token indent_tok;
            if (handle_line_start(indent_tok)) {
                return indent_tok;
            }
        }

        skip_inline_whitespace();

        if (at_end()) {
            if (indent_stack_.size() > 1) {
                indent_stack_.pop_back();
                return Token(TokenType::Dedent, "", here());
            }
            return Token(TokenType::Eof, "", here());
        }

        char c = peek();

        if (c == '\r') {
            advance();
            continue;
        }

        if (c == '\n') {
            Position start = here();
            advance();
            at_line_start_ = true;
            return Token(TokenType::Newline, "\n", start);
        }

        if (c == '#') return read_comment();
        if (c == '"') return read_string();

        if (c == ':') {
            Position start = here();
            advance();
            return Token(TokenType::Colon, ":", start);
        }
        if (c == '|') {
            Position start = here();
            advance();
            return Token(TokenType::Pipe, "|", start);
        }
        if (c == '&') return read_anchor_or_reference(TokenType::Anchor);
        if (c == '*') return read_anchor_or_reference(TokenType::Reference);

        if (is_digit(c) || (c == '-' && is_digit(peek(1)))) {
            return read_number_or_date();
        }
        if (is_word_char(c)) {
            return read_word();
        }

        Position start = here();
        throw LexError(ErrorCode::UnexpectedCharacter,
                       "Unexpected character " + describe_char(c),
                       start.line, start.column);
    }
}

bool Lexer::handle_line_start(Token& out) {
    at_line_start_ = false;

    int width = 0;
    while (peek() == ' ') {
        advance();
        ++width;
    }

    // Blank and comment-only lines leave indentation untouched
    char c = peek();
    if (at_end() || c == '\n' || c == '\r' || c == '#') {
        return false;
    }

    Position start = here();
    int top = indent_stack_.back();

    if (width > top) {
        indent_stack_.push_back(width);
        out = Token(TokenType::Indent, "", start);
        return true;
    }

    if (width < top) {
        int pops = 0;
        while (indent_stack_.size() > 1 && indent_stack_.back() > width) {
            indent_stack_.pop_back();
            ++pops;
        }
        if (indent_stack_.back() != width) {
            throw LexError(ErrorCode::InconsistentIndentation,
                           "Dedent to column " + std::to_string(width + 1) +
                           " does not match any outer indentation level",
                           start.line, start.column);
        }
        pending_dedents_ = pops - 1;
        pending_position_ = start;
        out = Token(TokenType::Dedent, "", start);
        return true;
    }

    return false;
}

void Lexer::skip_inline_whitespace() {
    while (!at_end() && (peek() == ' ' || peek() == '\t')) {
        advance();
    }
}

Token Lexer::read_comment() {
    Position start = here();
    advance();  // '#'
    size_t begin = pos_;
    while (!at_end() && peek() != '\n') {
        advance();
    }
    std::string text = source_.substr(begin, pos_ - begin);
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return Token(TokenType::Comment, text, start);
}

Token Lexer::read_string() {
    Position start = here();
    advance();  // opening quote

    std::string value;
    while (true) {
        if (at_end() || peek() == '\n') {
            throw LexError(ErrorCode::UnterminatedString, "Unterminated string",
                           start.line, start.column);
        }
        char c = advance();
        if (c == '"') {
            break;
        }
        if (c == '\\') {
            if (at_end() || peek() == '\n') {
                throw LexError(ErrorCode::UnterminatedString, "Unterminated string",
                               start.line, start.column);
            }
            char esc = advance();
            switch (esc) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default:  value += esc; break;  // covers \" and \\ as well
            }
            continue;
        }
        value += c;
    }

    Token tok(TokenType::String, value, start);
    tok.raw = source_.substr(start.offset, pos_ - start.offset);
    return tok;
}

Token Lexer::read_number_or_date() {
    Position start = here();

    if (is_digit(peek())) {
        size_t len = match_iso8601(source_, pos_);
        if (len > 0 && (pos_ + len >= source_.size() || !is_word_char(source_[pos_ + len]))) {
            for (size_t i = 0; i < len; ++i) advance();
            return Token(TokenType::Date, source_.substr(start.offset, len), start);
        }
    }

    if (peek() == '-') advance();
    while (is_digit(peek())) advance();

    if (peek() == '.' && is_digit(peek(1))) {
        advance();
        while (is_digit(peek())) advance();
    }

    // Exponent only when digits follow: "1e" stays a word
    if (peek() == 'e' || peek() == 'E') {
        char next = peek(1);
        if (is_digit(next) || ((next == '+' || next == '-') && is_digit(peek(2)))) {
            advance();
            if (peek() == '+' || peek() == '-') advance();
            while (is_digit(peek())) advance();
        }
    }

    // Digits glued to word characters form a plain string (123abc, 1.2.3)
    if (!at_end() && is_word_char(peek())) {
        while (!at_end() && is_word_char(peek())) advance();
        return Token(TokenType::String, source_.substr(start.offset, pos_ - start.offset), start);
    }

    return Token(TokenType::Number, source_.substr(start.offset, pos_ - start.offset), start);
}

Token Lexer::read_word() {
    Position start = here();
    while (!at_end() && is_word_char(peek())) {
        advance();
    }
    std::string word = source_.substr(start.offset, pos_ - start.offset);

    if (word == "true" || word == "false") return Token(TokenType::Boolean, word, start);
    if (word == "null") return Token(TokenType::Null, word, start);
    return Token(TokenType::Identifier, word, start);
}

Token Lexer::read_anchor_or_reference(TokenType type) {
    Position start = here();
    char sigil = advance();
    if (at_end() || !is_word_char(peek())) {
        throw LexError(ErrorCode::UnexpectedCharacter,
                       std::string("Expected a name after '") + sigil + "'",
                       start.line, start.column);
    }
    size_t begin = pos_;
    while (!at_end() && is_word_char(peek())) {
        advance();
    }
    return Token(type, source_.substr(begin, pos_ - begin), start);
}

} // namespace soon
