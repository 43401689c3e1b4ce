/**
 * @file lexer.h
 * @brief Indentation-aware tokenizer for SOON text
 *
 * Converts source text into a flat token stream with synthetic INDENT and
 * DEDENT tokens. Indentation is tracked with a stack of widths starting at
 * zero; blank and comment-only lines never change it. Every successful
 * tokenize() emits as many DEDENTs as INDENTs.
 */

#pragma once

#include "soon/token.h"

#include <string>
#include <vector>

namespace soon {

class Lexer {
public:
    explicit Lexer(std::string source);

    /**
     * @brief Tokenize the whole input
     * @return Tokens ending with EOF; comments are dropped
     * @throws LexError on an unexpected character, unterminated string or
     *         a dedent to an unknown indentation level
     */
    std::vector<Token> tokenize();

    /// Next token including comments; EOF repeats once reached
    Token next_token();

    /// True for bytes that may appear in a bare word
    static bool is_word_char(char c);

private:
    char peek(size_t ahead = 0) const;
    char advance();
    bool at_end() const { return pos_ >= source_.size(); }
    Position here() const;

    // Handles the leading whitespace of a line; returns true if a token was produced
    bool handle_line_start(Token& out);
    void skip_inline_whitespace();

    Token read_comment();
    Token read_string();
    Token read_number_or_date();
    Token read_word();
    Token read_anchor_or_reference(TokenType type);

    std::string source_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    bool at_line_start_ = true;

    std::vector<int> indent_stack_{0};
    int pending_dedents_ = 0;
    Position pending_position_;
};

} // namespace soon
