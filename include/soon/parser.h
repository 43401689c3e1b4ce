/**
 * @file parser.h
 * @brief Builds a syntax tree from SOON tokens
 *
 * The grammar has no brackets: each key line is classified by its line tail
 * (the tokens after the key) and by whether an indented block follows.
 *
 *   key                      null (or nested object when a block follows)
 *   key v                    scalar
 *   key v1 v2 v3             array of scalars
 *   key a:1 b:2              array of inline records (rows may follow)
 *   key h1 h2 + rows         table: rows become records keyed by h1, h2
 *
 * Lookahead is bounded and the parser never backtracks.
 */

#pragma once

#include "soon/ast.h"
#include "soon/token.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace soon {

struct ParserOptions {
    bool allow_duplicate_keys = false;  // last value wins instead of an error
    int max_depth = 100;                // nested block limit
    bool strict = false;                // malformed lines are errors, not skipped
    bool streaming = false;             // parsing one stream chunk payload
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens, const ParserOptions& options = ParserOptions{});

    /**
     * @brief Parse the whole token stream
     * @throws ParseError
     */
    std::unique_ptr<RootNode> parse();

private:
    using KeyIndex = std::unordered_map<std::string, size_t>;

    // Token access
    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool check(TokenType type) const { return peek().type == type; }
    void skip_newlines();
    std::vector<Token> collect_line_tail();

    // Block lookahead: NEWLINE+ INDENT
    bool followed_by_block(size_t from = 0) const;
    void open_block(int depth, const Position& at);
    void enter_rows();
    void skip_block();
    void skip_trailing_block(const char* what);

    // Top level
    void parse_top_level(RootNode& root, KeyIndex& keys);
    void add_root_entry(RootNode& root, KeyIndex& keys, const std::string& key,
                        NodePtr node, const Position& at);
    void parse_chunk_delimiter();
    NodePtr parse_literal_line();
    std::unique_ptr<AnchorDefNode> parse_anchor_line(int depth);

    // Key lines and their values
    std::unique_ptr<PropertyNode> parse_property(int depth);
    NodePtr parse_value(const Position& owner, int depth, bool& implicit);
    std::unique_ptr<ObjectNode> parse_object_block(int depth);
    NodePtr parse_inline_rows(const std::vector<Token>& first_row, const Position& at);
    NodePtr parse_table(const std::vector<Token>& headers, const Position& at);
    NodePtr tail_to_node(const std::vector<Token>& tail, const Position& at);
    static bool all_identifiers(const std::vector<Token>& tokens);

    // Inline records
    static bool has_inline_colon(const std::vector<Token>& tokens);
    std::unique_ptr<ObjectNode> build_inline_record(const std::vector<Token>& tokens, const Position& at);
    void merge_inline_record(const std::vector<Token>& tokens, ObjectNode& target, KeyIndex& keys);

    // Literals
    NodePtr token_to_node(const Token& token);
    double parse_number(const Token& token) const;

    void add_property(ObjectNode& object, KeyIndex& keys, std::unique_ptr<PropertyNode> property);
    void check_duplicate(const KeyIndex& keys, const std::string& key, const Position& at) const;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    ParserOptions options_;
};

} // namespace soon
