/**
 * @file parser.cpp
 * @brief SOON parser: token stream to syntax tree
 */

#include "soon/parser.h"
#include "soon/date_time.h"
#include "soon/errors.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace soon {

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Root:      return "Root";
        case NodeType::Object:    return "Object";
        case NodeType::Array:     return "Array";
        case NodeType::Property:  return "Property";
        case NodeType::Literal:   return "Literal";
        case NodeType::AnchorDef: return "AnchorDef";
        case NodeType::AnchorRef: return "AnchorRef";
    }
    return "Unknown";
}

namespace {

bool is_key_token(const Token& token) {
    return token.type == TokenType::Identifier || token.type == TokenType::String;
}

ParseError error_at(ErrorCode code, const std::string& message, const Position& at) {
    return ParseError(code, message, at.line, at.column);
}

} // anonymous namespace

Parser::Parser(std::vector<Token> tokens, const ParserOptions& options)
    : tokens_(std::move(tokens))
    , options_(options) {
    if (tokens_.empty() || tokens_.back().type != TokenType::Eof) {
        Position end = tokens_.empty() ? Position{} : tokens_.back().position;
        tokens_.emplace_back(TokenType::Eof, "", end);
    }
}

// =============================================================================
// Token access
// =============================================================================

const Token& Parser::peek(size_t ahead) const {
    size_t i = pos_ + ahead;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& token = peek();
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

void Parser::skip_newlines() {
    while (check(TokenType::Newline)) {
        advance();
    }
}

std::vector<Token> Parser::collect_line_tail() {
    std::vector<Token> tail;
    while (!peek().ends_line()) {
        tail.push_back(advance());
    }
    return tail;
}

bool Parser::followed_by_block(size_t from) const {
    size_t i = from;
    if (peek(i).type == TokenType::Indent) return true;
    if (peek(i).type != TokenType::Newline) return false;
    while (peek(i).type == TokenType::Newline) ++i;
    return peek(i).type == TokenType::Indent;
}

void Parser::open_block(int depth, const Position& at) {
    if (depth > options_.max_depth) {
        throw error_at(ErrorCode::MaxDepthExceeded,
                       "Maximum nesting depth of " + std::to_string(options_.max_depth) + " exceeded",
                       at);
    }
    skip_newlines();
    advance();  // INDENT
}

void Parser::enter_rows() {
    skip_newlines();
    advance();  // INDENT
}

void Parser::skip_block() {
    int depth = 1;
    while (depth > 0 && !check(TokenType::Eof)) {
        TokenType type = advance().type;
        if (type == TokenType::Indent) {
            ++depth;
        } else if (type == TokenType::Dedent) {
            --depth;
        }
    }
}

void Parser::skip_trailing_block(const char* what) {
    if (!followed_by_block()) {
        return;
    }
    skip_newlines();
    if (options_.strict) {
        throw error_at(ErrorCode::UnexpectedToken,
                       std::string("Unexpected indented block after ") + what,
                       peek().position);
    }
    advance();  // INDENT
    skip_block();
}

// =============================================================================
// Top level
// =============================================================================

std::unique_ptr<RootNode> Parser::parse() {
    auto root = std::make_unique<RootNode>(peek().position);
    KeyIndex keys;

    while (true) {
        skip_newlines();
        if (check(TokenType::Eof)) {
            break;
        }
        parse_top_level(*root, keys);
    }
    return root;
}

void Parser::parse_top_level(RootNode& root, KeyIndex& keys) {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::Pipe:
            parse_chunk_delimiter();
            return;

        case TokenType::Dedent:
            advance();
            return;

        case TokenType::Indent: {
            open_block(1, token.position);
            root.body.push_back(parse_object_block(1));
            return;
        }

        case TokenType::Colon:
            throw error_at(ErrorCode::UnexpectedToken, "Unexpected ':' at start of line", token.position);

        case TokenType::Anchor: {
            auto def = parse_anchor_line(0);
            std::string name = def->name;
            Position at = def->position;
            add_root_entry(root, keys, name, std::move(def), at);
            return;
        }

        case TokenType::Identifier:
        case TokenType::String: {
            if (peek(1).type == TokenType::Colon) {
                auto record = build_inline_record(collect_line_tail(), token.position);
                skip_trailing_block("inline record");
                for (auto& property : record->properties) {
                    std::string key = property->key;
                    Position at = property->position;
                    add_root_entry(root, keys, key, std::move(property), at);
                }
                return;
            }
            // A lone quoted string is a literal, not a key
            if (token.type == TokenType::String && peek(1).ends_line() && !followed_by_block(1)) {
                root.body.push_back(parse_literal_line());
                return;
            }
            auto property = parse_property(0);
            std::string key = property->key;
            Position at = property->position;
            add_root_entry(root, keys, key, std::move(property), at);
            return;
        }

        default:
            root.body.push_back(parse_literal_line());
            return;
    }
}

void Parser::add_root_entry(RootNode& root, KeyIndex& keys, const std::string& key,
                            NodePtr node, const Position& at) {
    auto it = keys.find(key);
    if (it == keys.end()) {
        keys.emplace(key, root.body.size());
        root.body.push_back(std::move(node));
        return;
    }
    check_duplicate(keys, key, at);
    root.body[it->second] = std::move(node);
}

void Parser::parse_chunk_delimiter() {
    Position open = advance().position;
    if (options_.streaming) {
        throw error_at(ErrorCode::UnexpectedToken, "Chunk delimiter inside a stream chunk", open);
    }

    // The chunk id only matters to the stream parser
    while (!peek().ends_line() && !check(TokenType::Pipe)) {
        advance();
    }
    if (check(TokenType::Pipe)) {
        advance();
        return;
    }
    if (options_.strict) {
        throw error_at(ErrorCode::UnexpectedToken, "Unterminated chunk delimiter", open);
    }
}

NodePtr Parser::parse_literal_line() {
    Position at = peek().position;
    std::vector<Token> tail = collect_line_tail();
    skip_trailing_block("value");
    return tail_to_node(tail, at);
}

std::unique_ptr<AnchorDefNode> Parser::parse_anchor_line(int depth) {
    const Token& anchor = advance();
    bool implicit = false;
    NodePtr value = parse_value(anchor.position, depth, implicit);
    return std::make_unique<AnchorDefNode>(anchor.text, std::move(value), anchor.position);
}

// =============================================================================
// Key lines
// =============================================================================

std::unique_ptr<PropertyNode> Parser::parse_property(int depth) {
    const Token& key = advance();

    const Token* anchor = nullptr;
    if (check(TokenType::Anchor)) {
        anchor = &advance();
    }

    bool implicit = false;
    NodePtr value = parse_value(key.position, depth, implicit);
    if (anchor) {
        value = std::make_unique<AnchorDefNode>(anchor->text, std::move(value), anchor->position);
        implicit = false;
    }

    auto property = std::make_unique<PropertyNode>(key.text, std::move(value), key.position);
    property->implicit_value = implicit;
    return property;
}

NodePtr Parser::parse_value(const Position& owner, int depth, bool& implicit) {
    std::vector<Token> tail = collect_line_tail();
    bool block = followed_by_block();

    if (tail.empty()) {
        if (block) {
            open_block(depth + 1, owner);
            return parse_object_block(depth + 1);
        }
        implicit = true;
        return std::make_unique<LiteralNode>(Value(), TokenType::Null, owner);
    }

    if (block) {
        // Row blocks do not add nesting, so max_depth is not checked here
        if (has_inline_colon(tail)) {
            enter_rows();
            return parse_inline_rows(tail, owner);
        }
        if (all_identifiers(tail)) {
            enter_rows();
            return parse_table(tail, owner);
        }
        skip_trailing_block("value");
    }

    return tail_to_node(tail, owner);
}

std::unique_ptr<ObjectNode> Parser::parse_object_block(int depth) {
    auto object = std::make_unique<ObjectNode>(peek().position);
    KeyIndex keys;

    while (true) {
        skip_newlines();
        const Token& token = peek();

        if (token.type == TokenType::Dedent) {
            advance();
            break;
        }
        if (token.type == TokenType::Eof) {
            break;
        }

        switch (token.type) {
            case TokenType::Identifier:
            case TokenType::String:
                if (peek(1).type == TokenType::Colon) {
                    // point
                    //   x:10 y:20
                    merge_inline_record(collect_line_tail(), *object, keys);
                    skip_trailing_block("inline record");
                } else {
                    add_property(*object, keys, parse_property(depth));
                }
                break;

            case TokenType::Anchor: {
                auto def = parse_anchor_line(depth);
                std::string name = def->name;
                Position at = def->position;
                add_property(*object, keys,
                             std::make_unique<PropertyNode>(name, std::move(def), at));
                break;
            }

            case TokenType::Indent:
                if (options_.strict) {
                    throw error_at(ErrorCode::UnexpectedToken, "Unexpected indentation", token.position);
                }
                advance();
                skip_block();
                break;

            default:
                if (options_.strict) {
                    throw error_at(ErrorCode::UnexpectedToken,
                                   std::string("Expected a key, found ") + token_type_name(token.type),
                                   token.position);
                }
                collect_line_tail();
                skip_trailing_block("line");
                break;
        }
    }

    return object;
}

NodePtr Parser::parse_inline_rows(const std::vector<Token>& first_row, const Position& at) {
    auto array = std::make_unique<ArrayNode>(at);
    array->elements.push_back(build_inline_record(first_row, first_row.front().position));

    while (true) {
        skip_newlines();
        if (check(TokenType::Dedent)) {
            advance();
            break;
        }
        if (check(TokenType::Eof)) {
            break;
        }
        if (check(TokenType::Indent)) {
            if (options_.strict) {
                throw error_at(ErrorCode::UnexpectedToken, "Unexpected indentation", peek().position);
            }
            advance();
            skip_block();
            continue;
        }

        Position row_at = peek().position;
        std::vector<Token> row = collect_line_tail();
        if (has_inline_colon(row)) {
            array->elements.push_back(build_inline_record(row, row_at));
        } else if (options_.strict) {
            throw error_at(ErrorCode::MalformedInlineRow, "Expected an inline record row", row_at);
        }
        skip_trailing_block("inline record");
    }

    return array;
}

NodePtr Parser::parse_table(const std::vector<Token>& headers, const Position& at) {
    if (!options_.allow_duplicate_keys) {
        KeyIndex seen;
        for (const auto& header : headers) {
            check_duplicate(seen, header.text, header.position);
            seen.emplace(header.text, seen.size());
        }
    }

    auto array = std::make_unique<ArrayNode>(at);

    while (true) {
        skip_newlines();
        if (check(TokenType::Dedent)) {
            advance();
            break;
        }
        if (check(TokenType::Eof)) {
            break;
        }
        if (check(TokenType::Indent)) {
            if (options_.strict) {
                throw error_at(ErrorCode::UnexpectedToken, "Unexpected indentation", peek().position);
            }
            advance();
            skip_block();
            continue;
        }

        Position row_at = peek().position;
        std::vector<Token> row = collect_line_tail();

        if (row.size() > headers.size() && options_.strict) {
            throw error_at(ErrorCode::UnexpectedToken,
                           "Row has " + std::to_string(row.size()) + " values but the table has " +
                           std::to_string(headers.size()) + " columns",
                           row[headers.size()].position);
        }

        auto record = std::make_unique<ObjectNode>(row_at);
        KeyIndex keys;
        size_t cells = std::min(row.size(), headers.size());
        for (size_t i = 0; i < cells; ++i) {
            add_property(*record, keys,
                         std::make_unique<PropertyNode>(headers[i].text, token_to_node(row[i]),
                                                        row[i].position));
        }
        array->elements.push_back(std::move(record));

        skip_trailing_block("table row");
    }

    return array;
}

NodePtr Parser::tail_to_node(const std::vector<Token>& tail, const Position& at) {
    if (has_inline_colon(tail)) {
        auto array = std::make_unique<ArrayNode>(at);
        array->elements.push_back(build_inline_record(tail, tail.front().position));
        return array;
    }

    if (tail.size() == 1) {
        return token_to_node(tail.front());
    }

    auto array = std::make_unique<ArrayNode>(tail.front().position);
    for (const auto& token : tail) {
        array->elements.push_back(token_to_node(token));
    }
    return array;
}

bool Parser::all_identifiers(const std::vector<Token>& tokens) {
    for (const auto& token : tokens) {
        if (token.type != TokenType::Identifier) return false;
    }
    return !tokens.empty();
}

// =============================================================================
// Inline records
// =============================================================================

bool Parser::has_inline_colon(const std::vector<Token>& tokens) {
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        if (is_key_token(tokens[i]) && tokens[i + 1].type == TokenType::Colon) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<ObjectNode> Parser::build_inline_record(const std::vector<Token>& tokens,
                                                        const Position& at) {
    auto record = std::make_unique<ObjectNode>(at);
    KeyIndex keys;
    merge_inline_record(tokens, *record, keys);
    return record;
}

void Parser::merge_inline_record(const std::vector<Token>& tokens, ObjectNode& target, KeyIndex& keys) {
    const size_t n = tokens.size();
    auto key_at = [&](size_t i) {
        return i + 1 < n && is_key_token(tokens[i]) && tokens[i + 1].type == TokenType::Colon;
    };

    size_t i = 0;
    while (i < n) {
        if (!key_at(i)) {
            if (options_.strict) {
                throw error_at(ErrorCode::MalformedInlineRow,
                               "Unexpected '" + tokens[i].text + "' in inline record",
                               tokens[i].position);
            }
            ++i;
            continue;
        }

        const Token& key = tokens[i];
        i += 2;

        NodePtr value;
        if (i < n && tokens[i].is_value() && !key_at(i)) {
            value = token_to_node(tokens[i]);
            ++i;
        } else {
            if (options_.strict) {
                throw error_at(ErrorCode::MalformedInlineRow,
                               "Missing value for key '" + key.text + "'", key.position);
            }
            value = std::make_unique<LiteralNode>(Value(), TokenType::Null, key.position);
        }

        add_property(target, keys, std::make_unique<PropertyNode>(key.text, std::move(value), key.position));
    }
}

// =============================================================================
// Literals
// =============================================================================

NodePtr Parser::token_to_node(const Token& token) {
    switch (token.type) {
        case TokenType::Null:
            return std::make_unique<LiteralNode>(Value(), token.type, token.position);

        case TokenType::Boolean:
            return std::make_unique<LiteralNode>(Value(token.text == "true"), token.type, token.position);

        case TokenType::Number:
            return std::make_unique<LiteralNode>(Value(parse_number(token)), token.type, token.position);

        case TokenType::Date: {
            auto date = DateTime::parse(token.text);
            if (!date) {
                throw error_at(ErrorCode::InvalidDate, "Invalid date: " + token.text, token.position);
            }
            return std::make_unique<LiteralNode>(Value(*date), token.type, token.position);
        }

        case TokenType::String:
        case TokenType::Identifier:
            return std::make_unique<LiteralNode>(Value(token.text), token.type, token.position);

        case TokenType::Reference:
            return std::make_unique<AnchorRefNode>(token.text, token.position);

        default:
            break;
    }

    if (options_.strict) {
        throw error_at(ErrorCode::UnexpectedToken,
                       std::string("Unexpected ") + token_type_name(token.type) + " in value position",
                       token.position);
    }
    std::string text = token.type == TokenType::Anchor ? "&" + token.text : token.text;
    return std::make_unique<LiteralNode>(Value(text), TokenType::String, token.position);
}

double Parser::parse_number(const Token& token) const {
    const std::string& text = token.text;

    if (text.find_first_of(".eE") == std::string::npos) {
        try {
            return static_cast<double>(std::stoll(text));
        } catch (const std::out_of_range&) {
            // Wider than int64: fall through to floating point
        }
    }

    double value = std::strtod(text.c_str(), nullptr);
    if (!std::isfinite(value)) {
        throw error_at(ErrorCode::NumberOutOfRange, "Number out of range: " + text, token.position);
    }
    return value;
}

// =============================================================================
// Duplicate keys
// =============================================================================

void Parser::check_duplicate(const KeyIndex& keys, const std::string& key, const Position& at) const {
    if (options_.allow_duplicate_keys) {
        return;
    }
    if (keys.find(key) != keys.end()) {
        throw error_at(ErrorCode::DuplicateKey, "Duplicate key: " + key, at);
    }
}

void Parser::add_property(ObjectNode& object, KeyIndex& keys, std::unique_ptr<PropertyNode> property) {
    auto it = keys.find(property->key);
    if (it == keys.end()) {
        keys.emplace(property->key, object.properties.size());
        object.properties.push_back(std::move(property));
        return;
    }

    check_duplicate(keys, property->key, property->position);

    // Last value wins; the first occurrence keeps its slot
    PropertyNode& existing = *object.properties[it->second];
    existing.value = std::move(property->value);
    existing.implicit_value = property->implicit_value;
}

} // namespace soon
