/**
 * @file ast.h
 * @brief Syntax tree produced by the Parser
 *
 * Nodes form a strict tree owned through unique_ptr. Anchor references are
 * stored by name and resolved by the Evaluator, never as tree edges.
 */

#pragma once

#include "soon/token.h"
#include "soon/value.h"

#include <memory>
#include <string>
#include <vector>

namespace soon {

enum class NodeType {
    Root,
    Object,
    Array,
    Property,
    Literal,
    AnchorDef,
    AnchorRef
};

const char* node_type_name(NodeType type);

struct Node {
    NodeType type;
    Position position;

    Node(NodeType type, Position position) : type(type), position(position) {}
    virtual ~Node() = default;
};

using NodePtr = std::unique_ptr<Node>;

struct LiteralNode : Node {
    Value value;
    TokenType source_token;

    LiteralNode(Value value, TokenType source_token, Position position)
        : Node(NodeType::Literal, position)
        , value(std::move(value))
        , source_token(source_token) {}
};

struct PropertyNode : Node {
    std::string key;
    NodePtr value;
    bool implicit_value = false;  // bare key with no tail and no block

    PropertyNode(std::string key, NodePtr value, Position position)
        : Node(NodeType::Property, position)
        , key(std::move(key))
        , value(std::move(value)) {}
};

struct ObjectNode : Node {
    std::vector<std::unique_ptr<PropertyNode>> properties;

    explicit ObjectNode(Position position) : Node(NodeType::Object, position) {}
};

struct ArrayNode : Node {
    std::vector<NodePtr> elements;

    explicit ArrayNode(Position position) : Node(NodeType::Array, position) {}
};

struct AnchorDefNode : Node {
    std::string name;
    NodePtr value;

    AnchorDefNode(std::string name, NodePtr value, Position position)
        : Node(NodeType::AnchorDef, position)
        , name(std::move(name))
        , value(std::move(value)) {}
};

struct AnchorRefNode : Node {
    std::string name;

    AnchorRefNode(std::string name, Position position)
        : Node(NodeType::AnchorRef, position)
        , name(std::move(name)) {}
};

struct RootNode : Node {
    std::vector<NodePtr> body;

    explicit RootNode(Position position) : Node(NodeType::Root, position) {}
};

} // namespace soon
