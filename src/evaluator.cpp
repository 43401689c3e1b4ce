/**
 * @file evaluator.cpp
 * @brief Syntax tree evaluation
 */

#include "soon/evaluator.h"
#include "soon/errors.h"

namespace soon {

Value Evaluator::evaluate(const Node& node) {
    switch (node.type) {
        case NodeType::Root:
            return evaluate_root(static_cast<const RootNode&>(node));
        case NodeType::Object:
            return evaluate_object(static_cast<const ObjectNode&>(node));
        case NodeType::Array:
            return evaluate_array(static_cast<const ArrayNode&>(node));
        case NodeType::Property: {
            // A property on its own evaluates to a one-key record
            const auto& property = static_cast<const PropertyNode&>(node);
            Object record;
            record.set(property.key, evaluate(*property.value));
            return Value(std::move(record));
        }
        case NodeType::Literal:
            return static_cast<const LiteralNode&>(node).value;
        case NodeType::AnchorDef:
            return evaluate_anchor_def(static_cast<const AnchorDefNode&>(node));
        case NodeType::AnchorRef:
            return resolve_anchor(static_cast<const AnchorRefNode&>(node));
    }
    throw EvalError(ErrorCode::UnknownNode, "Unknown node type",
                    node.position.line, node.position.column);
}

bool Evaluator::has_anchor(const std::string& name) const {
    return anchors_.find(name) != anchors_.end();
}

Value Evaluator::evaluate_root(const RootNode& root) {
    if (root.body.empty()) {
        return Value();
    }

    if (root.body.size() == 1) {
        const Node& only = *root.body.front();

        // A document that is a single bare word is that word. The encoder writes a
        // null-valued key as `key null`, so `{key: null}` never encodes to a bare word.
        if (only.type == NodeType::Property) {
            const auto& property = static_cast<const PropertyNode&>(only);
            if (property.implicit_value) {
                return Value(property.key);
            }
        }
        if (only.type == NodeType::AnchorDef) {
            const auto& def = static_cast<const AnchorDefNode&>(only);
            Object record;
            record.set(def.name, evaluate_anchor_def(def));
            return Value(std::move(record));
        }
        return evaluate(only);
    }

    Object record;
    for (size_t i = 0; i < root.body.size(); ++i) {
        const Node& child = *root.body[i];
        switch (child.type) {
            case NodeType::Property: {
                const auto& property = static_cast<const PropertyNode&>(child);
                record.set(property.key, evaluate(*property.value));
                break;
            }
            case NodeType::AnchorDef: {
                const auto& def = static_cast<const AnchorDefNode&>(child);
                record.set(def.name, evaluate_anchor_def(def));
                break;
            }
            default:
                record.set(std::to_string(i), evaluate(child));
                break;
        }
    }
    return Value(std::move(record));
}

Value Evaluator::evaluate_object(const ObjectNode& object) {
    Object record;
    for (const auto& property : object.properties) {
        record.set(property->key, evaluate(*property->value));
    }
    return Value(std::move(record));
}

Value Evaluator::evaluate_array(const ArrayNode& array) {
    Array items;
    items.reserve(array.elements.size());
    for (const auto& element : array.elements) {
        items.push_back(evaluate(*element));
    }
    return Value(std::move(items));
}

Value Evaluator::evaluate_anchor_def(const AnchorDefNode& def) {
    Value value = evaluate(*def.value);
    anchors_[def.name] = value;
    return value;
}

Value Evaluator::resolve_anchor(const AnchorRefNode& ref) const {
    auto it = anchors_.find(ref.name);
    if (it == anchors_.end()) {
        throw EvalError(ErrorCode::UndefinedAnchor, "Undefined anchor: " + ref.name,
                        ref.position.line, ref.position.column);
    }
    // Copy: the referencing site gets its own tree
    return it->second;
}

} // namespace soon
