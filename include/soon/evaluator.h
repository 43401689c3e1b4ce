/**
 * @file evaluator.h
 * @brief Turns a syntax tree into a Value
 */

#pragma once

#include "soon/ast.h"
#include "soon/value.h"

#include <string>
#include <unordered_map>

namespace soon {

/**
 * @brief Tree walker with an anchor table
 *
 * Anchors are registered as their definitions are evaluated, in document
 * order. The table lives as long as the Evaluator, so one instance should
 * be used per document.
 */
class Evaluator {
public:
    /**
     * @brief Evaluate any node
     * @throws EvalError for undefined anchors or unknown node kinds
     */
    Value evaluate(const Node& node);

    bool has_anchor(const std::string& name) const;
    size_t anchor_count() const { return anchors_.size(); }

private:
    Value evaluate_root(const RootNode& root);
    Value evaluate_object(const ObjectNode& object);
    Value evaluate_array(const ArrayNode& array);
    Value evaluate_anchor_def(const AnchorDefNode& def);
    Value resolve_anchor(const AnchorRefNode& ref) const;

    std::unordered_map<std::string, Value> anchors_;
};

} // namespace soon
