// s2sql/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `s2sql dump` and by tests that inspect tree shape.
//
#pragma once

#include <nlohmann/json.hpp>

#include "s2sql/ast/ast.hpp"

namespace s2sql
{

/**
 * Serialize any AST node to JSON.
 *
 * Every object carries "type" (the node class name) and "range"
 * ({"start", "end"} byte offsets).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

[[nodiscard]] nlohmann::json to_json(const Script * script);

}  // namespace s2sql
