// matrix_lang/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `mtx ast` and by tests that compare tree shapes.
//
#pragma once

#include <nlohmann/json.hpp>

#include "matrix_lang/ast/ast.hpp"

namespace matrix_lang
{

/**
 * Serialize any AST node to JSON.
 *
 * Every object carries a "type" (the node class name) and a "range"
 * ({start, end} byte offsets).
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace matrix_lang
