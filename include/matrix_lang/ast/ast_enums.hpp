// matrix_lang/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and category range helpers.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace matrix_lang
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Patterns ===
#define AST_NODE_PATTERN(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "matrix_lang/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< ^
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,  ///< &&
  Or,   ///< ||
  // Sequence
  Range,  ///< ..
};

enum class UnaryOp : uint8_t {
  Neg,  ///< -
  Not,  ///< !
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "^";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::Range:
      return "..";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
  }
  return "";
}

[[nodiscard]] constexpr bool is_arithmetic_op(BinaryOp op) noexcept
{
  return op == BinaryOp::Add || op == BinaryOp::Sub || op == BinaryOp::Mul ||
         op == BinaryOp::Div || op == BinaryOp::Mod || op == BinaryOp::Pow;
}

[[nodiscard]] constexpr bool is_comparison_op(BinaryOp op) noexcept
{
  return op == BinaryOp::Eq || op == BinaryOp::Ne || op == BinaryOp::Lt || op == BinaryOp::Le ||
         op == BinaryOp::Gt || op == BinaryOp::Ge;
}

[[nodiscard]] constexpr bool is_logical_op(BinaryOp op) noexcept
{
  return op == BinaryOp::And || op == BinaryOp::Or;
}

/// Node kind as written in ast_nodes.def ("Binary", "Lambda", ...).
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define ML_KIND_NAME(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Kind;
#define AST_NODE_EXPR ML_KIND_NAME
#define AST_NODE_TYPE ML_KIND_NAME
#define AST_NODE_PATTERN ML_KIND_NAME
#define AST_NODE_STMT ML_KIND_NAME
#define AST_NODE_DECL ML_KIND_NAME
#define AST_NODE_SUPPORT ML_KIND_NAME
#define AST_NODE_TOP ML_KIND_NAME
#include "matrix_lang/ast/ast_nodes.def"
#undef ML_KIND_NAME
  }
  return "";
}

// ============================================================================
// Category ranges
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::Wait;

inline constexpr NodeKind k_first_type_kind = NodeKind::NamedType;
inline constexpr NodeKind k_last_type_kind = NodeKind::FunctionType;

inline constexpr NodeKind k_first_pattern_kind = NodeKind::WildcardPattern;
inline constexpr NodeKind k_last_pattern_kind = NodeKind::ArrayPattern;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::LetStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::ExprStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::ModuleDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::InstanceDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

[[nodiscard]] constexpr bool is_pattern_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_pattern_kind && kind <= detail::k_last_pattern_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace matrix_lang
