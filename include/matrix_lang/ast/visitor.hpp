// matrix_lang/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
#pragma once

#include <type_traits>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/ast/ast_enums.hpp"
#include "matrix_lang/basic/casting.hpp"

namespace matrix_lang
{

namespace detail
{

/// Propagate const from NodePtrT to the derived node pointer type.
template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = std::conditional_t<
  std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor. The derived class implements `visit_<snake>` for the
 * nodes it cares about; unhandled nodes fall back to the category method
 * (`visit_expr`, `visit_pattern`, ...) and finally to `visit_node`.
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT `AstNode *` or `const AstNode *`
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define ML_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR ML_VISIT_CASE
#define AST_NODE_TYPE ML_VISIT_CASE
#define AST_NODE_PATTERN ML_VISIT_CASE
#define AST_NODE_STMT ML_VISIT_CASE
#define AST_NODE_DECL ML_VISIT_CASE
#define AST_NODE_SUPPORT ML_VISIT_CASE
#define AST_NODE_TOP ML_VISIT_CASE
#include "matrix_lang/ast/ast_nodes.def"
#undef ML_VISIT_CASE
    }

    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_PATTERN(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_pattern(node);                               \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "matrix_lang/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_pattern(detail::propagate_const_t<NodePtrT, Pattern> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that walks every child. Return false from an override to stop
 * the whole traversal; skip the base call to prune a subtree.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and anything without children continue the walk.
  bool visit_node(NodePtrT /*node*/) { return true; }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    return visit_all(node->args);
  }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->base) && get_derived().visit(node->index);
  }

  bool visit_field_access_expr(NodePtr<FieldAccessExpr> node)
  {
    return get_derived().visit(node->base);
  }

  bool visit_lambda_expr(NodePtr<LambdaExpr> node)
  {
    if (!visit_all(node->params)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_let_expr(NodePtr<LetExpr> node)
  {
    return get_derived().visit(node->value) && get_derived().visit(node->body);
  }

  bool visit_assign_expr(NodePtr<AssignExpr> node) { return get_derived().visit(node->value); }

  bool visit_block_expr(NodePtr<BlockExpr> node)
  {
    if (!visit_all(node->statements)) return false;
    return !node->result || get_derived().visit(node->result);
  }

  bool visit_if_expr(NodePtr<IfExpr> node)
  {
    if (!get_derived().visit(node->condition)) return false;
    if (!get_derived().visit(node->thenBranch)) return false;
    return !node->elseBranch || get_derived().visit(node->elseBranch);
  }

  bool visit_match_expr(NodePtr<MatchExpr> node)
  {
    if (!get_derived().visit(node->scrutinee)) return false;
    return visit_all(node->arms);
  }

  bool visit_struct_literal_expr(NodePtr<StructLiteralExpr> node)
  {
    return visit_all(node->fields);
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    return visit_all(node->elements);
  }

  bool visit_matrix_literal_expr(NodePtr<MatrixLiteralExpr> node) { return visit_all(node->rows); }

  bool visit_comprehension_expr(NodePtr<ComprehensionExpr> node)
  {
    if (!visit_all(node->generators)) return false;
    return get_derived().visit(node->element);
  }

  bool visit_parallel_expr(NodePtr<ParallelExpr> node)
  {
    if (!visit_all(node->statements)) return false;
    return !node->result || get_derived().visit(node->result);
  }

  bool visit_spawn_expr(NodePtr<SpawnExpr> node) { return get_derived().visit(node->body); }

  bool visit_wait_expr(NodePtr<WaitExpr> node) { return get_derived().visit(node->target); }

  bool visit_let_stmt(NodePtr<LetStmt> node)
  {
    if (!visit_all(node->attributes)) return false;
    return get_derived().visit(node->value);
  }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_instance_decl(NodePtr<InstanceDecl> node) { return visit_all(node->methods); }

  bool visit_attribute(NodePtr<Attribute> node) { return visit_all(node->args); }

  bool visit_field_init(NodePtr<FieldInit> node) { return get_derived().visit(node->value); }

  bool visit_match_arm(NodePtr<MatchArm> node)
  {
    if (!get_derived().visit(node->pattern)) return false;
    if (node->guard && !get_derived().visit(node->guard)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_generator(NodePtr<Generator> node)
  {
    if (!get_derived().visit(node->source)) return false;
    return visit_all(node->filters);
  }

  bool visit_method_impl(NodePtr<MethodImpl> node)
  {
    if (!visit_all(node->params)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->items); }

private:
  template <typename Span>
  bool visit_all(const Span & nodes)
  {
    for (auto * n : nodes) {
      if (!get_derived().visit(n)) return false;
    }
    return true;
  }
};

}  // namespace matrix_lang
