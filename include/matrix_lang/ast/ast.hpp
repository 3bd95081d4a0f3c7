// matrix_lang/ast/ast.hpp - AST node class definitions
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() for RTTI.
// Every node is arena-allocated by AstContext and must stay trivially
// destructible (string_view and gsl::span only).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "matrix_lang/ast/ast_enums.hpp"
#include "matrix_lang/basic/casting.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

struct Type;  // Semantic type (sema/type.hpp)

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceManager.

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  /// Inferred type, filled in by the type checker (nullptr before checking).
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Pattern : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pattern_kind(node->kind); }

protected:
  explicit Pattern(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Param;
class Attribute;
class FieldInit;
class FieldDecl;
class FieldPattern;
class MatchArm;
class Generator;
class MethodSig;
class MethodImpl;

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal; `value` holds the unescaped text.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `()`
class UnitLiteralExpr : public NodeBase<UnitLiteralExpr, Expr, NodeKind::UnitLiteral>
{
public:
  explicit UnitLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class IdentifierExpr : public NodeBase<IdentifierExpr, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit IdentifierExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// `base[index]`
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * base;
  Expr * index;

  IndexExpr(Expr * b, Expr * i, SourceRange r = {}) : NodeBase(r), base(b), index(i) {}
};

class FieldAccessExpr : public NodeBase<FieldAccessExpr, Expr, NodeKind::FieldAccess>
{
public:
  Expr * base;
  std::string_view field;

  FieldAccessExpr(Expr * b, std::string_view f, SourceRange r = {})
  : NodeBase(r), base(b), field(f)
  {
  }
};

/// `(params) (-> Ret)? => body`
class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::Lambda>
{
public:
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  Expr * body;

  LambdaExpr(gsl::span<Param *> p, TypeNode * ret, Expr * b, SourceRange r = {})
  : NodeBase(r), params(p), returnType(ret), body(b)
  {
  }
};

/// `let name = value in body`
class LetExpr : public NodeBase<LetExpr, Expr, NodeKind::Let>
{
public:
  std::string_view name;
  bool isMutable = false;
  TypeNode * typeAnnotation = nullptr;
  Expr * value;
  Expr * body;

  LetExpr(
    std::string_view n, bool mut, TypeNode * ty, Expr * v, Expr * b, SourceRange r = {})
  : NodeBase(r), name(n), isMutable(mut), typeAnnotation(ty), value(v), body(b)
  {
  }
};

/// `name = value` on a `let mut` binding. Evaluates to Unit.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::Assign>
{
public:
  std::string_view target;
  Expr * value;

  AssignExpr(std::string_view t, Expr * v, SourceRange r = {}) : NodeBase(r), target(t), value(v)
  {
  }
};

/**
 * `{ stmt; stmt; expr }`
 *
 * When the last statement is an expression it is stored in `result`
 * instead of `statements`; `result` is nullptr for a Unit block.
 */
class BlockExpr : public NodeBase<BlockExpr, Expr, NodeKind::Block>
{
public:
  gsl::span<Stmt *> statements;
  Expr * result = nullptr;

  BlockExpr(gsl::span<Stmt *> s, Expr * res, SourceRange r = {})
  : NodeBase(r), statements(s), result(res)
  {
  }
};

class IfExpr : public NodeBase<IfExpr, Expr, NodeKind::If>
{
public:
  Expr * condition;
  Expr * thenBranch;
  Expr * elseBranch = nullptr;  ///< Optional

  IfExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenBranch(t), elseBranch(e)
  {
  }
};

class MatchExpr : public NodeBase<MatchExpr, Expr, NodeKind::Match>
{
public:
  Expr * scrutinee;
  gsl::span<MatchArm *> arms;

  MatchExpr(Expr * s, gsl::span<MatchArm *> a, SourceRange r = {})
  : NodeBase(r), scrutinee(s), arms(a)
  {
  }
};

/// `Point { x: 1.0, y: 2.0 }`
class StructLiteralExpr : public NodeBase<StructLiteralExpr, Expr, NodeKind::StructLiteral>
{
public:
  std::string_view typeName;
  gsl::span<FieldInit *> fields;

  StructLiteralExpr(std::string_view n, gsl::span<FieldInit *> f, SourceRange r = {})
  : NodeBase(r), typeName(n), fields(f)
  {
  }
};

class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/**
 * `[[a, b], [c, d]]`: a list of equally sized, non-empty row literals.
 *
 * Whether it denotes Matrix<T> or Array<Array<T>> depends on the element
 * type, so the type checker records the decision in `isMatrix`.
 */
class MatrixLiteralExpr : public NodeBase<MatrixLiteralExpr, Expr, NodeKind::MatrixLiteral>
{
public:
  gsl::span<ArrayLiteralExpr *> rows;
  size_t columns;
  bool isMatrix = false;

  MatrixLiteralExpr(gsl::span<ArrayLiteralExpr *> rs, size_t cols, SourceRange r = {})
  : NodeBase(r), rows(rs), columns(cols)
  {
  }
};

/// `[element | x in xs if cond | y in ys]`
class ComprehensionExpr : public NodeBase<ComprehensionExpr, Expr, NodeKind::Comprehension>
{
public:
  Expr * element;
  gsl::span<Generator *> generators;

  ComprehensionExpr(Expr * e, gsl::span<Generator *> g, SourceRange r = {})
  : NodeBase(r), element(e), generators(g)
  {
  }
};

/// `parallel { ... }`: sequential statements evaluated in the enclosing scope.
class ParallelExpr : public NodeBase<ParallelExpr, Expr, NodeKind::Parallel>
{
public:
  gsl::span<Stmt *> statements;
  Expr * result = nullptr;

  ParallelExpr(gsl::span<Stmt *> s, Expr * res, SourceRange r = {})
  : NodeBase(r), statements(s), result(res)
  {
  }
};

class SpawnExpr : public NodeBase<SpawnExpr, Expr, NodeKind::Spawn>
{
public:
  Expr * body;

  explicit SpawnExpr(Expr * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

/// `wait h` or `wait [h1, h2]`
class WaitExpr : public NodeBase<WaitExpr, Expr, NodeKind::Wait>
{
public:
  Expr * target;

  explicit WaitExpr(Expr * t, SourceRange r = {}) : NodeBase(r), target(t) {}
};

// ============================================================================
// Type Annotation Nodes
// ============================================================================

/// `Int`, `Point`, or a lowercase type variable such as `a`.
class NamedTypeNode : public NodeBase<NamedTypeNode, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;

  explicit NamedTypeNode(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `Array<T>`, `Matrix<T>`, `Task<T>` (`[T]` is sugar for `Array<T>`).
class GenericTypeNode : public NodeBase<GenericTypeNode, TypeNode, NodeKind::GenericType>
{
public:
  std::string_view name;
  TypeNode * argument;

  GenericTypeNode(std::string_view n, TypeNode * a, SourceRange r = {})
  : NodeBase(r), name(n), argument(a)
  {
  }
};

/// `(A, B) -> R`
class FunctionTypeNode : public NodeBase<FunctionTypeNode, TypeNode, NodeKind::FunctionType>
{
public:
  gsl::span<TypeNode *> params;
  TypeNode * result;

  FunctionTypeNode(gsl::span<TypeNode *> p, TypeNode * res, SourceRange r = {})
  : NodeBase(r), params(p), result(res)
  {
  }
};

// ============================================================================
// Pattern Nodes
// ============================================================================

class WildcardPattern : public NodeBase<WildcardPattern, Pattern, NodeKind::WildcardPattern>
{
public:
  explicit WildcardPattern(SourceRange r = {}) : NodeBase(r) {}
};

class BindingPattern : public NodeBase<BindingPattern, Pattern, NodeKind::BindingPattern>
{
public:
  std::string_view name;

  explicit BindingPattern(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Int, Float, String or Bool literal compared by value.
class LiteralPattern : public NodeBase<LiteralPattern, Pattern, NodeKind::LiteralPattern>
{
public:
  Expr * literal;

  explicit LiteralPattern(Expr * l, SourceRange r = {}) : NodeBase(r), literal(l) {}
};

class StructPattern : public NodeBase<StructPattern, Pattern, NodeKind::StructPattern>
{
public:
  std::string_view typeName;
  gsl::span<FieldPattern *> fields;

  StructPattern(std::string_view n, gsl::span<FieldPattern *> f, SourceRange r = {})
  : NodeBase(r), typeName(n), fields(f)
  {
  }
};

/// Matches arrays of exactly `elements.size()` items.
class ArrayPattern : public NodeBase<ArrayPattern, Pattern, NodeKind::ArrayPattern>
{
public:
  gsl::span<Pattern *> elements;

  explicit ArrayPattern(gsl::span<Pattern *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `@attr let mut name: T = value`
class LetStmt : public NodeBase<LetStmt, Stmt, NodeKind::LetStmt>
{
public:
  std::string_view name;
  bool isMutable = false;
  TypeNode * typeAnnotation = nullptr;
  Expr * value;
  gsl::span<Attribute *> attributes;

  LetStmt(
    std::string_view n, bool mut, TypeNode * ty, Expr * v, gsl::span<Attribute *> attrs,
    SourceRange r = {})
  : NodeBase(r), name(n), isMutable(mut), typeAnnotation(ty), value(v), attributes(attrs)
  {
  }

  [[nodiscard]] bool has_attribute(std::string_view attr) const noexcept;
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class ModuleDecl : public NodeBase<ModuleDecl, Decl, NodeKind::ModuleDecl>
{
public:
  std::string_view name;

  explicit ModuleDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `import math { sqrt, abs }`; an empty item list imports the whole module.
class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view moduleName;
  gsl::span<std::string_view> items;

  ImportDecl(std::string_view m, gsl::span<std::string_view> i, SourceRange r = {})
  : NodeBase(r), moduleName(m), items(i)
  {
  }
};

class StructDecl : public NodeBase<StructDecl, Decl, NodeKind::StructDecl>
{
public:
  std::string_view name;
  gsl::span<FieldDecl *> fields;

  StructDecl(std::string_view n, gsl::span<FieldDecl *> f, SourceRange r = {})
  : NodeBase(r), name(n), fields(f)
  {
  }
};

/// `typeclass Show a { show: (a) -> String }`
class TypeclassDecl : public NodeBase<TypeclassDecl, Decl, NodeKind::TypeclassDecl>
{
public:
  std::string_view name;
  std::string_view typeParam;
  gsl::span<MethodSig *> methods;

  TypeclassDecl(
    std::string_view n, std::string_view p, gsl::span<MethodSig *> m, SourceRange r = {})
  : NodeBase(r), name(n), typeParam(p), methods(m)
  {
  }
};

/// `instance Show Point { show(p) = "..." }`
class InstanceDecl : public NodeBase<InstanceDecl, Decl, NodeKind::InstanceDecl>
{
public:
  std::string_view className;
  TypeNode * type;
  gsl::span<MethodImpl *> methods;

  InstanceDecl(std::string_view c, TypeNode * t, gsl::span<MethodImpl *> m, SourceRange r = {})
  : NodeBase(r), className(c), type(t), methods(m)
  {
  }
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Lambda/method parameter; `type` is nullptr when unannotated.
class Param : public NodeBase<Param, AstNode, NodeKind::Param>
{
public:
  std::string_view name;
  TypeNode * type = nullptr;

  Param(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t) {}
};

/// `@gpu`, `@inline(...)`
class Attribute : public NodeBase<Attribute, AstNode, NodeKind::Attribute>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  Attribute(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

class FieldInit : public NodeBase<FieldInit, AstNode, NodeKind::FieldInit>
{
public:
  std::string_view name;
  Expr * value;

  FieldInit(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v) {}
};

class FieldDecl : public NodeBase<FieldDecl, AstNode, NodeKind::FieldDecl>
{
public:
  std::string_view name;
  TypeNode * type;

  FieldDecl(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

/// `field: pattern`, or `field` alone which binds the field's value to its name.
class FieldPattern : public NodeBase<FieldPattern, AstNode, NodeKind::FieldPattern>
{
public:
  std::string_view name;
  Pattern * pattern = nullptr;

  FieldPattern(std::string_view n, Pattern * p, SourceRange r = {})
  : NodeBase(r), name(n), pattern(p)
  {
  }
};

class MatchArm : public NodeBase<MatchArm, AstNode, NodeKind::MatchArm>
{
public:
  Pattern * pattern;
  Expr * guard = nullptr;  ///< Optional `if` guard
  Expr * body;

  MatchArm(Pattern * p, Expr * g, Expr * b, SourceRange r = {})
  : NodeBase(r), pattern(p), guard(g), body(b)
  {
  }
};

/// `x in source if f1 if f2` inside a comprehension.
class Generator : public NodeBase<Generator, AstNode, NodeKind::Generator>
{
public:
  std::string_view variable;
  Expr * source;
  gsl::span<Expr *> filters;

  Generator(std::string_view v, Expr * s, gsl::span<Expr *> f, SourceRange r = {})
  : NodeBase(r), variable(v), source(s), filters(f)
  {
  }
};

class MethodSig : public NodeBase<MethodSig, AstNode, NodeKind::MethodSig>
{
public:
  std::string_view name;
  TypeNode * type;

  MethodSig(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

class MethodImpl : public NodeBase<MethodImpl, AstNode, NodeKind::MethodImpl>
{
public:
  std::string_view name;
  gsl::span<Param *> params;
  Expr * body;

  MethodImpl(std::string_view n, gsl::span<Param *> p, Expr * b, SourceRange r = {})
  : NodeBase(r), name(n), params(p), body(b)
  {
  }
};

// ============================================================================
// Top-level
// ============================================================================

/// Root node. Items are Decl or Stmt nodes in source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<AstNode *> items;

  explicit Program(gsl::span<AstNode *> i, SourceRange r = {}) : NodeBase(r), items(i) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

inline bool LetStmt::has_attribute(std::string_view attr) const noexcept
{
  for (const auto * a : attributes) {
    if (a->name == attr) return true;
  }
  return false;
}

}  // namespace matrix_lang
