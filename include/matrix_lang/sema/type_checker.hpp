// matrix_lang/sema/type_checker.hpp - Hindley-Milner type inference
//
// Algorithm W over the AST: every Expr gets its resolvedType, let bindings
// are generalized, and every use of a polymorphic name is instantiated with
// fresh variables.
//
#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/sema/signature_table.hpp"
#include "matrix_lang/sema/type.hpp"
#include "matrix_lang/sema/type_env.hpp"
#include "matrix_lang/sema/unifier.hpp"

namespace matrix_lang
{

/**
 * Type checker for matrix_lang programs.
 *
 * The checker keeps its global scope, substitution, struct and typeclass
 * tables between calls, so one instance can check successive REPL entries
 * against the bindings of earlier ones. A failed check rolls that state
 * back to where it was before the call; snapshot()/restore() let the caller
 * do the same after a later failure.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(types, registry.signatures());
 * const Type * t = checker.check_program(*program, diags);
 * if (!t) { ... diags holds the first TypeError ... }
 * ```
 */
class TypeChecker
{
public:
  TypeChecker(TypeContext & types, const SignatureTable & builtins);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Check a whole program.
   *
   * @return Type of the program's last item, or nullptr after reporting
   *         the first error to `diags`
   */
  [[nodiscard]] const Type * check_program(Program & program, DiagnosticBag & diags);

  /// Infer a single expression against the global scope without keeping any binding.
  [[nodiscard]] std::optional<Scheme> infer_expression(Expr & expr, DiagnosticBag & diags);

  /// Fully resolved type (all bound variables substituted).
  [[nodiscard]] const Type * resolve(const Type * type) const;

  /// Generalized scheme of a global binding, for display.
  [[nodiscard]] std::optional<Scheme> global_scheme(std::string_view name) const;

  /// Names bound at the top level with their displayed types.
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> describe_globals() const;

  [[nodiscard]] const Type * find_struct(std::string_view name) const;

  // ===========================================================================
  // Checkpoints
  // ===========================================================================

  struct ClassInfo
  {
    std::string name;
    TypeVarId param = 0;
    std::vector<std::pair<std::string, Scheme>> methods;  ///< In declaration order
  };

  /// Everything a check may commit: globals, substitution and declarations.
  struct Snapshot
  {
    Substitution subst;
    TypeEnv globals;
    std::map<std::string, const Type *, std::less<>> structs;
    std::map<std::string, ClassInfo, std::less<>> classes;
    std::set<std::pair<std::string, std::string>> instances;
    std::string moduleName;
  };

  [[nodiscard]] Snapshot snapshot() const;

  /// Forget everything committed since `saved` was taken. Used by the session
  /// when an entry that checked fails at runtime.
  void restore(Snapshot saved);

private:

  /// Lowercase names in annotations mapped to their variables.
  using TypeVarNames = std::map<std::string, const Type *, std::less<>>;

  /// Scope guard: installs a child TypeEnv for the duration of a block.
  class ScopeGuard;

  // ===========================================================================
  // Items, Statements and Declarations
  // ===========================================================================

  const Type * check_item(AstNode * item);
  const Type * check_stmt(Stmt * stmt);
  const Type * check_let_stmt(LetStmt * stmt);
  void check_module_decl(ModuleDecl * decl);
  void check_import_decl(ImportDecl * decl);
  void check_struct_decl(StructDecl * decl);
  void check_typeclass_decl(TypeclassDecl * decl);
  void check_instance_decl(InstanceDecl * decl);

  /// Shared by `let` statements and `let ... in` expressions.
  TypeBinding infer_binding(
    std::string_view name, bool isMutable, TypeNode * annotation, Expr * value,
    SourceRange range);

  // ===========================================================================
  // Expression Type Inference
  // ===========================================================================

  const Type * infer(Expr * expr);
  const Type * infer_identifier(IdentifierExpr * node);
  const Type * infer_binary(BinaryExpr * node);
  const Type * infer_unary(UnaryExpr * node);
  const Type * infer_call(CallExpr * node);
  const Type * infer_index(IndexExpr * node);
  const Type * infer_field_access(FieldAccessExpr * node);
  const Type * infer_lambda(LambdaExpr * node);
  const Type * infer_let(LetExpr * node);
  const Type * infer_assign(AssignExpr * node);
  /// Statements of a block or parallel body, in the current scope.
  const Type * infer_sequence(gsl::span<Stmt *> statements, Expr * result);
  const Type * infer_if(IfExpr * node);
  const Type * infer_match(MatchExpr * node);
  const Type * infer_struct_literal(StructLiteralExpr * node);
  const Type * infer_array_literal(ArrayLiteralExpr * node);
  const Type * infer_matrix_literal(MatrixLiteralExpr * node);
  const Type * infer_comprehension(ComprehensionExpr * node);
  const Type * infer_wait(WaitExpr * node);

  void check_pattern(Pattern * pattern, const Type * expected);

  // ===========================================================================
  // Helper Methods
  // ===========================================================================

  /// Fresh copy of a scheme's body for one use site.
  const Type * instantiate(const Scheme & scheme);
  /// Instantiate with some quantified variables replaced by given types.
  const Type * instantiate_with(const Scheme & scheme, std::map<TypeVarId, const Type *> fixed);
  const Type * substitute(
    const Type * type, const Scheme & scheme, std::map<TypeVarId, const Type *> & mapping);

  /// Quantify the variables of `type` not free in the current scope.
  Scheme generalize(const Type * type);

  const Type * resolve_type(const TypeNode * node, TypeVarNames & names);

  void unify(const Type * expected, const Type * found, SourceRange where);

  [[noreturn]] void fail(ErrorCode code, SourceRange range, std::string message) const;

  /// DuplicateDefinition, pointing back at `site_key` when this program declared it.
  [[noreturn]] void redefinition(
    SourceRange range, std::string message, std::string_view site_key) const;

  /// Apply the final substitution to every resolvedType of the program.
  void finalize(Program & program);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  TypeContext & types_;
  const SignatureTable & builtins_;

  Substitution subst_;
  Unifier unifier_;

  TypeEnv globals_;
  TypeEnv * scope_ = &globals_;

  std::map<std::string, const Type *, std::less<>> structs_;
  std::map<std::string, ClassInfo, std::less<>> classes_;
  std::set<std::pair<std::string, std::string>> instances_;  ///< (class, dispatch name)
  std::string module_name_;

  /// Declaration sites of the program being checked, for "previous definition" labels.
  std::map<std::string, SourceRange, std::less<>> definition_sites_;
};

}  // namespace matrix_lang
