// matrix_lang/driver/session.hpp - One compile/execute session
//
// Owns everything scoped to a session: the type context (and with it the
// type-variable counter), the Builtin Registry, the checker, the
// interpreter and every parsed source the interpreter may still point into.
// Used by the CLI for single runs and for the REPL.
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/basic/source_manager.hpp"
#include "matrix_lang/runtime/builtin_registry.hpp"
#include "matrix_lang/runtime/interpreter.hpp"
#include "matrix_lang/runtime/value.hpp"
#include "matrix_lang/sema/type.hpp"
#include "matrix_lang/sema/type_checker.hpp"
#include "matrix_lang/syntax/frontend.hpp"

namespace matrix_lang
{

// ============================================================================
// Session Options
// ============================================================================

struct SessionOptions
{
  /// Print phase progress and timings to stderr
  bool verbose = false;

  InterpreterOptions interpreter;
};

// ============================================================================
// Evaluation Outcome
// ============================================================================

struct EvalOutcome
{
  /// No lex, parse, type or runtime error
  bool ok = false;

  /// Program value (set only when evaluation ran to completion)
  std::optional<Value> value;

  /// Displayed type of the program's last item, or of a `:type` expression
  std::string type;

  DiagnosticBag diags;

  /// Source the diagnostic ranges refer to (owned by the session)
  const SourceManager * source = nullptr;

  /// First error as "<ErrorKind>: <message> at line L, column C", or empty.
  [[nodiscard]] std::string first_error() const;
};

// ============================================================================
// Session
// ============================================================================

/**
 * ## Usage
 * ```cpp
 * Session session;
 * EvalOutcome r = session.run("let x = 5 + 3");
 * // r.value->as_int() == 8, r.type == "Int"
 * ```
 */
class Session
{
public:
  explicit Session(SessionOptions options = {});
  Session(SessionOptions options, std::ostream & out);

  Session(const Session &) = delete;
  Session & operator=(const Session &) = delete;

  /// Lex, parse, type-check and evaluate. Nothing is evaluated after a static error.
  EvalOutcome run(std::string source, const std::filesystem::path & path = {});

  /// Lex, parse and type-check only.
  EvalOutcome check(std::string source, const std::filesystem::path & path = {});

  /// Infer the type of a single expression without binding anything (REPL `:type`).
  EvalOutcome type_of(std::string expression);

  /// Top-level bindings and their types (REPL `:env`).
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> describe_env() const
  {
    return checker_.describe_globals();
  }

  [[nodiscard]] BuiltinRegistry & registry() noexcept { return registry_; }
  [[nodiscard]] Interpreter & interpreter() noexcept { return interpreter_; }
  [[nodiscard]] TypeChecker & checker() noexcept { return checker_; }

private:
  /// Parse into a unit the session keeps alive; false after reporting errors.
  ParsedUnit & parse(std::string source, const std::filesystem::path & path, EvalOutcome & outcome);

  /// Type-check the unit's program; false after reporting the error.
  bool check_unit(ParsedUnit & unit, EvalOutcome & outcome);

  SessionOptions options_;

  TypeContext types_;
  BuiltinRegistry registry_;
  TypeChecker checker_;

  /// Closures point into these ASTs; declared before the interpreter so
  /// they are destroyed after it.
  std::vector<std::unique_ptr<ParsedUnit>> units_;

  Interpreter interpreter_;
};

}  // namespace matrix_lang
