// matrix_lang/test_support/session_helpers.hpp - helpers for unit tests
//
// A ScriptRun bundles a Session with the stream its `print` builtins write
// to, so tests can inspect both the program value and its output.
//
#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/driver/session.hpp"
#include "matrix_lang/syntax/frontend.hpp"

namespace matrix_lang::test_support
{

struct ScriptRun
{
  explicit ScriptRun(SessionOptions options = {}) : session(options, out) {}

  std::ostringstream out;
  Session session;
  EvalOutcome outcome;

  [[nodiscard]] bool ok() const noexcept { return outcome.ok; }
  [[nodiscard]] const Value & value() const { return *outcome.value; }
  [[nodiscard]] std::string output() const { return out.str(); }
  [[nodiscard]] std::string error() const { return outcome.first_error(); }
  [[nodiscard]] bool has_error(ErrorCode code) const { return outcome.diags.has_error_code(code); }

  /// Run a further entry in the same session (REPL style).
  const EvalOutcome & run(std::string src)
  {
    outcome = session.run(std::move(src));
    return outcome;
  }
};

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse_source(std::string src)
{
  return matrix_lang::parse_source(std::move(src));
}

[[nodiscard]] inline std::unique_ptr<ScriptRun> check_source(
  std::string src, SessionOptions options = {})
{
  auto run = std::make_unique<ScriptRun>(options);
  run->outcome = run->session.check(std::move(src));
  return run;
}

[[nodiscard]] inline std::unique_ptr<ScriptRun> run_source(
  std::string src, SessionOptions options = {})
{
  auto run = std::make_unique<ScriptRun>(options);
  run->outcome = run->session.run(std::move(src));
  return run;
}

}  // namespace matrix_lang::test_support
