// matrix_lang/driver/session.cpp - One compile/execute session
#include "matrix_lang/driver/session.hpp"

#include <fmt/format.h>

#include <chrono>
#include <iostream>

#include "matrix_lang/jit/closure_compiler.hpp"
#include "matrix_lang/runtime/runtime_error.hpp"

namespace matrix_lang
{

namespace
{

/// Phase timer printing "<phase>... done (x.xx ms)" when verbose.
class PhaseLog
{
public:
  PhaseLog(bool enabled, const char * phase) : enabled_(enabled)
  {
    if (enabled_) fmt::print(stderr, "{}...", phase);
    start_ = std::chrono::steady_clock::now();
  }

  PhaseLog(const PhaseLog &) = delete;
  PhaseLog & operator=(const PhaseLog &) = delete;

  ~PhaseLog()
  {
    if (!enabled_) return;
    const std::chrono::duration<double, std::milli> elapsed =
      std::chrono::steady_clock::now() - start_;
    fmt::print(stderr, " done ({:.2f} ms)\n", elapsed.count());
  }

private:
  bool enabled_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace

std::string EvalOutcome::first_error() const
{
  const Diagnostic * diag = diags.first_error();
  if (!diag) return {};
  if (!source) return diag->message;
  return format_diagnostic(*diag, *source);
}

// ============================================================================
// Construction
// ============================================================================

Session::Session(SessionOptions options) : Session(options, std::cout) {}

Session::Session(SessionOptions options, std::ostream & out)
: options_(options),
  registry_(types_),
  checker_(types_, registry_.signatures()),
  interpreter_(registry_, options.interpreter, out)
{
  install_stdlib(registry_);
  if (options_.interpreter.jitEnabled) {
    interpreter_.set_jit_backend(
      std::make_unique<ClosureCompiler>(options_.interpreter.maxCallDepth));
  }
  if (options_.verbose) {
    fmt::print(stderr, "Registered {} builtins\n", registry_.size());
  }
}

// ============================================================================
// Pipeline
// ============================================================================

ParsedUnit & Session::parse(
  std::string source, const std::filesystem::path & path, EvalOutcome & outcome)
{
  {
    PhaseLog log(options_.verbose, "Parsing");
    units_.push_back(
      path.empty() ? parse_source(std::move(source)) : parse_source(path, std::move(source)));
  }
  ParsedUnit & unit = *units_.back();
  outcome.source = &unit.source;
  outcome.diags.merge(unit.diags);
  return unit;
}

bool Session::check_unit(ParsedUnit & unit, EvalOutcome & outcome)
{
  if (!unit.ok()) return false;

  const Type * type = nullptr;
  {
    PhaseLog log(options_.verbose, "Type checking");
    type = checker_.check_program(*unit.program, outcome.diags);
  }
  if (!type) return false;

  outcome.type = format_type(checker_.resolve(type));
  return true;
}

EvalOutcome Session::run(std::string source, const std::filesystem::path & path)
{
  EvalOutcome outcome;
  ParsedUnit & unit = parse(std::move(source), path, outcome);
  TypeChecker::Snapshot before = checker_.snapshot();
  if (!check_unit(unit, outcome)) return outcome;

  PhaseLog log(options_.verbose, "Evaluating");
  try {
    outcome.value = interpreter_.run_program(*unit.program);
    outcome.ok = true;
  } catch (const RuntimeError & e) {
    // The interpreter dropped the entry's bindings; forget their types too.
    checker_.restore(std::move(before));
    outcome.diags.report_error(e.range(), e.what()).with_code(e.code());
  }
  return outcome;
}

EvalOutcome Session::check(std::string source, const std::filesystem::path & path)
{
  EvalOutcome outcome;
  ParsedUnit & unit = parse(std::move(source), path, outcome);
  outcome.ok = check_unit(unit, outcome);
  return outcome;
}

EvalOutcome Session::type_of(std::string expression)
{
  EvalOutcome outcome;
  ParsedUnit & unit = parse(std::move(expression), {}, outcome);
  if (!unit.ok()) return outcome;

  const auto & items = unit.program->items;
  const auto * stmt = items.size() == 1 ? dyn_cast<ExprStmt>(items[0]) : nullptr;
  if (!stmt) {
    outcome.diags.report_error(unit.program->get_range(), "expected a single expression")
      .with_code(ErrorCode::UnexpectedToken);
    return outcome;
  }

  if (auto scheme = checker_.infer_expression(*stmt->expr, outcome.diags)) {
    outcome.type = format_scheme(*scheme);
    outcome.ok = true;
  }
  return outcome;
}

}  // namespace matrix_lang
