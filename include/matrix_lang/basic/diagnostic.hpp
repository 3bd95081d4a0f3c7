// matrix_lang/basic/diagnostic.hpp - Diagnostic types for every pass
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "matrix_lang/basic/error_code.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

// ============================================================================
// Core Structures
// ============================================================================

enum class LabelStyle : uint8_t {
  Primary,    // Where the error is
  Secondary,  // An earlier site the error refers to
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// One error from any pass. Every diagnostic matrix_lang reports is fatal.
struct Diagnostic
{
  ErrorCode code = ErrorCode::None;
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
  [[nodiscard]] ErrorKind kind() const noexcept { return error_kind_of(code); }
};

/**
 * Render a diagnostic in the single-line form
 * "<ErrorKind>: <message> at line L, column C".
 *
 * The position suffix is omitted when the diagnostic has no valid range.
 */
[[nodiscard]] std::string format_diagnostic(const Diagnostic & diag, const SourceManager & sm);

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that lands its diagnostic in the bag when it goes out of
 * scope:
 *
 *   diags.report_error(range, "type 'P' is already defined")
 *     .with_code(ErrorCode::DuplicateDefinition)
 *     .with_secondary_label(previous, "previous definition here");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(ErrorCode code);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Errors collected across the passes of one run, in report order.
class DiagnosticBag
{
public:
  /// Start an error with a primary label at `range` (omitted when invalid).
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }
  [[nodiscard]] bool has_errors() const noexcept { return !diagnostics_.empty(); }

  [[nodiscard]] const Diagnostic * first_error() const noexcept
  {
    return diagnostics_.empty() ? nullptr : &diagnostics_.front();
  }

  [[nodiscard]] bool has_error_code(ErrorCode code) const;

  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace matrix_lang
