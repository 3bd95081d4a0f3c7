// matrix_lang/basic/diagnostic.cpp - Diagnostic implementation
#include "matrix_lang/basic/diagnostic.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace matrix_lang
{

const Label * Diagnostic::primary_label() const noexcept
{
  auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  return it == labels.end() ? nullptr : &*it;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l ? l->range : SourceRange{};
}

std::string format_diagnostic(const Diagnostic & diag, const SourceManager & sm)
{
  const std::string_view kind = error_kind_name(diag.kind());
  const LineColumn lc = sm.get_line_column(diag.primary_range().get_begin());
  if (!lc.is_valid()) {
    return fmt::format("{}: {}", kind, diag.message);
  }
  return fmt::format("{}: {} at line {}, column {}", kind, diag.message, lc.line, lc.column);
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(ErrorCode code)
{
  diagnostic_.code = code;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  if (range.is_valid()) {
    diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  }
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.message = std::move(message);
  if (range.is_valid()) {
    d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  }
  return {*this, std::move(d)};
}

bool DiagnosticBag::has_error_code(ErrorCode code) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [code](const Diagnostic & d) {
    return d.code == code;
  });
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace matrix_lang
