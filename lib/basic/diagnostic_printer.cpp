// matrix_lang/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "matrix_lang/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace matrix_lang
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & sources)
{
  const LineColumn start = sources.get_line_column(diag.primary_range().get_begin());

  print_header(diag);

  if (start.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), sources.get_display_name(), start.line, start.column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), sources.get_display_name());
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & sources)
{
  for (const auto & d : diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  std::string code;
  if (diag.code != ErrorCode::None) {
    code = fmt::format("[{}::{}]", error_kind_name(diag.kind()), error_code_name(diag.code));
  }

  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error" << code << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "error{}: {}\n", code, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & sources)
{
  if (!label.range.is_valid()) {
    return;
  }

  const LineColumn begin = sources.get_line_column(label.range.get_begin());
  const LineColumn end = sources.get_line_column(label.range.get_end());
  if (!begin.is_valid()) {
    return;
  }

  const uint32_t end_col =
    (end.line == begin.line && end.column > begin.column) ? end.column : (begin.column + 1);

  print_source_line(sources, begin.line - 1, begin.column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & sources, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = sources.get_line(line_index);
  if (line.empty()) {
    return;
  }

  std::string cleaned_line;
  std::string marker_prefix;
  cleaned_line.reserve(line.size());
  for (size_t i = 0; i < line.size(); ++i) {
    const bool before_marker = i + 1 < start_col;
    if (line[i] == '\t') {
      cleaned_line += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned_line += line[i];
      if (before_marker) marker_prefix += ' ';
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      | {}", marker_prefix);

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = help" << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, ": {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const { return "     -->"; }

std::string DiagnosticPrinter::gutter_pipe() const { return "      |"; }

}  // namespace matrix_lang
