// matrix_lang/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[TypeError::UnknownIdentifier]: unknown identifier 'foo'
 *     --> main.mtx:5:9
 *      |
 *    5 | let x = foo + 1
 *      |         ^^^ not found in this scope
 *      |
 *      = help: ...
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & sources);

  void print_all(const DiagnosticBag & diags, const SourceManager & sources);

private:
  void print_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & sources);

  void print_source_line(
    const SourceManager & sources, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace matrix_lang
