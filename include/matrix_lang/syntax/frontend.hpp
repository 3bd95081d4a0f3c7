// matrix_lang/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/ast/ast_context.hpp"
#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/basic/source_manager.hpp"

namespace matrix_lang
{

/// One parsed source text together with everything its AST points into.
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;  ///< nullptr when lexing or parsing failed

  [[nodiscard]] bool ok() const noexcept { return program != nullptr && !diags.has_errors(); }
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(std::string source_text);

[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::filesystem::path path, std::string source_text);

}  // namespace matrix_lang
