// matrix_lang/syntax/frontend.cpp - High-level parse pipeline
#include "matrix_lang/syntax/frontend.hpp"

#include <utility>

#include "matrix_lang/syntax/lexer.hpp"
#include "matrix_lang/syntax/parser.hpp"

namespace matrix_lang
{

namespace
{

void run_pipeline(ParsedUnit & unit)
{
  syntax::Lexer lexer(unit.source.get_source(), unit.diags);
  std::vector<syntax::Token> tokens = lexer.lex_all();

  // Lexing is fail-fast; a lexical error means nothing is parsed.
  if (lexer.has_error()) {
    return;
  }

  syntax::Parser parser(unit.ast, unit.diags, std::move(tokens));
  unit.program = parser.parse_program();
}

}  // namespace

std::unique_ptr<ParsedUnit> parse_source(std::string source_text)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(std::move(source_text));
  run_pipeline(*unit);
  return unit;
}

std::unique_ptr<ParsedUnit> parse_source(std::filesystem::path path, std::string source_text)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceManager(std::move(path), std::move(source_text));
  run_pipeline(*unit);
  return unit;
}

}  // namespace matrix_lang
