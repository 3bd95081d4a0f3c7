// matrix_lang/syntax/parser.hpp - Recursive-descent parser
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "matrix_lang/ast/ast.hpp"
#include "matrix_lang/ast/ast_context.hpp"
#include "matrix_lang/basic/diagnostic.hpp"
#include "matrix_lang/syntax/token.hpp"

namespace matrix_lang::syntax
{

/**
 * Builds a Program from a token vector produced by Lexer::lex_all().
 *
 * Parsing is fail-fast: the first syntax error is reported to the
 * DiagnosticBag (ParseError::UnexpectedToken or
 * ParseError::UnterminatedConstruct) and parse_program() returns nullptr.
 *
 * Precedence, lowest first:
 *   let/in < assignment < || < && < == != < < <= > >= < .. < + - < * / %
 *   < unary - ! < ^ (right-assoc) < postfix (call, index, field)
 */
class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

private:
  /// Unwinds the recursive descent after the first reported error.
  struct ParseAbort
  {
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const { return cur().kind == k; }
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }
  [[nodiscard]] const Token & previous() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

  const Token & advance();
  bool match(TokenKind k);
  const Token & expect(TokenKind k, std::string_view what);
  const Token & expect_closing(TokenKind k, const Token & opener, std::string_view construct);
  std::string_view expect_identifier(std::string_view what);

  [[noreturn]] void error_unexpected(std::string_view expected);
  [[noreturn]] void error_at(SourceRange range, ErrorCode code, std::string message);

  [[nodiscard]] SourceRange range_from(const Token & first) const;
  /// Fill closer_ in one pass over the tokens.
  void match_brackets();
  [[nodiscard]] bool is_lambda_start() const;
  [[nodiscard]] bool is_struct_literal_start() const;

  // Items and statements
  [[nodiscard]] AstNode * parse_item();
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] Stmt * parse_let_stmt(gsl::span<Attribute *> attributes, const Token & first);
  [[nodiscard]] std::vector<Attribute *> parse_attributes();
  [[nodiscard]] ModuleDecl * parse_module_decl();
  [[nodiscard]] ImportDecl * parse_import_decl();
  [[nodiscard]] StructDecl * parse_struct_decl();
  [[nodiscard]] TypeclassDecl * parse_typeclass_decl();
  [[nodiscard]] InstanceDecl * parse_instance_decl();

  /// Statements up to the closing brace; a trailing expression becomes `result`.
  void parse_statement_list(
    const Token & opener, std::string_view construct, std::vector<Stmt *> & statements,
    Expr *& result);

  // Types and patterns
  [[nodiscard]] TypeNode * parse_type();
  [[nodiscard]] Pattern * parse_pattern();
  [[nodiscard]] gsl::span<Param *> parse_params(const Token & opener);

  // Expressions
  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_expr_no_struct();
  [[nodiscard]] Expr * parse_let_expr();
  [[nodiscard]] Expr * parse_assign();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_equality();
  [[nodiscard]] Expr * parse_relational();
  [[nodiscard]] Expr * parse_range();
  [[nodiscard]] Expr * parse_additive();
  [[nodiscard]] Expr * parse_multiplicative();
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_power();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_primary();

  [[nodiscard]] Expr * parse_literal();
  [[nodiscard]] Expr * parse_lambda();
  [[nodiscard]] Expr * parse_paren_or_unit();
  [[nodiscard]] Expr * parse_array_like();
  [[nodiscard]] Expr * parse_struct_literal();
  [[nodiscard]] Expr * parse_block();
  [[nodiscard]] Expr * parse_if();
  [[nodiscard]] Expr * parse_match();
  [[nodiscard]] Expr * parse_parallel();

  [[nodiscard]] std::string unescape_string(std::string_view raw) const;

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;

  /// Index of the bracket closing the one opened at each token, or k_no_closer.
  std::vector<size_t> closer_;
  static constexpr size_t k_no_closer = static_cast<size_t>(-1);

  /// Set while parsing an `if`/`match` scrutinee or a generator source,
  /// where `Name {` opens a block rather than a struct literal.
  bool no_struct_literal_ = false;
};

}  // namespace matrix_lang::syntax
