// matrix_lang/syntax/parser.cpp - Recursive-descent parser implementation
#include "matrix_lang/syntax/parser.hpp"

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace matrix_lang::syntax
{
namespace
{

/// Temporarily overrides a flag for the lifetime of the scope.
class FlagScope
{
public:
  FlagScope(bool & flag, bool value) : flag_(flag), saved_(flag) { flag_ = value; }
  ~FlagScope() { flag_ = saved_; }

  FlagScope(const FlagScope &) = delete;
  FlagScope & operator=(const FlagScope &) = delete;

private:
  bool & flag_;
  bool saved_;
};

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
      return fmt::format("'{}'", t.text);
    case TokenKind::StringLiteral:
      return fmt::format("string \"{}\"", t.text);
    default:
      return std::string(to_string(t.kind));
  }
}

bool starts_uppercase(std::string_view name)
{
  return !name.empty() && std::isupper(static_cast<unsigned char>(name.front())) != 0;
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i < tokens_.size()) {
    return tokens_[i];
  }
  return tokens_.back();
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (idx_ < tokens_.size() && !at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

const Token & Parser::expect(TokenKind k, std::string_view what)
{
  if (!at(k)) {
    error_unexpected(what);
  }
  return advance();
}

const Token & Parser::expect_closing(
  TokenKind k, const Token & opener, std::string_view construct)
{
  if (at(k)) {
    return advance();
  }
  if (at_eof()) {
    error_at(
      opener.range, ErrorCode::UnterminatedConstruct,
      fmt::format("unterminated {}: missing {}", construct, to_string(k)));
  }
  error_unexpected(to_string(k));
}

std::string_view Parser::expect_identifier(std::string_view what)
{
  return ast_.intern(expect(TokenKind::Identifier, what).text);
}

void Parser::error_unexpected(std::string_view expected)
{
  error_at(
    cur().range, ErrorCode::UnexpectedToken,
    fmt::format("expected {}, found {}", expected, describe(cur())));
}

void Parser::error_at(SourceRange range, ErrorCode code, std::string message)
{
  diags_.report_error(range, std::move(message)).with_code(code);
  throw ParseAbort{};
}

SourceRange Parser::range_from(const Token & first) const
{
  return {first.begin(), previous().end()};
}

void Parser::match_brackets()
{
  closer_.assign(tokens_.size(), k_no_closer);
  std::vector<size_t> open;
  for (size_t i = 0; i < tokens_.size(); ++i) {
    const TokenKind k = tokens_[i].kind;
    if (k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace) {
      open.push_back(i);
    } else if (
      (k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace) &&
      !open.empty()) {
      closer_[open.back()] = i;
      open.pop_back();
    }
  }
}

bool Parser::is_lambda_start() const
{
  // `(` ... matching `)` followed by `=>` or `->`
  const size_t close = idx_ < closer_.size() ? closer_[idx_] : k_no_closer;
  if (close == k_no_closer || close + 1 >= tokens_.size()) return false;
  const TokenKind next = tokens_[close + 1].kind;
  return tokens_[close].kind == TokenKind::RParen &&
         (next == TokenKind::FatArrow || next == TokenKind::Arrow);
}

bool Parser::is_struct_literal_start() const
{
  // Name { }   or   Name { field: ...
  if (no_struct_literal_ || !at(TokenKind::Identifier) || !starts_uppercase(cur().text)) {
    return false;
  }
  if (cur(1).kind != TokenKind::LBrace) {
    return false;
  }
  return cur(2).kind == TokenKind::RBrace ||
         (cur(2).kind == TokenKind::Identifier && cur(3).kind == TokenKind::Colon);
}

// ============================================================================
// Program and items
// ============================================================================

Program * Parser::parse_program()
{
  if (tokens_.empty()) {
    tokens_.push_back(Token{TokenKind::Eof, {0, 0}, {}});
  }
  match_brackets();

  try {
    std::vector<AstNode *> items;
    while (!at_eof()) {
      if (match(TokenKind::Semicolon)) {
        continue;
      }
      items.push_back(parse_item());
    }
    const uint32_t end = cur().end().get_offset();
    return ast_.create<Program>(ast_.copy_to_arena(items), SourceRange(0, end));
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

AstNode * Parser::parse_item()
{
  switch (cur().kind) {
    case TokenKind::KwModule:
      return parse_module_decl();
    case TokenKind::KwImport:
      return parse_import_decl();
    case TokenKind::KwStruct:
      return parse_struct_decl();
    case TokenKind::KwTypeclass:
      return parse_typeclass_decl();
    case TokenKind::KwInstance:
      return parse_instance_decl();
    case TokenKind::At: {
      const Token & first = cur();
      auto attrs = parse_attributes();
      if (!at(TokenKind::KwLet)) {
        error_unexpected("'let' after attribute");
      }
      return parse_let_stmt(ast_.copy_to_arena(attrs), first);
    }
    default:
      return parse_stmt();
  }
}

Stmt * Parser::parse_stmt()
{
  const Token & first = cur();
  if (at(TokenKind::KwLet)) {
    return parse_let_stmt({}, first);
  }
  Expr * e = parse_expr();
  return ast_.create<ExprStmt>(e, e->get_range());
}

Stmt * Parser::parse_let_stmt(gsl::span<Attribute *> attributes, const Token & first)
{
  expect(TokenKind::KwLet, "'let'");
  const bool is_mut = match(TokenKind::KwMut);
  const std::string_view name = expect_identifier("binding name after 'let'");
  TypeNode * annotation = nullptr;
  if (match(TokenKind::Colon)) {
    annotation = parse_type();
  }
  expect(TokenKind::Assign, "'=' in let binding");
  Expr * value = parse_expr();

  // `let x = e in body` at statement level is an expression statement.
  if (attributes.empty() && match(TokenKind::KwIn)) {
    Expr * body = parse_expr();
    auto * let = ast_.create<LetExpr>(name, is_mut, annotation, value, body, range_from(first));
    return ast_.create<ExprStmt>(let, let->get_range());
  }

  return ast_.create<LetStmt>(name, is_mut, annotation, value, attributes, range_from(first));
}

std::vector<Attribute *> Parser::parse_attributes()
{
  std::vector<Attribute *> attrs;
  while (at(TokenKind::At)) {
    const Token & first = advance();
    const std::string_view name = expect_identifier("attribute name after '@'");
    std::vector<Expr *> args;
    if (at(TokenKind::LParen)) {
      const Token & open = advance();
      FlagScope scope(no_struct_literal_, false);
      while (!at(TokenKind::RParen) && !at_eof()) {
        args.push_back(parse_expr());
        if (!match(TokenKind::Comma)) break;
      }
      expect_closing(TokenKind::RParen, open, "attribute argument list");
    }
    attrs.push_back(ast_.create<Attribute>(name, ast_.copy_to_arena(args), range_from(first)));
  }
  return attrs;
}

ModuleDecl * Parser::parse_module_decl()
{
  const Token & first = expect(TokenKind::KwModule, "'module'");
  const std::string_view name = expect_identifier("module name");
  return ast_.create<ModuleDecl>(name, range_from(first));
}

ImportDecl * Parser::parse_import_decl()
{
  const Token & first = expect(TokenKind::KwImport, "'import'");
  const std::string_view module = expect_identifier("module name after 'import'");
  std::vector<std::string_view> items;
  if (at(TokenKind::LBrace)) {
    const Token & open = advance();
    while (!at(TokenKind::RBrace) && !at_eof()) {
      items.push_back(expect_identifier("imported name"));
      if (!match(TokenKind::Comma)) break;
    }
    expect_closing(TokenKind::RBrace, open, "import list");
  }
  return ast_.create<ImportDecl>(module, ast_.copy_to_arena(items), range_from(first));
}

StructDecl * Parser::parse_struct_decl()
{
  const Token & first = expect(TokenKind::KwStruct, "'struct'");
  const std::string_view name = expect_identifier("struct name");
  const Token & open = expect(TokenKind::LBrace, "'{' after struct name");

  std::vector<FieldDecl *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & field_tok = cur();
    const std::string_view field = expect_identifier("field name");
    expect(TokenKind::Colon, "':' after field name");
    TypeNode * type = parse_type();
    fields.push_back(ast_.create<FieldDecl>(field, type, range_from(field_tok)));
    if (!match(TokenKind::Comma) && !match(TokenKind::Semicolon)) break;
  }
  expect_closing(TokenKind::RBrace, open, "struct definition");
  return ast_.create<StructDecl>(name, ast_.copy_to_arena(fields), range_from(first));
}

TypeclassDecl * Parser::parse_typeclass_decl()
{
  const Token & first = expect(TokenKind::KwTypeclass, "'typeclass'");
  const std::string_view name = expect_identifier("typeclass name");
  const std::string_view param = expect_identifier("typeclass type parameter");
  const Token & open = expect(TokenKind::LBrace, "'{' after typeclass header");

  std::vector<MethodSig *> methods;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & method_tok = cur();
    const std::string_view method = expect_identifier("method name");
    expect(TokenKind::Colon, "':' after method name");
    TypeNode * type = parse_type();
    methods.push_back(ast_.create<MethodSig>(method, type, range_from(method_tok)));
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon)) {
    }
  }
  expect_closing(TokenKind::RBrace, open, "typeclass declaration");
  return ast_.create<TypeclassDecl>(name, param, ast_.copy_to_arena(methods), range_from(first));
}

InstanceDecl * Parser::parse_instance_decl()
{
  const Token & first = expect(TokenKind::KwInstance, "'instance'");
  const std::string_view class_name = expect_identifier("typeclass name after 'instance'");
  TypeNode * type = parse_type();
  const Token & open = expect(TokenKind::LBrace, "'{' after instance header");

  std::vector<MethodImpl *> methods;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & method_tok = cur();
    const std::string_view method = expect_identifier("method name");
    const Token & params_open = expect(TokenKind::LParen, "'(' after method name");
    auto params = parse_params(params_open);
    expect(TokenKind::Assign, "'=' before method body");
    Expr * body = parse_expr();
    methods.push_back(ast_.create<MethodImpl>(method, params, body, range_from(method_tok)));
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon)) {
    }
  }
  expect_closing(TokenKind::RBrace, open, "instance declaration");
  return ast_.create<InstanceDecl>(
    class_name, type, ast_.copy_to_arena(methods), range_from(first));
}

void Parser::parse_statement_list(
  const Token & opener, std::string_view construct, std::vector<Stmt *> & statements,
  Expr *& result)
{
  FlagScope scope(no_struct_literal_, false);
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    statements.push_back(parse_stmt());
  }
  expect_closing(TokenKind::RBrace, opener, construct);

  result = nullptr;
  if (!statements.empty()) {
    if (auto * last = dyn_cast<ExprStmt>(statements.back())) {
      result = last->expr;
      statements.pop_back();
    }
  }
}

// ============================================================================
// Types, parameters and patterns
// ============================================================================

TypeNode * Parser::parse_type()
{
  const Token & first = cur();

  if (at(TokenKind::LBracket)) {
    const Token & open = advance();
    TypeNode * elem = parse_type();
    expect_closing(TokenKind::RBracket, open, "array type");
    return ast_.create<GenericTypeNode>(ast_.intern("Array"), elem, range_from(first));
  }

  if (at(TokenKind::LParen)) {
    const Token & open = advance();
    std::vector<TypeNode *> params;
    while (!at(TokenKind::RParen) && !at_eof()) {
      params.push_back(parse_type());
      if (!match(TokenKind::Comma)) break;
    }
    expect_closing(TokenKind::RParen, open, "function type");
    if (params.empty() && !at(TokenKind::Arrow)) {
      return ast_.create<NamedTypeNode>(ast_.intern("Unit"), range_from(first));
    }
    expect(TokenKind::Arrow, "'->' in function type");
    TypeNode * result = parse_type();
    return ast_.create<FunctionTypeNode>(ast_.copy_to_arena(params), result, range_from(first));
  }

  const std::string_view name = expect_identifier("type");
  if ((name == "Array" || name == "Matrix" || name == "Task") && at(TokenKind::Lt)) {
    advance();
    TypeNode * arg = parse_type();
    expect(TokenKind::Gt, "'>' after type argument");
    return ast_.create<GenericTypeNode>(name, arg, range_from(first));
  }
  return ast_.create<NamedTypeNode>(name, range_from(first));
}

gsl::span<Param *> Parser::parse_params(const Token & opener)
{
  std::vector<Param *> params;
  while (!at(TokenKind::RParen) && !at_eof()) {
    const Token & param_tok = cur();
    const std::string_view name = expect_identifier("parameter name");
    TypeNode * type = nullptr;
    if (match(TokenKind::Colon)) {
      type = parse_type();
    }
    params.push_back(ast_.create<Param>(name, type, range_from(param_tok)));
    if (!match(TokenKind::Comma)) break;
  }
  expect_closing(TokenKind::RParen, opener, "parameter list");
  return ast_.copy_to_arena(params);
}

Pattern * Parser::parse_pattern()
{
  const Token & first = cur();

  switch (cur().kind) {
    case TokenKind::Identifier: {
      if (cur().text == "_") {
        advance();
        return ast_.create<WildcardPattern>(range_from(first));
      }
      const std::string_view name = expect_identifier("pattern");
      if (starts_uppercase(name) && at(TokenKind::LBrace)) {
        const Token & open = advance();
        std::vector<FieldPattern *> fields;
        while (!at(TokenKind::RBrace) && !at_eof()) {
          const Token & field_tok = cur();
          const std::string_view field = expect_identifier("field name in pattern");
          Pattern * sub = nullptr;
          if (match(TokenKind::Colon)) {
            sub = parse_pattern();
          }
          fields.push_back(ast_.create<FieldPattern>(field, sub, range_from(field_tok)));
          if (!match(TokenKind::Comma)) break;
        }
        expect_closing(TokenKind::RBrace, open, "struct pattern");
        return ast_.create<StructPattern>(name, ast_.copy_to_arena(fields), range_from(first));
      }
      return ast_.create<BindingPattern>(name, range_from(first));
    }
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::KwTrue:
    case TokenKind::KwFalse: {
      Expr * lit = parse_literal();
      return ast_.create<LiteralPattern>(lit, range_from(first));
    }
    case TokenKind::Minus: {
      advance();
      if (!at(TokenKind::IntLiteral) && !at(TokenKind::FloatLiteral)) {
        error_unexpected("numeric literal after '-' in pattern");
      }
      Expr * lit = parse_literal();
      if (auto * i = dyn_cast<IntLiteralExpr>(lit)) {
        i->value = -i->value;
      } else if (auto * f = dyn_cast<FloatLiteralExpr>(lit)) {
        f->value = -f->value;
      }
      lit->range_ = range_from(first);
      return ast_.create<LiteralPattern>(lit, range_from(first));
    }
    case TokenKind::LBracket: {
      const Token & open = advance();
      std::vector<Pattern *> elems;
      while (!at(TokenKind::RBracket) && !at_eof()) {
        elems.push_back(parse_pattern());
        if (!match(TokenKind::Comma)) break;
      }
      expect_closing(TokenKind::RBracket, open, "array pattern");
      return ast_.create<ArrayPattern>(ast_.copy_to_arena(elems), range_from(first));
    }
    default:
      error_unexpected("pattern");
  }
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr()
{
  if (at(TokenKind::KwLet)) {
    return parse_let_expr();
  }
  return parse_assign();
}

Expr * Parser::parse_expr_no_struct()
{
  FlagScope scope(no_struct_literal_, true);
  return parse_expr();
}

Expr * Parser::parse_let_expr()
{
  const Token & first = expect(TokenKind::KwLet, "'let'");
  const bool is_mut = match(TokenKind::KwMut);
  const std::string_view name = expect_identifier("binding name after 'let'");
  TypeNode * annotation = nullptr;
  if (match(TokenKind::Colon)) {
    annotation = parse_type();
  }
  expect(TokenKind::Assign, "'=' in let binding");
  Expr * value = parse_expr();
  expect(TokenKind::KwIn, "'in' after let binding in expression");
  Expr * body = parse_expr();
  return ast_.create<LetExpr>(name, is_mut, annotation, value, body, range_from(first));
}

Expr * Parser::parse_assign()
{
  const Token & first = cur();
  Expr * lhs = parse_or();
  if (!at(TokenKind::Assign)) {
    return lhs;
  }
  auto * target = dyn_cast<IdentifierExpr>(lhs);
  if (target == nullptr) {
    error_unexpected("end of expression (only a variable can be assigned)");
  }
  advance();
  Expr * value = parse_assign();
  return ast_.create<AssignExpr>(target->name, value, range_from(first));
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (at(TokenKind::OrOr)) {
    advance();
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_equality();
  while (at(TokenKind::AndAnd)) {
    advance();
    Expr * rhs = parse_equality();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_relational();
  while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    const BinaryOp op = at(TokenKind::EqEq) ? BinaryOp::Eq : BinaryOp::Ne;
    advance();
    Expr * rhs = parse_relational();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_relational()
{
  Expr * lhs = parse_range();
  while (true) {
    BinaryOp op;
    if (at(TokenKind::Lt)) {
      op = BinaryOp::Lt;
    } else if (at(TokenKind::Le)) {
      op = BinaryOp::Le;
    } else if (at(TokenKind::Gt)) {
      op = BinaryOp::Gt;
    } else if (at(TokenKind::Ge)) {
      op = BinaryOp::Ge;
    } else {
      break;
    }
    advance();
    Expr * rhs = parse_range();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_range()
{
  Expr * lhs = parse_additive();
  if (at(TokenKind::DotDot)) {
    advance();
    Expr * rhs = parse_additive();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Range, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_additive()
{
  Expr * lhs = parse_multiplicative();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = at(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    advance();
    Expr * rhs = parse_multiplicative();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_multiplicative()
{
  Expr * lhs = parse_unary();
  while (at(TokenKind::Star) || at(TokenKind::Slash) || at(TokenKind::Percent)) {
    BinaryOp op = BinaryOp::Mul;
    if (at(TokenKind::Slash)) {
      op = BinaryOp::Div;
    } else if (at(TokenKind::Percent)) {
      op = BinaryOp::Mod;
    }
    advance();
    Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  if (at(TokenKind::Minus) || at(TokenKind::Bang)) {
    const Token & op_tok = advance();
    const UnaryOp op = op_tok.kind == TokenKind::Minus ? UnaryOp::Neg : UnaryOp::Not;
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, join_ranges(op_tok.range, operand->get_range()));
  }
  return parse_power();
}

Expr * Parser::parse_power()
{
  Expr * base = parse_postfix();
  if (at(TokenKind::Caret)) {
    advance();
    Expr * exponent = parse_unary();  // right-associative, allows 2 ^ -1
    return ast_.create<BinaryExpr>(
      base, BinaryOp::Pow, exponent, join_ranges(base->get_range(), exponent->get_range()));
  }
  return base;
}

Expr * Parser::parse_postfix()
{
  const Token & first = cur();
  Expr * e = parse_primary();

  while (true) {
    if (at(TokenKind::LParen)) {
      const Token & open = advance();
      FlagScope scope(no_struct_literal_, false);
      std::vector<Expr *> args;
      while (!at(TokenKind::RParen) && !at_eof()) {
        args.push_back(parse_expr());
        if (!match(TokenKind::Comma)) break;
      }
      expect_closing(TokenKind::RParen, open, "argument list");
      e = ast_.create<CallExpr>(e, ast_.copy_to_arena(args), range_from(first));
      continue;
    }
    if (at(TokenKind::LBracket)) {
      const Token & open = advance();
      FlagScope scope(no_struct_literal_, false);
      Expr * index = parse_expr();
      expect_closing(TokenKind::RBracket, open, "index expression");
      e = ast_.create<IndexExpr>(e, index, range_from(first));
      continue;
    }
    if (at(TokenKind::Dot)) {
      advance();
      const std::string_view field = expect_identifier("field name after '.'");
      e = ast_.create<FieldAccessExpr>(e, field, range_from(first));
      continue;
    }
    break;
  }
  return e;
}

Expr * Parser::parse_primary()
{
  switch (cur().kind) {
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
      return parse_literal();
    case TokenKind::Identifier: {
      if (is_struct_literal_start()) {
        return parse_struct_literal();
      }
      const Token & t = advance();
      return ast_.create<IdentifierExpr>(ast_.intern(t.text), t.range);
    }
    case TokenKind::LParen:
      return is_lambda_start() ? parse_lambda() : parse_paren_or_unit();
    case TokenKind::LBracket:
      return parse_array_like();
    case TokenKind::LBrace:
      return parse_block();
    case TokenKind::KwIf:
      return parse_if();
    case TokenKind::KwMatch:
      return parse_match();
    case TokenKind::KwLet:
      return parse_let_expr();
    case TokenKind::KwParallel:
      return parse_parallel();
    case TokenKind::KwSpawn: {
      const Token & first = advance();
      Expr * body = parse_unary();
      return ast_.create<SpawnExpr>(body, range_from(first));
    }
    case TokenKind::KwWait: {
      const Token & first = advance();
      Expr * target = parse_unary();
      return ast_.create<WaitExpr>(target, range_from(first));
    }
    default:
      error_unexpected("expression");
  }
}

Expr * Parser::parse_literal()
{
  const Token & t = advance();
  switch (t.kind) {
    case TokenKind::IntLiteral: {
      int64_t value = 0;
      const auto * begin = t.text.data();
      const auto * end = t.text.data() + t.text.size();
      const auto [ptr, ec] = std::from_chars(begin, end, value);
      if (ec != std::errc() || ptr != end) {
        error_at(
          t.range, ErrorCode::UnexpectedToken,
          fmt::format("integer literal '{}' is out of range", t.text));
      }
      return ast_.create<IntLiteralExpr>(value, t.range);
    }
    case TokenKind::FloatLiteral: {
      const std::string text(t.text);
      return ast_.create<FloatLiteralExpr>(std::strtod(text.c_str(), nullptr), t.range);
    }
    case TokenKind::StringLiteral:
      return ast_.create<StringLiteralExpr>(ast_.intern(unescape_string(t.text)), t.range);
    case TokenKind::KwTrue:
      return ast_.create<BoolLiteralExpr>(true, t.range);
    case TokenKind::KwFalse:
      return ast_.create<BoolLiteralExpr>(false, t.range);
    default:
      break;
  }
  error_at(t.range, ErrorCode::UnexpectedToken, "expected literal");
}

Expr * Parser::parse_lambda()
{
  const Token & open = expect(TokenKind::LParen, "'('");
  auto params = parse_params(open);
  TypeNode * ret = nullptr;
  if (match(TokenKind::Arrow)) {
    ret = parse_type();
  }
  expect(TokenKind::FatArrow, "'=>' before lambda body");
  Expr * body = parse_expr();
  return ast_.create<LambdaExpr>(params, ret, body, range_from(open));
}

Expr * Parser::parse_paren_or_unit()
{
  const Token & open = expect(TokenKind::LParen, "'('");
  if (match(TokenKind::RParen)) {
    return ast_.create<UnitLiteralExpr>(range_from(open));
  }
  FlagScope scope(no_struct_literal_, false);
  Expr * inner = parse_expr();
  expect_closing(TokenKind::RParen, open, "parenthesized expression");
  return inner;
}

Expr * Parser::parse_array_like()
{
  const Token & open = expect(TokenKind::LBracket, "'['");
  FlagScope scope(no_struct_literal_, false);

  if (match(TokenKind::RBracket)) {
    return ast_.create<ArrayLiteralExpr>(gsl::span<Expr *>{}, range_from(open));
  }

  Expr * first = parse_expr();

  // [element | x in xs if cond | y in ys]
  if (at(TokenKind::Pipe)) {
    std::vector<Generator *> generators;
    while (at(TokenKind::Pipe)) {
      advance();
      const Token & gen_tok = cur();
      const std::string_view var = expect_identifier("generator variable");
      expect(TokenKind::KwIn, "'in' in comprehension generator");
      Expr * source = parse_expr_no_struct();
      std::vector<Expr *> filters;
      while (match(TokenKind::KwIf)) {
        filters.push_back(parse_expr_no_struct());
      }
      generators.push_back(
        ast_.create<Generator>(var, source, ast_.copy_to_arena(filters), range_from(gen_tok)));
    }
    expect_closing(TokenKind::RBracket, open, "comprehension");
    return ast_.create<ComprehensionExpr>(
      first, ast_.copy_to_arena(generators), range_from(open));
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBracket)) break;
    elements.push_back(parse_expr());
  }
  expect_closing(TokenKind::RBracket, open, "array literal");

  // Rows of equal, non-zero length form a matrix candidate.
  std::vector<ArrayLiteralExpr *> rows;
  for (auto * e : elements) {
    auto * row = dyn_cast<ArrayLiteralExpr>(e);
    if (row == nullptr || row->elements.empty() ||
        row->elements.size() != cast<ArrayLiteralExpr>(elements.front())->elements.size()) {
      rows.clear();
      break;
    }
    rows.push_back(row);
  }
  if (!rows.empty()) {
    const size_t columns = rows.front()->elements.size();
    return ast_.create<MatrixLiteralExpr>(ast_.copy_to_arena(rows), columns, range_from(open));
  }
  return ast_.create<ArrayLiteralExpr>(ast_.copy_to_arena(elements), range_from(open));
}

Expr * Parser::parse_struct_literal()
{
  const Token & first = cur();
  const std::string_view name = expect_identifier("struct name");
  const Token & open = expect(TokenKind::LBrace, "'{'");
  FlagScope scope(no_struct_literal_, false);

  std::vector<FieldInit *> fields;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & field_tok = cur();
    const std::string_view field = expect_identifier("field name");
    expect(TokenKind::Colon, "':' after field name");
    Expr * value = parse_expr();
    fields.push_back(ast_.create<FieldInit>(field, value, range_from(field_tok)));
    if (!match(TokenKind::Comma)) break;
  }
  expect_closing(TokenKind::RBrace, open, "struct literal");
  return ast_.create<StructLiteralExpr>(name, ast_.copy_to_arena(fields), range_from(first));
}

Expr * Parser::parse_block()
{
  const Token & open = expect(TokenKind::LBrace, "'{'");
  std::vector<Stmt *> statements;
  Expr * result = nullptr;
  parse_statement_list(open, "block", statements, result);
  return ast_.create<BlockExpr>(ast_.copy_to_arena(statements), result, range_from(open));
}

Expr * Parser::parse_if()
{
  const Token & first = expect(TokenKind::KwIf, "'if'");
  Expr * condition = parse_expr_no_struct();
  match(TokenKind::KwThen);
  Expr * then_branch = parse_expr();
  Expr * else_branch = nullptr;
  if (match(TokenKind::KwElse)) {
    else_branch = parse_expr();
  }
  return ast_.create<IfExpr>(condition, then_branch, else_branch, range_from(first));
}

Expr * Parser::parse_match()
{
  const Token & first = expect(TokenKind::KwMatch, "'match'");
  Expr * scrutinee = parse_expr_no_struct();
  const Token & open = expect(TokenKind::LBrace, "'{' after match scrutinee");
  FlagScope scope(no_struct_literal_, false);

  std::vector<MatchArm *> arms;
  while (!at(TokenKind::RBrace) && !at_eof()) {
    const Token & arm_tok = cur();
    Pattern * pattern = parse_pattern();
    Expr * guard = nullptr;
    if (match(TokenKind::KwIf)) {
      guard = parse_expr();
    }
    expect(TokenKind::FatArrow, "'=>' after match pattern");
    Expr * body = parse_expr();
    arms.push_back(ast_.create<MatchArm>(pattern, guard, body, range_from(arm_tok)));
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon)) {
    }
  }
  expect_closing(TokenKind::RBrace, open, "match expression");
  return ast_.create<MatchExpr>(scrutinee, ast_.copy_to_arena(arms), range_from(first));
}

Expr * Parser::parse_parallel()
{
  const Token & first = expect(TokenKind::KwParallel, "'parallel'");
  const Token & open = expect(TokenKind::LBrace, "'{' after 'parallel'");
  std::vector<Stmt *> statements;
  Expr * result = nullptr;
  parse_statement_list(open, "parallel block", statements, result);
  return ast_.create<ParallelExpr>(ast_.copy_to_arena(statements), result, range_from(first));
}

std::string Parser::unescape_string(std::string_view raw) const
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '0':
        out.push_back('\0');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case '"':
        out.push_back('"');
        break;
      default:
        // Unknown escapes keep the escaped character.
        out.push_back(esc);
        break;
    }
  }
  return out;
}

}  // namespace matrix_lang::syntax
