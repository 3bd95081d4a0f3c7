// matrix_lang/ast/json_visitor.cpp - JSON serialization implementation
//
#include "matrix_lang/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "matrix_lang/ast/visitor.hpp"

namespace matrix_lang
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (!r.is_valid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

class JsonBuilder : public ConstAstVisitor<JsonBuilder, json>
{
public:
  template <typename Span>
  json list(const Span & nodes)
  {
    json arr = json::array();
    for (const auto * n : nodes) {
      arr.push_back(visit(n));
    }
    return arr;
  }

  json opt(const AstNode * n) { return n ? visit(n) : json(nullptr); }

  static json node(std::string_view type, const AstNode * n)
  {
    return json{{"type", std::string(type)}, {"range", j_range(n->get_range())}};
  }

  // --- Expressions --------------------------------------------------------

  json visit_int_literal_expr(const IntLiteralExpr * e)
  {
    auto j = node("IntLiteralExpr", e);
    j["value"] = e->value;
    return j;
  }

  json visit_float_literal_expr(const FloatLiteralExpr * e)
  {
    auto j = node("FloatLiteralExpr", e);
    j["value"] = e->value;
    return j;
  }

  json visit_string_literal_expr(const StringLiteralExpr * e)
  {
    auto j = node("StringLiteralExpr", e);
    j["value"] = std::string(e->value);
    return j;
  }

  json visit_bool_literal_expr(const BoolLiteralExpr * e)
  {
    auto j = node("BoolLiteralExpr", e);
    j["value"] = e->value;
    return j;
  }

  json visit_unit_literal_expr(const UnitLiteralExpr * e) { return node("UnitLiteralExpr", e); }

  json visit_identifier_expr(const IdentifierExpr * e)
  {
    auto j = node("IdentifierExpr", e);
    j["name"] = std::string(e->name);
    return j;
  }

  json visit_binary_expr(const BinaryExpr * e)
  {
    auto j = node("BinaryExpr", e);
    j["op"] = std::string(to_string(e->op));
    j["lhs"] = visit(e->lhs);
    j["rhs"] = visit(e->rhs);
    return j;
  }

  json visit_unary_expr(const UnaryExpr * e)
  {
    auto j = node("UnaryExpr", e);
    j["op"] = std::string(to_string(e->op));
    j["operand"] = visit(e->operand);
    return j;
  }

  json visit_call_expr(const CallExpr * e)
  {
    auto j = node("CallExpr", e);
    j["callee"] = visit(e->callee);
    j["args"] = list(e->args);
    return j;
  }

  json visit_index_expr(const IndexExpr * e)
  {
    auto j = node("IndexExpr", e);
    j["base"] = visit(e->base);
    j["index"] = visit(e->index);
    return j;
  }

  json visit_field_access_expr(const FieldAccessExpr * e)
  {
    auto j = node("FieldAccessExpr", e);
    j["base"] = visit(e->base);
    j["field"] = std::string(e->field);
    return j;
  }

  json visit_lambda_expr(const LambdaExpr * e)
  {
    auto j = node("LambdaExpr", e);
    j["params"] = list(e->params);
    j["returnType"] = opt(e->returnType);
    j["body"] = visit(e->body);
    return j;
  }

  json visit_let_expr(const LetExpr * e)
  {
    auto j = node("LetExpr", e);
    j["name"] = std::string(e->name);
    j["mutable"] = e->isMutable;
    j["typeAnnotation"] = opt(e->typeAnnotation);
    j["value"] = visit(e->value);
    j["body"] = visit(e->body);
    return j;
  }

  json visit_assign_expr(const AssignExpr * e)
  {
    auto j = node("AssignExpr", e);
    j["target"] = std::string(e->target);
    j["value"] = visit(e->value);
    return j;
  }

  json visit_block_expr(const BlockExpr * e)
  {
    auto j = node("BlockExpr", e);
    j["statements"] = list(e->statements);
    j["result"] = opt(e->result);
    return j;
  }

  json visit_if_expr(const IfExpr * e)
  {
    auto j = node("IfExpr", e);
    j["condition"] = visit(e->condition);
    j["then"] = visit(e->thenBranch);
    j["else"] = opt(e->elseBranch);
    return j;
  }

  json visit_match_expr(const MatchExpr * e)
  {
    auto j = node("MatchExpr", e);
    j["scrutinee"] = visit(e->scrutinee);
    j["arms"] = list(e->arms);
    return j;
  }

  json visit_struct_literal_expr(const StructLiteralExpr * e)
  {
    auto j = node("StructLiteralExpr", e);
    j["typeName"] = std::string(e->typeName);
    j["fields"] = list(e->fields);
    return j;
  }

  json visit_array_literal_expr(const ArrayLiteralExpr * e)
  {
    auto j = node("ArrayLiteralExpr", e);
    j["elements"] = list(e->elements);
    return j;
  }

  json visit_matrix_literal_expr(const MatrixLiteralExpr * e)
  {
    auto j = node("MatrixLiteralExpr", e);
    j["rows"] = list(e->rows);
    j["columns"] = e->columns;
    j["isMatrix"] = e->isMatrix;
    return j;
  }

  json visit_comprehension_expr(const ComprehensionExpr * e)
  {
    auto j = node("ComprehensionExpr", e);
    j["element"] = visit(e->element);
    j["generators"] = list(e->generators);
    return j;
  }

  json visit_parallel_expr(const ParallelExpr * e)
  {
    auto j = node("ParallelExpr", e);
    j["statements"] = list(e->statements);
    j["result"] = opt(e->result);
    return j;
  }

  json visit_spawn_expr(const SpawnExpr * e)
  {
    auto j = node("SpawnExpr", e);
    j["body"] = visit(e->body);
    return j;
  }

  json visit_wait_expr(const WaitExpr * e)
  {
    auto j = node("WaitExpr", e);
    j["target"] = visit(e->target);
    return j;
  }

  // --- Types --------------------------------------------------------------

  json visit_named_type(const NamedTypeNode * t)
  {
    auto j = node("NamedType", t);
    j["name"] = std::string(t->name);
    return j;
  }

  json visit_generic_type(const GenericTypeNode * t)
  {
    auto j = node("GenericType", t);
    j["name"] = std::string(t->name);
    j["argument"] = visit(t->argument);
    return j;
  }

  json visit_function_type(const FunctionTypeNode * t)
  {
    auto j = node("FunctionType", t);
    j["params"] = list(t->params);
    j["result"] = visit(t->result);
    return j;
  }

  // --- Patterns -----------------------------------------------------------

  json visit_wildcard_pattern(const WildcardPattern * p) { return node("WildcardPattern", p); }

  json visit_binding_pattern(const BindingPattern * p)
  {
    auto j = node("BindingPattern", p);
    j["name"] = std::string(p->name);
    return j;
  }

  json visit_literal_pattern(const LiteralPattern * p)
  {
    auto j = node("LiteralPattern", p);
    j["literal"] = visit(p->literal);
    return j;
  }

  json visit_struct_pattern(const StructPattern * p)
  {
    auto j = node("StructPattern", p);
    j["typeName"] = std::string(p->typeName);
    j["fields"] = list(p->fields);
    return j;
  }

  json visit_array_pattern(const ArrayPattern * p)
  {
    auto j = node("ArrayPattern", p);
    j["elements"] = list(p->elements);
    return j;
  }

  // --- Statements and declarations ----------------------------------------

  json visit_let_stmt(const LetStmt * s)
  {
    auto j = node("LetStmt", s);
    j["name"] = std::string(s->name);
    j["mutable"] = s->isMutable;
    j["typeAnnotation"] = opt(s->typeAnnotation);
    j["value"] = visit(s->value);
    j["attributes"] = list(s->attributes);
    return j;
  }

  json visit_expr_stmt(const ExprStmt * s)
  {
    auto j = node("ExprStmt", s);
    j["expr"] = visit(s->expr);
    return j;
  }

  json visit_module_decl(const ModuleDecl * d)
  {
    auto j = node("ModuleDecl", d);
    j["name"] = std::string(d->name);
    return j;
  }

  json visit_import_decl(const ImportDecl * d)
  {
    auto j = node("ImportDecl", d);
    j["module"] = std::string(d->moduleName);
    json items = json::array();
    for (const auto item : d->items) {
      items.push_back(std::string(item));
    }
    j["items"] = std::move(items);
    return j;
  }

  json visit_struct_decl(const StructDecl * d)
  {
    auto j = node("StructDecl", d);
    j["name"] = std::string(d->name);
    j["fields"] = list(d->fields);
    return j;
  }

  json visit_typeclass_decl(const TypeclassDecl * d)
  {
    auto j = node("TypeclassDecl", d);
    j["name"] = std::string(d->name);
    j["typeParam"] = std::string(d->typeParam);
    j["methods"] = list(d->methods);
    return j;
  }

  json visit_instance_decl(const InstanceDecl * d)
  {
    auto j = node("InstanceDecl", d);
    j["class"] = std::string(d->className);
    j["instanceType"] = visit(d->type);
    j["methods"] = list(d->methods);
    return j;
  }

  // --- Supporting nodes ---------------------------------------------------

  json visit_param(const Param * p)
  {
    auto j = node("Param", p);
    j["name"] = std::string(p->name);
    j["paramType"] = opt(p->type);
    return j;
  }

  json visit_attribute(const Attribute * a)
  {
    auto j = node("Attribute", a);
    j["name"] = std::string(a->name);
    j["args"] = list(a->args);
    return j;
  }

  json visit_field_init(const FieldInit * f)
  {
    auto j = node("FieldInit", f);
    j["name"] = std::string(f->name);
    j["value"] = visit(f->value);
    return j;
  }

  json visit_field_decl(const FieldDecl * f)
  {
    auto j = node("FieldDecl", f);
    j["name"] = std::string(f->name);
    j["fieldType"] = visit(f->type);
    return j;
  }

  json visit_field_pattern(const FieldPattern * f)
  {
    auto j = node("FieldPattern", f);
    j["name"] = std::string(f->name);
    j["pattern"] = opt(f->pattern);
    return j;
  }

  json visit_match_arm(const MatchArm * a)
  {
    auto j = node("MatchArm", a);
    j["pattern"] = visit(a->pattern);
    j["guard"] = opt(a->guard);
    j["body"] = visit(a->body);
    return j;
  }

  json visit_generator(const Generator * g)
  {
    auto j = node("Generator", g);
    j["variable"] = std::string(g->variable);
    j["source"] = visit(g->source);
    j["filters"] = list(g->filters);
    return j;
  }

  json visit_method_sig(const MethodSig * m)
  {
    auto j = node("MethodSig", m);
    j["name"] = std::string(m->name);
    j["signature"] = visit(m->type);
    return j;
  }

  json visit_method_impl(const MethodImpl * m)
  {
    auto j = node("MethodImpl", m);
    j["name"] = std::string(m->name);
    j["params"] = list(m->params);
    j["body"] = visit(m->body);
    return j;
  }

  json visit_program(const Program * p)
  {
    auto j = node("Program", p);
    j["items"] = list(p->items);
    return j;
  }
};

}  // namespace

json to_json(const AstNode * node)
{
  if (!node) return json(nullptr);
  JsonBuilder builder;
  return builder.visit(node);
}

json to_json(const Program * program) { return to_json(static_cast<const AstNode *>(program)); }

}  // namespace matrix_lang
