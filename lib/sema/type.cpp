// matrix_lang/sema/type.cpp - Type context and type formatting
//
#include "matrix_lang/sema/type.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <memory>
#include <unordered_map>
#include <utility>

namespace matrix_lang
{

// ============================================================================
// Queries and Formatting
// ============================================================================

KindMask kind_bit(const Type * type) noexcept
{
  switch (type->kind) {
    case TypeKind::Int:
      return k_mask_int;
    case TypeKind::Float:
      return k_mask_float;
    case TypeKind::String:
      return k_mask_string;
    case TypeKind::Matrix:
      return k_mask_matrix;
    case TypeKind::Var:
      return type->mask;
    default:
      return k_mask_other;
  }
}

std::string describe_mask(KindMask mask)
{
  static constexpr std::pair<KindMask, std::string_view> k_names[] = {
    {k_mask_int, "Int"},
    {k_mask_float, "Float"},
    {k_mask_string, "String"},
    {k_mask_matrix, "Matrix"},
  };

  if (mask == k_mask_any) {
    return "any type";
  }

  std::string out;
  for (const auto & [bit, name] : k_names) {
    if ((mask & bit) == 0) continue;
    if (!out.empty()) out += " or ";
    out += name;
  }
  return out.empty() ? "no type" : out;
}

std::string_view dispatch_name(const Type * type) noexcept
{
  switch (type->kind) {
    case TypeKind::Int:
      return "Int";
    case TypeKind::Float:
      return "Float";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::String:
      return "String";
    case TypeKind::Unit:
      return "Unit";
    case TypeKind::Handle:
      return "Handle";
    case TypeKind::Array:
      return "Array";
    case TypeKind::Matrix:
      return "Matrix";
    case TypeKind::Task:
      return "Task";
    case TypeKind::Function:
      return "Function";
    case TypeKind::Struct:
      return type->name;
    case TypeKind::Var:
      break;
  }
  return {};
}

namespace
{

using VarNames = std::unordered_map<TypeVarId, std::string>;

void format_into(std::string & out, const Type * type, const VarNames * names)
{
  switch (type->kind) {
    case TypeKind::Array:
    case TypeKind::Matrix:
    case TypeKind::Task:
      out += dispatch_name(type);
      out += '<';
      format_into(out, type->element, names);
      out += '>';
      return;
    case TypeKind::Function: {
      out += '(';
      bool first = true;
      for (const auto * p : type->params) {
        if (!first) out += ", ";
        first = false;
        format_into(out, p, names);
      }
      out += ") -> ";
      format_into(out, type->result, names);
      return;
    }
    case TypeKind::Var: {
      if (names != nullptr) {
        if (auto it = names->find(type->var_id); it != names->end()) {
          out += it->second;
          return;
        }
      }
      out += fmt::format("t{}", type->var_id);
      return;
    }
    default:
      out += dispatch_name(type);
      return;
  }
}

}  // namespace

std::string format_type(const Type * type)
{
  if (type == nullptr) {
    return "<unknown>";
  }
  std::string out;
  format_into(out, type, nullptr);
  return out;
}

std::string format_scheme(const Scheme & scheme)
{
  if (scheme.body == nullptr) {
    return "<unknown>";
  }

  VarNames names;
  for (size_t i = 0; i < scheme.vars.size(); ++i) {
    std::string name(1, static_cast<char>('a' + static_cast<char>(i % 26)));
    if (i >= 26) {
      name += std::to_string(i / 26);
    }
    names.emplace(scheme.vars[i], std::move(name));
  }

  std::string out;
  format_into(out, scheme.body, &names);
  return out;
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext() = default;

const Type * TypeContext::lookup_builtin(std::string_view name) const noexcept
{
  if (name == "Int") return &int_;
  if (name == "Float") return &float_;
  if (name == "Bool") return &bool_;
  if (name == "String") return &string_;
  if (name == "Unit") return &unit_;
  if (name == "Handle") return &handle_;
  return nullptr;
}

const Type * TypeContext::add(const Type & t)
{
  composite_types_.push_back(t);
  return &composite_types_.back();
}

const Type * TypeContext::interned_generic(
  TypeKind kind, std::unordered_map<const Type *, const Type *> & cache, const Type * element)
{
  if (auto it = cache.find(element); it != cache.end()) {
    return it->second;
  }
  Type t{kind};
  t.element = element;
  const Type * created = add(t);
  cache.emplace(element, created);
  return created;
}

const Type * TypeContext::array_of(const Type * element)
{
  return interned_generic(TypeKind::Array, arrays_, element);
}

const Type * TypeContext::matrix_of(const Type * element)
{
  return interned_generic(TypeKind::Matrix, matrices_, element);
}

const Type * TypeContext::task_of(const Type * element)
{
  return interned_generic(TypeKind::Task, tasks_, element);
}

const Type * TypeContext::function_type(
  const std::vector<const Type *> & params, const Type * result)
{
  const Type ** storage = nullptr;
  if (!params.empty()) {
    storage = static_cast<const Type **>(
      arena_.allocate(sizeof(const Type *) * params.size(), alignof(const Type *)));
    std::copy(params.begin(), params.end(), storage);
  }

  Type t{TypeKind::Function};
  t.params = gsl::span<const Type * const>(storage, params.size());
  t.result = result;
  return add(t);
}

const Type * TypeContext::struct_type(
  std::string_view name, const std::vector<StructField> & fields)
{
  StructField * storage = nullptr;
  if (!fields.empty()) {
    storage = static_cast<StructField *>(
      arena_.allocate(sizeof(StructField) * fields.size(), alignof(StructField)));
    std::uninitialized_copy(fields.begin(), fields.end(), storage);
  }

  Type t{TypeKind::Struct};
  t.name = name;
  t.fields = gsl::span<const StructField>(storage, fields.size());
  return add(t);
}

const Type * TypeContext::fresh_var(KindMask mask)
{
  Type t{TypeKind::Var};
  t.var_id = next_var_id_++;
  t.mask = mask;
  return add(t);
}

std::string_view TypeContext::intern(std::string_view s)
{
  strings_.emplace_back(s);
  return strings_.back();
}

}  // namespace matrix_lang
