// matrix_lang/runtime/value.cpp - Runtime value representation
#include "matrix_lang/runtime/value.hpp"

#include <fmt/format.h>

#include <cmath>

namespace matrix_lang
{

const Value * StructValue::find_field(std::string_view field) const
{
  for (const auto & [name, value] : fields) {
    if (name == field) return &value;
  }
  return nullptr;
}

// ============================================================================
// Factory Methods
// ============================================================================

Value Value::make_string(std::string v)
{
  return Value(Storage(std::in_place_index<4>, std::make_shared<const std::string>(std::move(v))));
}

Value Value::make_array(std::vector<Value> elements)
{
  return Value(
    Storage(std::in_place_index<5>, std::make_shared<const ArrayValue>(ArrayValue{std::move(elements)})));
}

Value Value::make_matrix(size_t rows, size_t cols, std::vector<Value> cells)
{
  return Value(Storage(
    std::in_place_index<6>,
    std::make_shared<const MatrixValue>(MatrixValue{rows, cols, std::move(cells)})));
}

Value Value::make_struct(std::string name, std::vector<std::pair<std::string, Value>> fields)
{
  return Value(Storage(
    std::in_place_index<7>,
    std::make_shared<const StructValue>(StructValue{std::move(name), std::move(fields)})));
}

Value Value::make_closure(std::shared_ptr<const Closure> closure)
{
  return Value(Storage(std::in_place_index<8>, std::move(closure)));
}

Value Value::make_builtin(std::string name)
{
  return Value(Storage(std::in_place_index<9>, BuiltinRef{std::move(name)}));
}

Value Value::make_method(std::string name)
{
  return Value(Storage(std::in_place_index<10>, MethodRef{std::move(name)}));
}

Value Value::make_handle(uint64_t id)
{
  return Value(Storage(std::in_place_index<11>, HandleRef{id, nullptr}));
}

Value Value::make_task(uint64_t id, Value result)
{
  return Value(Storage(
    std::in_place_index<11>, HandleRef{id, std::make_shared<const Value>(std::move(result))}));
}

// ============================================================================
// Helper Functions
// ============================================================================

std::string_view runtime_type_name(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Unit:
      return "Unit";
    case ValueKind::Int:
      return "Int";
    case ValueKind::Float:
      return "Float";
    case ValueKind::Bool:
      return "Bool";
    case ValueKind::String:
      return "String";
    case ValueKind::Array:
      return "Array";
    case ValueKind::Matrix:
      return "Matrix";
    case ValueKind::Struct:
      return value.as_struct().name;
    case ValueKind::Closure:
    case ValueKind::Builtin:
    case ValueKind::Method:
      return "Function";
    case ValueKind::Handle:
      return "Handle";
  }
  return "Unit";
}

namespace
{

std::string format_float(double v)
{
  if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 1e15) {
    return fmt::format("{:.1f}", v);
  }
  return fmt::format("{}", v);
}

void format_into(std::string & out, const Value & value, bool nested)
{
  switch (value.kind()) {
    case ValueKind::Unit:
      out += "()";
      return;
    case ValueKind::Int:
      out += fmt::format("{}", value.as_int());
      return;
    case ValueKind::Float:
      out += format_float(value.as_float());
      return;
    case ValueKind::Bool:
      out += value.as_bool() ? "true" : "false";
      return;
    case ValueKind::String:
      if (nested) {
        out += fmt::format("\"{}\"", value.as_string());
      } else {
        out += value.as_string();
      }
      return;
    case ValueKind::Array: {
      out += '[';
      bool first = true;
      for (const auto & e : value.as_array()) {
        if (!first) out += ", ";
        first = false;
        format_into(out, e, true);
      }
      out += ']';
      return;
    }
    case ValueKind::Matrix: {
      const auto & m = value.as_matrix();
      out += '[';
      for (size_t r = 0; r < m.rows; ++r) {
        if (r != 0) out += ", ";
        out += '[';
        for (size_t c = 0; c < m.cols; ++c) {
          if (c != 0) out += ", ";
          format_into(out, m.at(r, c), true);
        }
        out += ']';
      }
      out += ']';
      return;
    }
    case ValueKind::Struct: {
      const auto & s = value.as_struct();
      out += s.name;
      out += " {";
      bool first = true;
      for (const auto & [name, field] : s.fields) {
        out += first ? " " : ", ";
        first = false;
        out += name;
        out += ": ";
        format_into(out, field, true);
      }
      out += " }";
      return;
    }
    case ValueKind::Closure: {
      const auto & name = value.as_closure()->name;
      out += name.empty() ? "<lambda>" : fmt::format("<function {}>", name);
      return;
    }
    case ValueKind::Builtin:
      out += fmt::format("<builtin {}>", value.builtin_name());
      return;
    case ValueKind::Method:
      out += fmt::format("<method {}>", value.method_name());
      return;
    case ValueKind::Handle:
      out += fmt::format("<handle {}>", value.handle_id());
      return;
  }
}

}  // namespace

std::string format_value(const Value & value)
{
  std::string out;
  format_into(out, value, false);
  return out;
}

bool values_equal(const Value & lhs, const Value & rhs)
{
  if (lhs.is_numeric() && rhs.is_numeric() && (lhs.is_float() || rhs.is_float())) {
    return std::fabs(lhs.to_double() - rhs.to_double()) < k_float_epsilon;
  }
  if (lhs.kind() != rhs.kind()) return false;

  switch (lhs.kind()) {
    case ValueKind::Unit:
      return true;
    case ValueKind::Int:
      return lhs.as_int() == rhs.as_int();
    case ValueKind::Float:
      return std::fabs(lhs.as_float() - rhs.as_float()) < k_float_epsilon;
    case ValueKind::Bool:
      return lhs.as_bool() == rhs.as_bool();
    case ValueKind::String:
      return lhs.as_string() == rhs.as_string();
    case ValueKind::Array: {
      const auto & a = lhs.as_array();
      const auto & b = rhs.as_array();
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (!values_equal(a[i], b[i])) return false;
      }
      return true;
    }
    case ValueKind::Matrix: {
      const auto & a = lhs.as_matrix();
      const auto & b = rhs.as_matrix();
      if (a.rows != b.rows || a.cols != b.cols) return false;
      for (size_t i = 0; i < a.cells.size(); ++i) {
        if (!values_equal(a.cells[i], b.cells[i])) return false;
      }
      return true;
    }
    case ValueKind::Struct: {
      const auto & a = lhs.as_struct();
      const auto & b = rhs.as_struct();
      if (a.name != b.name || a.fields.size() != b.fields.size()) return false;
      for (size_t i = 0; i < a.fields.size(); ++i) {
        if (!values_equal(a.fields[i].second, b.fields[i].second)) return false;
      }
      return true;
    }
    case ValueKind::Closure:
      return lhs.as_closure() == rhs.as_closure();
    case ValueKind::Builtin:
      return lhs.builtin_name() == rhs.builtin_name();
    case ValueKind::Method:
      return lhs.method_name() == rhs.method_name();
    case ValueKind::Handle:
      return lhs.handle_id() == rhs.handle_id();
  }
  return false;
}

}  // namespace matrix_lang
