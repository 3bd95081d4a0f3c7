// matrix_lang/runtime/value.hpp - Runtime value representation
//
// Values are cheap to copy: scalars are stored inline and aggregates are
// shared, immutable heap objects.
//
#pragma once

#include <cstdint>
#include <functional>
#include <gsl/span>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace matrix_lang
{

class Environment;
class Expr;
class Param;

// ============================================================================
// Value Kind
// ============================================================================

/// Order matches the alternatives of Value::Storage.
enum class ValueKind : uint8_t {
  Unit,
  Int,
  Float,
  Bool,
  String,
  Array,
  Matrix,
  Struct,
  Closure,
  Builtin,  ///< Reference to a Builtin Registry entry
  Method,   ///< Typeclass method, dispatched on its first argument
  Handle,   ///< Opaque id into the session's HandleTable
};

class Value;

struct ArrayValue
{
  std::vector<Value> elements;
};

/// Row-major Int or Float cells.
struct MatrixValue
{
  size_t rows = 0;
  size_t cols = 0;
  std::vector<Value> cells;

  [[nodiscard]] const Value & at(size_t r, size_t c) const { return cells[r * cols + c]; }
};

struct StructValue
{
  std::string name;
  std::vector<std::pair<std::string, Value>> fields;  ///< Declaration order

  [[nodiscard]] const Value * find_field(std::string_view field) const;
};

/// Natively compiled replacement for a closure body.
using CompiledFunction = std::function<Value(const std::vector<Value> &)>;

/**
 * Function value: parameters and body from the AST plus the frame in
 * effect where the function was created.
 *
 * A recursive closure does not find itself through `env` (that frame never
 * holds it). Each call binds `name` to the closure in the call frame instead.
 */
struct Closure
{
  gsl::span<Param * const> params;
  const Expr * body = nullptr;
  std::shared_ptr<Environment> env;
  std::string name;  ///< Binding name, empty for anonymous lambdas
  bool recursive = false;  ///< Bind `name` to itself on every call
  std::shared_ptr<const CompiledFunction> compiled;
};

struct BuiltinRef
{
  std::string name;
};

struct MethodRef
{
  std::string name;
};

struct HandleRef
{
  uint64_t id = 0;
  /// Result carried by a `spawn` handle; null for handles into the HandleTable.
  std::shared_ptr<const Value> task;
};

// ============================================================================
// Value
// ============================================================================

class Value
{
public:
  Value() = default;

  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static Value unit() { return Value(); }
  static Value make_int(int64_t v) { return Value(Storage(std::in_place_index<1>, v)); }
  static Value make_float(double v) { return Value(Storage(std::in_place_index<2>, v)); }
  static Value make_bool(bool v) { return Value(Storage(std::in_place_index<3>, v)); }
  static Value make_string(std::string v);
  static Value make_array(std::vector<Value> elements);
  static Value make_matrix(size_t rows, size_t cols, std::vector<Value> cells);
  static Value make_struct(std::string name, std::vector<std::pair<std::string, Value>> fields);
  static Value make_closure(std::shared_ptr<const Closure> closure);
  static Value make_builtin(std::string name);
  static Value make_method(std::string name);
  static Value make_handle(uint64_t id);
  /// Handle of an already finished task; the result lives as long as the handle.
  static Value make_task(uint64_t id, Value result);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

  [[nodiscard]] bool is_unit() const noexcept { return kind() == ValueKind::Unit; }
  [[nodiscard]] bool is_int() const noexcept { return kind() == ValueKind::Int; }
  [[nodiscard]] bool is_float() const noexcept { return kind() == ValueKind::Float; }
  [[nodiscard]] bool is_numeric() const noexcept { return is_int() || is_float(); }
  [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
  [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
  [[nodiscard]] bool is_array() const noexcept { return kind() == ValueKind::Array; }
  [[nodiscard]] bool is_matrix() const noexcept { return kind() == ValueKind::Matrix; }
  [[nodiscard]] bool is_struct() const noexcept { return kind() == ValueKind::Struct; }
  [[nodiscard]] bool is_handle() const noexcept { return kind() == ValueKind::Handle; }
  [[nodiscard]] bool is_callable() const noexcept
  {
    return kind() == ValueKind::Closure || kind() == ValueKind::Builtin ||
           kind() == ValueKind::Method;
  }

  // ===========================================================================
  // Accessors (callers check the kind first)
  // ===========================================================================

  [[nodiscard]] int64_t as_int() const { return std::get<1>(data_); }
  [[nodiscard]] double as_float() const { return std::get<2>(data_); }
  [[nodiscard]] bool as_bool() const { return std::get<3>(data_); }
  [[nodiscard]] const std::string & as_string() const { return *std::get<4>(data_); }
  [[nodiscard]] const std::vector<Value> & as_array() const { return std::get<5>(data_)->elements; }
  [[nodiscard]] const MatrixValue & as_matrix() const { return *std::get<6>(data_); }
  [[nodiscard]] const StructValue & as_struct() const { return *std::get<7>(data_); }
  [[nodiscard]] const std::shared_ptr<const Closure> & as_closure() const
  {
    return std::get<8>(data_);
  }
  [[nodiscard]] const std::string & builtin_name() const { return std::get<9>(data_).name; }
  [[nodiscard]] const std::string & method_name() const { return std::get<10>(data_).name; }
  [[nodiscard]] uint64_t handle_id() const { return std::get<11>(data_).id; }
  /// Result of a task handle, or nullptr for any other value.
  [[nodiscard]] const Value * task_result() const
  {
    return is_handle() ? std::get<11>(data_).task.get() : nullptr;
  }

  /// Int or Float widened to double.
  [[nodiscard]] double to_double() const { return is_int() ? static_cast<double>(as_int()) : as_float(); }

private:
  using Storage = std::variant<
    std::monostate, int64_t, double, bool, std::shared_ptr<const std::string>,
    std::shared_ptr<const ArrayValue>, std::shared_ptr<const MatrixValue>,
    std::shared_ptr<const StructValue>, std::shared_ptr<const Closure>, BuiltinRef, MethodRef,
    HandleRef>;

  explicit Value(Storage data) : data_(std::move(data)) {}

  Storage data_;
};

// ============================================================================
// Helper Functions
// ============================================================================

/// Runtime type name used for typeclass dispatch and `type_of`.
[[nodiscard]] std::string_view runtime_type_name(const Value & value);

/// Display form used by `print` and the CLI ("[1, 2]", "Point { x: 1.0 }").
[[nodiscard]] std::string format_value(const Value & value);

/// Structural equality; floats compare within an epsilon.
[[nodiscard]] bool values_equal(const Value & lhs, const Value & rhs);

inline constexpr double k_float_epsilon = 1e-9;

}  // namespace matrix_lang
