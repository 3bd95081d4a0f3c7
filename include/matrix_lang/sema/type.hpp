// matrix_lang/sema/type.hpp - Semantic type representation
//
// Types produced by inference. Every Type is owned by a TypeContext and is
// immutable once created; type variables are resolved through a
// Substitution (sema/unifier.hpp) rather than by mutating the variable.
//
#pragma once

#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace matrix_lang
{

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Primitive types
  Int,
  Float,
  Bool,
  String,
  Unit,
  Handle,  ///< Opaque reference to state owned by an external collaborator

  // Composite types
  Array,     ///< Array<T>
  Matrix,    ///< Matrix<T>
  Task,      ///< Task<T>, the result of `spawn`
  Function,  ///< (P1, P2, ...) -> R
  Struct,    ///< Nominal struct, compared by name

  // Inference placeholder
  Var,
};

using TypeVarId = uint32_t;

// ============================================================================
// Kind Masks
// ============================================================================

/**
 * Set of type constructors a type variable may still be bound to.
 *
 * Operators narrow the mask of their operand variable; binding two
 * variables intersects their masks.
 */
using KindMask = uint8_t;

inline constexpr KindMask k_mask_int = 1U << 0U;
inline constexpr KindMask k_mask_float = 1U << 1U;
inline constexpr KindMask k_mask_string = 1U << 2U;
inline constexpr KindMask k_mask_matrix = 1U << 3U;
inline constexpr KindMask k_mask_other = 1U << 4U;  ///< Bool, Unit, Array, Function, ...

inline constexpr KindMask k_mask_numeric = k_mask_int | k_mask_float;
inline constexpr KindMask k_mask_any =
  k_mask_int | k_mask_float | k_mask_string | k_mask_matrix | k_mask_other;

struct Type;

struct StructField
{
  std::string_view name;
  const Type * type = nullptr;
};

// ============================================================================
// Type
// ============================================================================

struct Type
{
  TypeKind kind;

  /// Array/Matrix/Task: element type
  const Type * element = nullptr;

  /// Function: parameter types and result
  gsl::span<const Type * const> params;
  const Type * result = nullptr;

  /// Struct: name and declared fields in order
  std::string_view name;
  gsl::span<const StructField> fields;

  /// Var: identity and admissible kinds
  TypeVarId var_id = 0;
  KindMask mask = k_mask_any;

  [[nodiscard]] bool is_var() const noexcept { return kind == TypeKind::Var; }
  [[nodiscard]] bool is_function() const noexcept { return kind == TypeKind::Function; }
  [[nodiscard]] bool is_numeric() const noexcept
  {
    return kind == TypeKind::Int || kind == TypeKind::Float;
  }

  /// Field lookup for Struct types (nullptr when absent)
  [[nodiscard]] const StructField * find_field(std::string_view field) const noexcept
  {
    for (const auto & f : fields) {
      if (f.name == field) return &f;
    }
    return nullptr;
  }
};

/// Mask bit that a concrete (non-variable) type occupies.
[[nodiscard]] KindMask kind_bit(const Type * type) noexcept;

/// "Int or Float", used in diagnostics about constrained variables.
[[nodiscard]] std::string describe_mask(KindMask mask);

/// Head constructor name used for typeclass dispatch ("Int", "Array", "Point").
[[nodiscard]] std::string_view dispatch_name(const Type * type) noexcept;

/// Render a type. Variables print as `t<id>`.
[[nodiscard]] std::string format_type(const Type * type);

// ============================================================================
// Scheme
// ============================================================================

/// Type with universally quantified variables: forall vars. body
struct Scheme
{
  std::vector<TypeVarId> vars;
  const Type * body = nullptr;

  [[nodiscard]] static Scheme mono(const Type * t) { return Scheme{{}, t}; }
  [[nodiscard]] bool is_polymorphic() const noexcept { return !vars.empty(); }
};

/// Render a scheme with its quantified variables renamed to a, b, c, ...
[[nodiscard]] std::string format_scheme(const Scheme & scheme);

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owner of all types of one session.
 *
 * Provides singletons for the primitive types, interns Array/Matrix/Task
 * per element type, and hands out fresh type variables from a counter that
 * lives as long as the context.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * unit_type() const noexcept { return &unit_; }
  [[nodiscard]] const Type * handle_type() const noexcept { return &handle_; }

  /// Look up a primitive type by its source name ("Int", "Float", ...).
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const noexcept;

  // ===========================================================================
  // Composite Types
  // ===========================================================================

  const Type * array_of(const Type * element);
  const Type * matrix_of(const Type * element);
  const Type * task_of(const Type * element);
  const Type * function_type(const std::vector<const Type *> & params, const Type * result);

  /// Create a struct type. `name` must outlive the context (interned by caller).
  const Type * struct_type(std::string_view name, const std::vector<StructField> & fields);

  // ===========================================================================
  // Type Variables
  // ===========================================================================

  [[nodiscard]] const Type * fresh_var(KindMask mask = k_mask_any);

  /// Number of variables created so far (the next id).
  [[nodiscard]] TypeVarId var_count() const noexcept { return next_var_id_; }

  /// Keeps a string alive for the lifetime of the context.
  [[nodiscard]] std::string_view intern(std::string_view s);

private:
  const Type * add(const Type & t);
  const Type * interned_generic(
    TypeKind kind, std::unordered_map<const Type *, const Type *> & cache, const Type * element);

  Type int_{TypeKind::Int};
  Type float_{TypeKind::Float};
  Type bool_{TypeKind::Bool};
  Type string_{TypeKind::String};
  Type unit_{TypeKind::Unit};
  Type handle_{TypeKind::Handle};

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to composite types are handed out widely; the deque keeps them stable.
  std::pmr::deque<Type> composite_types_{&arena_};
  std::pmr::deque<std::pmr::string> strings_{&arena_};

  std::unordered_map<const Type *, const Type *> arrays_;
  std::unordered_map<const Type *, const Type *> matrices_;
  std::unordered_map<const Type *, const Type *> tasks_;

  TypeVarId next_var_id_ = 0;
};

}  // namespace matrix_lang
