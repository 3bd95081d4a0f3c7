// matrix_lang/runtime/arithmetic.hpp - Operator semantics on runtime values
#pragma once

#include <cstdint>

#include "matrix_lang/ast/ast_enums.hpp"
#include "matrix_lang/runtime/value.hpp"

namespace matrix_lang
{

/**
 * Apply a binary operator to two evaluated operands.
 *
 * Int arithmetic wraps on overflow and division truncates. Matrix `+`/`-`
 * is element-wise, Matrix `*` is the matrix product.
 *
 * @throws RuntimeError (without a range) for DivisionByZero, DomainError and
 *         ArgumentMismatch
 */
[[nodiscard]] Value apply_binary(BinaryOp op, const Value & lhs, const Value & rhs);

[[nodiscard]] Value apply_unary(UnaryOp op, const Value & operand);

/// Exponentiation by squaring. A negative exponent is a DomainError.
[[nodiscard]] int64_t int_pow(int64_t base, int64_t exponent);

}  // namespace matrix_lang
