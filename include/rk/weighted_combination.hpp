/**
 * @file weighted_combination.hpp
 * @brief Linear combination of stage derivatives with one tableau coefficient row.
 */
#pragma once

#include <cstddef>
#include <span>

#include "rk/algebra.hpp"
#include "rk/types.hpp"

namespace rk {

template <class Value, class Scalar = double, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Scalar>
/**
 * @brief Compute sum(coeffs[i] * values[i]) into @p out.
 *
 * The accumulator is seeded with coeffs[0] * values[0], so the value type
 * never needs an additive identity. Later zero coefficients are skipped.
 * @return LengthMismatch when the sequences differ in length or are empty.
 */
[[nodiscard]] IntegratorStatus weighted_combination(std::span<const Value> values,
                                                    std::span<const Scalar> coeffs,
                                                    Value& out) {
  if (values.empty() || values.size() != coeffs.size()) {
    return IntegratorStatus::LengthMismatch;
  }
  Algebra::assign(out, Algebra::scaled(coeffs[0], values[0]));
  for (std::size_t i = 1; i < values.size(); ++i) {
    if (coeffs[i] == Scalar(0)) {
      continue;
    }
    Algebra::axpy(coeffs[i], values[i], out);
  }
  return IntegratorStatus::Success;
}

}  // namespace rk
