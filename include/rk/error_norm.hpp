/**
 * @file error_norm.hpp
 * @brief Max-norm relative error between the two embedded estimates.
 */
#pragma once

#include <limits>

#include "rk/algebra.hpp"

namespace rk {

struct ErrorEstimate {
  double abs_error = 0.0;
  double reference = 0.0;
  double ratio = 0.0;
};

template <class Value, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value>
/**
 * @brief Largest component of |y_high - y_low| relative to the largest component of |y_high|.
 *
 * An exactly reproduced step (zero error) yields ratio 0 regardless of the
 * reference; a non-zero error over a zero reference yields +infinity.
 */
[[nodiscard]] ErrorEstimate relative_max_error(const Value& y_high, const Value& y_low) {
  Value diff = y_high;
  Algebra::axpy(-1.0, y_low, diff);

  ErrorEstimate out{};
  out.abs_error = Algebra::max_abs(diff);
  out.reference = Algebra::max_abs(y_high);
  if (out.abs_error == 0.0) {
    out.ratio = 0.0;
  } else if (out.reference == 0.0) {
    out.ratio = std::numeric_limits<double>::infinity();
  } else {
    out.ratio = out.abs_error / out.reference;
  }
  return out;
}

}  // namespace rk
