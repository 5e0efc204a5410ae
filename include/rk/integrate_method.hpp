/**
 * @file integrate_method.hpp
 * @brief Tableau-level integration entry point choosing fixed or adaptive mode.
 */
#pragma once

#include <vector>

#include "rk/drivers.hpp"

namespace rk {

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/** @brief Adaptive run when the table has embedded weights and opt.adaptive is set, fixed otherwise. */
[[nodiscard]] TrajectoryResult<Value, Time> integrate_with_tableau(RHS&& rhs,
                                                                   const std::vector<Time>& times,
                                                                   const Value& y0,
                                                                   const ButcherTable<Time>& table,
                                                                   const IntegratorOptions& opt,
                                                                   const Observer<Value, Time>& obs = {}) {
  if (table.has_embedded() && opt.adaptive) {
    return integrate_adaptive<Value, Time, RHS&, Algebra>(rhs, times, y0, table, opt, obs);
  }
  return integrate_fixed<Value, Time, RHS&, Algebra>(rhs, times, y0, table, obs);
}

}  // namespace rk
