/**
 * @file rk.hpp
 * @brief Primary runtime API for stepping and integrating with named RK methods.
 */
#pragma once

#include <vector>

#include "rk/controller.hpp"
#include "rk/drivers.hpp"
#include "rk/integrate_method.hpp"
#include "rk/methods.hpp"
#include "rk/rk_stepper.hpp"
#include "rk/types.hpp"

namespace rk {

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/** @brief One explicit step of a named method; embedded methods step with their b weights. */
[[nodiscard]] StepResult<Value> step(Method method, RHS&& rhs, Time t, Time dt, const Value& y) {
  const TableauResult<Time>& tab = tableau<Time>(method);
  if (!tab.ok()) {
    StepResult<Value> fallback{};
    fallback.status = tab.status;
    return fallback;
  }
  return explicit_step<Value, Time, RHS&, Algebra>(rhs, t, dt, y, *tab.table);
}

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/** @brief Integrate over @p times with runtime method selection and shared options/observer API. */
[[nodiscard]] TrajectoryResult<Value, Time> integrate(Method method,
                                                      RHS&& rhs,
                                                      const std::vector<Time>& times,
                                                      const Value& y0,
                                                      const IntegratorOptions& opt,
                                                      const Observer<Value, Time>& obs = {}) {
  const TableauResult<Time>& tab = tableau<Time>(method);
  if (!tab.ok()) {
    TrajectoryResult<Value, Time> fallback{};
    fallback.status = tab.status;
    return fallback;
  }
  return integrate_with_tableau<Value, Time, RHS&, Algebra>(rhs, times, y0, *tab.table, opt, obs);
}

}  // namespace rk
