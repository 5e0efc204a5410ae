/**
 * @file drivers.hpp
 * @brief Fixed-step and adaptive trajectory drivers over caller-supplied output times.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include "rk/algebra.hpp"
#include "rk/butcher_table.hpp"
#include "rk/controller.hpp"
#include "rk/rk_stepper.hpp"
#include "rk/types.hpp"

namespace rk {

/** @brief Reject option sets the adaptive controller cannot run with. */
[[nodiscard]] inline IntegratorStatus ValidateOptions(const IntegratorOptions& opt) {
  if (!(opt.rtol > 0.0) || !std::isfinite(opt.rtol)) {
    return IntegratorStatus::InvalidTolerance;
  }
  if (!(opt.accept_tolerance_fraction > 0.0) || opt.accept_tolerance_fraction > 1.0) {
    return IntegratorStatus::InvalidTolerance;
  }
  if (!(opt.h_min > 0.0) || !(opt.h_max >= opt.h_min) || !std::isfinite(opt.h_min) || !std::isfinite(opt.h_max)) {
    return IntegratorStatus::InvalidStepSize;
  }
  if (!std::isfinite(opt.h_init)) {
    return IntegratorStatus::InvalidStepSize;
  }
  if (!(opt.fac_min > 0.0) || !(opt.fac_min < 1.0) || !(opt.fac_max > 1.0) || !std::isfinite(opt.fac_max)) {
    return IntegratorStatus::InvalidStepSize;
  }
  if (opt.max_retries < 0 || opt.max_steps <= 0) {
    return IntegratorStatus::InvalidOptions;
  }
  return IntegratorStatus::Success;
}

namespace detail {

template <class Time>
[[nodiscard]] inline IntegratorStatus validate_times(const std::vector<Time>& times) {
  if (times.empty()) {
    return IntegratorStatus::InvalidTimeSequence;
  }
  for (std::size_t i = 0; i < times.size(); ++i) {
    if (!std::isfinite(static_cast<double>(times[i]))) {
      return IntegratorStatus::InvalidTimeSequence;
    }
    if (i > 0 && !(times[i] > times[i - 1])) {
      return IntegratorStatus::InvalidTimeSequence;
    }
  }
  return IntegratorStatus::Success;
}

template <class Value, class Time, class RHS, class Algebra>
requires AlgebraFor<Algebra, Value, Time>
[[nodiscard]] inline Time estimate_initial_step(RHS& rhs,
                                                Time t0,
                                                const Value& y0,
                                                Time t1,
                                                const IntegratorOptions& opt,
                                                IntegratorStats& stats) {
  const double span = static_cast<double>(t1 - t0);
  const Value dydt0 = rhs(t0, y0);
  stats.rhs_evals += 1;

  double h0 = span / 100.0;
  if (Algebra::size(dydt0) == Algebra::size(y0) && Algebra::finite(dydt0)) {
    const double y_norm = Algebra::max_abs(y0);
    const double f_norm = Algebra::max_abs(dydt0);
    if (f_norm > 1e-16 && y_norm > 0.0) {
      h0 = 0.01 * (y_norm / f_norm);
    }
  }
  if (!std::isfinite(h0) || h0 <= 0.0) {
    h0 = opt.h_min;
  }
  return static_cast<Time>(std::clamp(h0, opt.h_min, opt.h_max));
}

template <class Value, class Time>
[[nodiscard]] inline bool call_observer(const Observer<Value, Time>& obs, Time t, const Value& y) {
  if (!obs) {
    return true;
  }
  return obs(t, y);
}

template <class Value, class Time>
inline void record(TrajectoryResult<Value, Time>& out, Time t, const Value& y) {
  out.trajectory.times.push_back(t);
  out.trajectory.values.push_back(y);
}

}  // namespace detail

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/**
 * @brief One explicit step per output interval.
 *
 * The returned times equal @p times by value. On failure the trajectory
 * holds every point reached before the failing interval.
 */
[[nodiscard]] TrajectoryResult<Value, Time> integrate_fixed(RHS&& rhs,
                                                            const std::vector<Time>& times,
                                                            const Value& y0,
                                                            const ButcherTable<Time>& table,
                                                            const Observer<Value, Time>& obs = {}) {
  TrajectoryResult<Value, Time> out{};
  out.status = detail::validate_times(times);
  if (out.status != IntegratorStatus::Success) {
    return out;
  }

  out.trajectory.times.reserve(times.size());
  out.trajectory.values.reserve(times.size());
  detail::record(out, times.front(), y0);

  ExplicitRKStepper<Value, Time, Algebra> stepper(table);
  Value y = y0;
  Value y_next{};

  for (std::size_t i = 1; i < times.size(); ++i) {
    const Time dt = times[i] - times[i - 1];
    out.stats.attempted_steps += 1;
    out.status = stepper.step(rhs, times[i - 1], dt, y, y_next);
    out.stats.rhs_evals += static_cast<long long>(table.stages());
    out.stats.last_h = static_cast<double>(dt);
    if (out.status != IntegratorStatus::Success) {
      return out;
    }

    Algebra::assign(y, y_next);
    out.stats.accepted_steps += 1;
    detail::record(out, times[i], y);

    if (!detail::call_observer(obs, times[i], y)) {
      out.status = IntegratorStatus::UserStopped;
      return out;
    }
  }

  out.status = IntegratorStatus::Success;
  return out;
}

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/**
 * @brief Fill every output interval with one adaptive controller run.
 *
 * Only values at the requested times are recorded. The step size accepted
 * at the end of one interval seeds the next. The first candidate is
 * opt.h_init when positive, otherwise estimated from |y0| / |f(t0, y0)|.
 */
[[nodiscard]] TrajectoryResult<Value, Time> integrate_adaptive(RHS&& rhs,
                                                               const std::vector<Time>& times,
                                                               const Value& y0,
                                                               const ButcherTable<Time>& table,
                                                               const IntegratorOptions& opt,
                                                               const Observer<Value, Time>& obs = {}) {
  TrajectoryResult<Value, Time> out{};
  if (!table.has_embedded()) {
    out.status = IntegratorStatus::MissingEmbeddedWeights;
    return out;
  }
  out.status = ValidateOptions(opt);
  if (out.status != IntegratorStatus::Success) {
    return out;
  }
  out.status = detail::validate_times(times);
  if (out.status != IntegratorStatus::Success) {
    return out;
  }

  out.trajectory.times.reserve(times.size());
  out.trajectory.values.reserve(times.size());
  detail::record(out, times.front(), y0);
  if (times.size() == 1) {
    return out;
  }

  IntegrationState<Value, Time> state{};
  state.current_time = times.front();
  state.current_value = y0;
  if (opt.h_init > 0.0) {
    state.candidate_step = static_cast<Time>(std::clamp(opt.h_init, opt.h_min, opt.h_max));
  } else {
    state.candidate_step =
        detail::estimate_initial_step<Value, Time, RHS, Algebra>(rhs, times[0], y0, times[1], opt, out.stats);
  }

  const StepSizeController controller{opt.fac_min, opt.fac_max, opt.accept_tolerance_fraction};
  ExplicitRKStepper<Value, Time, Algebra> stepper(table);

  for (std::size_t i = 1; i < times.size(); ++i) {
    out.status = advance_interval<Value, Time, RHS&, Algebra>(stepper, controller, rhs, state, times[i], opt,
                                                              out.stats);
    if (out.status != IntegratorStatus::Success) {
      return out;
    }

    detail::record(out, times[i], state.current_value);
    if (!detail::call_observer(obs, times[i], state.current_value)) {
      out.status = IntegratorStatus::UserStopped;
      return out;
    }
  }

  out.status = IntegratorStatus::Success;
  return out;
}

}  // namespace rk
