/**
 * @file controller.hpp
 * @brief Adaptive step-size controller for embedded RK methods.
 */
#pragma once

#include <algorithm>
#include <cmath>

#include "rk/algebra.hpp"
#include "rk/error_norm.hpp"
#include "rk/rk_stepper.hpp"
#include "rk/types.hpp"

namespace rk {

/** @brief Clamped power-law step-size update driven by the embedded error ratio. */
struct StepSizeController {
  double fac_min = 0.01;
  double fac_max = 10.0;
  double accept_fraction = 0.5;

  /** @brief Clamped (tol / err_ratio)^(1/order); fac_max for a zero error. */
  [[nodiscard]] double factor(double tol, double err_ratio, int order) const {
    if (err_ratio <= 0.0) {
      return fac_max;
    }
    const double p = static_cast<double>(order);
    const double fac = std::pow(tol / err_ratio, 1.0 / p);
    if (std::isnan(fac)) {
      return fac_min;
    }
    return std::clamp(fac, fac_min, fac_max);
  }

  template <class Time>
  /** @brief Next candidate after a rejected attempt of size dt. Halves dt when the order is unknown. */
  [[nodiscard]] Time propose_after_reject(Time dt, double err_ratio, double tol, int order) const {
    if (order <= 0) {
      return dt / Time(2);
    }
    return dt * static_cast<Time>(factor(tol, err_ratio, order));
  }

  template <class Time>
  /**
   * @brief Next candidate after an accepted intermediate sub-step.
   *
   * Targets accept_fraction of the tolerance so the following attempt is
   * unlikely to be rejected. Without an order, dt is kept while the error
   * stays within that target and halved otherwise; unlike
   * propose_after_reject, an unknown order does not always halve here.
   */
  [[nodiscard]] Time propose_after_accept(Time dt, double err_ratio, double tol, int order) const {
    const double target = tol * accept_fraction;
    if (order <= 0) {
      return (err_ratio > target) ? dt / Time(2) : dt;
    }
    return dt * static_cast<Time>(factor(target, err_ratio, order));
  }
};

/** @brief Latest accepted (t, y) pair and the step size to attempt next. */
template <class Value, class Time = double>
struct IntegrationState {
  Time current_time{};
  Value current_value{};
  Time candidate_step{};
};

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/**
 * @brief Advance @p state from its current time to exactly @p t_next under opt.rtol.
 *
 * Sub-steps that would reach or pass t_next are shortened to land on it.
 * Rejected attempts retry from the same (t, y) with a smaller candidate;
 * accepted intermediate sub-steps advance the state and resize the
 * candidate for the next attempt. An accepted terminal sub-step leaves the
 * candidate untouched so it seeds the next interval.
 *
 * Fails with StepSizeUnderflow when a rejection would push the candidate
 * below opt.h_min or when the candidate is too small to move current_time
 * at its magnitude, MaxRetriesExceeded after more than opt.max_retries
 * consecutive rejections, and MaxStepsExceeded once stats.attempted_steps
 * reaches opt.max_steps. stats.last_h and stats.last_error_ratio describe
 * the last attempt.
 */
[[nodiscard]] IntegratorStatus advance_interval(ExplicitRKStepper<Value, Time, Algebra>& stepper,
                                                const StepSizeController& controller,
                                                RHS&& rhs,
                                                IntegrationState<Value, Time>& state,
                                                Time t_next,
                                                const IntegratorOptions& opt,
                                                IntegratorStats& stats) {
  const int order = stepper.table().order();
  const auto stages = static_cast<long long>(stepper.table().stages());
  const Time h_min = static_cast<Time>(opt.h_min);
  const Time h_max = static_cast<Time>(opt.h_max);

  Value y_high{};
  Value y_low{};
  int retries = 0;

  while (state.current_time < t_next) {
    if (stats.attempted_steps >= opt.max_steps) {
      return IntegratorStatus::MaxStepsExceeded;
    }

    // Intermediate sub-steps use the representable distance to the next
    // time, so the value and the clock advance by the same dt.
    const Time max_step = t_next - state.current_time;
    bool terminal = state.candidate_step >= max_step;
    Time t_new = t_next;
    Time dt = max_step;
    if (!terminal) {
      t_new = state.current_time + state.candidate_step;
      if (t_new >= t_next) {
        terminal = true;
        t_new = t_next;
      } else {
        dt = t_new - state.current_time;
        if (!(dt > Time(0))) {
          return IntegratorStatus::StepSizeUnderflow;
        }
      }
    }

    stats.attempted_steps += 1;
    const IntegratorStatus status =
        stepper.step_embedded(rhs, state.current_time, dt, state.current_value, y_high, y_low);
    stats.rhs_evals += stages;
    stats.last_h = static_cast<double>(dt);
    if (status != IntegratorStatus::Success) {
      return status;
    }

    const ErrorEstimate err = relative_max_error<Value, Algebra>(y_high, y_low);
    stats.last_error_ratio = err.ratio;
    if (std::isnan(err.ratio)) {
      return IntegratorStatus::NaNDetected;
    }

    if (err.ratio > opt.rtol) {
      stats.rejected_steps += 1;
      retries += 1;
      stats.max_retries_seen = std::max(stats.max_retries_seen, retries);

      const Time h_new = controller.propose_after_reject(dt, err.ratio, opt.rtol, order);
      if (!std::isfinite(static_cast<double>(h_new)) || h_new < h_min) {
        return IntegratorStatus::StepSizeUnderflow;
      }
      if (retries > opt.max_retries) {
        return IntegratorStatus::MaxRetriesExceeded;
      }
      state.candidate_step = h_new;
      continue;
    }

    stats.accepted_steps += 1;
    retries = 0;

    if (terminal) {
      state.current_time = t_next;
      Algebra::assign(state.current_value, y_high);
      return IntegratorStatus::Success;
    }

    state.current_time = t_new;
    Algebra::assign(state.current_value, y_high);
    const Time h_next = controller.propose_after_accept(dt, err.ratio, opt.rtol, order);
    state.candidate_step = std::clamp(h_next, h_min, h_max);
  }

  return IntegratorStatus::Success;
}

}  // namespace rk
