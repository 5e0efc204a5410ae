/**
 * @file rk_stepper.hpp
 * @brief Generic explicit Runge-Kutta single-step engine driven by a Butcher tableau.
 */
#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include "rk/algebra.hpp"
#include "rk/butcher_table.hpp"
#include "rk/types.hpp"
#include "rk/weighted_combination.hpp"

namespace rk {

/**
 * @brief Runs the stage recurrence of one tableau and keeps the stage buffers between steps.
 *
 * The table must outlive the stepper. The derivative function is called as
 * rhs(time, value) and returns the derivative value; anything it throws
 * propagates to the caller unchanged.
 */
template <class Value, class Time = double, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
class ExplicitRKStepper {
 public:
  explicit ExplicitRKStepper(const ButcherTable<Time>& table) : table_(table) {
    k_.reserve(table_.stages());
  }

  [[nodiscard]] const ButcherTable<Time>& table() const { return table_; }

  template <class RHS>
  /** @brief Advance y by dt with the table's b weights into y_next. */
  [[nodiscard]] IntegratorStatus step(RHS&& rhs, Time t, Time dt, const Value& y, Value& y_next) {
    IntegratorStatus status = compute_stages(rhs, t, dt, y);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    status = combine(y, dt, table_.b(), y_next);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    return Algebra::finite(y_next) ? IntegratorStatus::Success : IntegratorStatus::NaNDetected;
  }

  template <class RHS>
  /**
   * @brief Advance y by dt and evaluate both weight vectors over the same stages.
   *
   * y_high uses b, y_low uses b2. Fails with MissingEmbeddedWeights before
   * any derivative evaluation when the table has no b2.
   */
  [[nodiscard]] IntegratorStatus step_embedded(RHS&& rhs,
                                               Time t,
                                               Time dt,
                                               const Value& y,
                                               Value& y_high,
                                               Value& y_low) {
    if (!table_.has_embedded()) {
      return IntegratorStatus::MissingEmbeddedWeights;
    }
    IntegratorStatus status = compute_stages(rhs, t, dt, y);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    status = combine(y, dt, table_.b(), y_high);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    status = combine(y, dt, table_.b2(), y_low);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    if (!Algebra::finite(y_high) || !Algebra::finite(y_low)) {
      return IntegratorStatus::NaNDetected;
    }
    return IntegratorStatus::Success;
  }

 private:
  template <class RHS>
  [[nodiscard]] IntegratorStatus compute_stages(RHS& rhs, Time t, Time dt, const Value& y) {
    const std::size_t n = Algebra::size(y);
    const std::size_t stages = table_.stages();
    const auto c = table_.c();
    k_.clear();

    for (std::size_t i = 0; i < stages; ++i) {
      const Time ti = t + c[i] * dt;
      if (i == 0) {
        k_.emplace_back(rhs(ti, y));
      } else {
        const std::span<const Value> prior(k_.data(), i);
        const IntegratorStatus status = weighted_combination<Value, Time, Algebra>(prior, table_.a(i), sum_);
        if (status != IntegratorStatus::Success) {
          return status;
        }
        Algebra::assign(y_stage_, y);
        Algebra::axpy(dt, sum_, y_stage_);
        k_.emplace_back(rhs(ti, std::as_const(y_stage_)));
      }

      if (Algebra::size(k_.back()) != n) {
        return IntegratorStatus::LengthMismatch;
      }
      if (!Algebra::finite(k_.back())) {
        return IntegratorStatus::NaNDetected;
      }
    }
    return IntegratorStatus::Success;
  }

  // out = y + dt * sum(weights[i] * k[i])
  [[nodiscard]] IntegratorStatus combine(const Value& y, Time dt, std::span<const Time> weights, Value& out) {
    const IntegratorStatus status =
        weighted_combination<Value, Time, Algebra>(std::span<const Value>(k_), weights, sum_);
    if (status != IntegratorStatus::Success) {
      return status;
    }
    Algebra::assign(out, y);
    Algebra::axpy(dt, sum_, out);
    return IntegratorStatus::Success;
  }

  const ButcherTable<Time>& table_;
  std::vector<Value> k_{};
  Value y_stage_{};
  Value sum_{};
};

/** @brief Single fixed-size step result. */
template <class Value>
struct StepResult {
  IntegratorStatus status = IntegratorStatus::Success;
  Value y{};
};

/** @brief Embedded dual-order step result: y_high from b, y_low from b2. */
template <class Value>
struct EmbeddedStepResult {
  IntegratorStatus status = IntegratorStatus::Success;
  Value y_high{};
  Value y_low{};
};

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/** @brief One explicit RK step of size dt from (t, y) with the given table. */
[[nodiscard]] StepResult<Value> explicit_step(RHS&& rhs,
                                              Time t,
                                              Time dt,
                                              const Value& y,
                                              const ButcherTable<Time>& table) {
  StepResult<Value> out{};
  ExplicitRKStepper<Value, Time, Algebra> stepper(table);
  out.status = stepper.step(rhs, t, dt, y, out.y);
  return out;
}

template <class Value, class Time, class RHS, class Algebra = DefaultAlgebra<Value>>
requires AlgebraFor<Algebra, Value, Time>
/** @brief One embedded RK step returning both estimates of y(t + dt). */
[[nodiscard]] EmbeddedStepResult<Value> embedded_step(RHS&& rhs,
                                                      Time t,
                                                      Time dt,
                                                      const Value& y,
                                                      const ButcherTable<Time>& table) {
  EmbeddedStepResult<Value> out{};
  ExplicitRKStepper<Value, Time, Algebra> stepper(table);
  out.status = stepper.step_embedded(rhs, t, dt, y, out.y_high, out.y_low);
  return out;
}

}  // namespace rk
