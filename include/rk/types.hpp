/**
 * @file types.hpp
 * @brief Public API enums, options, status, stats, and result containers.
 */
#pragma once

#include <functional>
#include <vector>

namespace rk {

/** @brief Named explicit Runge-Kutta methods with a built-in tableau. */
enum class Method {
  Euler,
  Heun,
  RK3,
  RK4,
  RKF45,
  CashKarp45,
  DormandPrince45
};

/** @brief Adaptive controller configuration options. */
struct IntegratorOptions {
  // Relative tolerance on the embedded error estimate.
  double rtol = 1e-8;

  // Embedded tables run adaptively unless this is cleared.
  bool adaptive = true;

  double h_init = 0.0;
  double h_min = 1e-14;
  double h_max = 1e+16;

  // Consecutive rejections of one sub-step before giving up.
  int max_retries = 64;
  int max_steps = 1000000;

  double fac_min = 0.01;
  double fac_max = 10.0;
  // Share of the tolerance targeted when sizing the step after an accepted sub-step.
  double accept_tolerance_fraction = 0.5;
};

/** @brief Terminal status returned by tableau construction, steps, and integration runs. */
enum class IntegratorStatus {
  Success,
  InvalidTableau,
  MissingEmbeddedWeights,
  LengthMismatch,
  InvalidTimeSequence,
  InvalidTolerance,
  InvalidStepSize,
  InvalidOptions,
  StepSizeUnderflow,
  MaxRetriesExceeded,
  MaxStepsExceeded,
  NaNDetected,
  UserStopped
};

/** @brief Convert IntegratorStatus to stable string token. */
[[nodiscard]] inline const char* ToString(IntegratorStatus status) {
  switch (status) {
    case IntegratorStatus::Success:
      return "success";
    case IntegratorStatus::InvalidTableau:
      return "invalid_tableau";
    case IntegratorStatus::MissingEmbeddedWeights:
      return "missing_embedded_weights";
    case IntegratorStatus::LengthMismatch:
      return "length_mismatch";
    case IntegratorStatus::InvalidTimeSequence:
      return "invalid_time_sequence";
    case IntegratorStatus::InvalidTolerance:
      return "invalid_tolerance";
    case IntegratorStatus::InvalidStepSize:
      return "invalid_step_size";
    case IntegratorStatus::InvalidOptions:
      return "invalid_options";
    case IntegratorStatus::StepSizeUnderflow:
      return "step_size_underflow";
    case IntegratorStatus::MaxRetriesExceeded:
      return "max_retries_exceeded";
    case IntegratorStatus::MaxStepsExceeded:
      return "max_steps_exceeded";
    case IntegratorStatus::NaNDetected:
      return "nan_detected";
    case IntegratorStatus::UserStopped:
      return "user_stopped";
  }
  return "unknown";
}

/** @brief True for statuses caused by a malformed tableau or mismatched coefficient rows. */
[[nodiscard]] inline bool IsConfigurationError(IntegratorStatus status) {
  return status == IntegratorStatus::InvalidTableau ||
         status == IntegratorStatus::MissingEmbeddedWeights ||
         status == IntegratorStatus::LengthMismatch;
}

/** @brief True for statuses where the adaptive controller could not meet the tolerance. */
[[nodiscard]] inline bool IsNonConvergence(IntegratorStatus status) {
  return status == IntegratorStatus::StepSizeUnderflow ||
         status == IntegratorStatus::MaxRetriesExceeded ||
         status == IntegratorStatus::MaxStepsExceeded;
}

/** @brief Runtime counters and last-step telemetry. */
struct IntegratorStats {
  int attempted_steps = 0;
  int accepted_steps = 0;
  int rejected_steps = 0;
  int max_retries_seen = 0;
  long long rhs_evals = 0;
  double last_h = 0.0;
  double last_error_ratio = 0.0;
};

/** @brief Accepted output times and the values reached at them. */
template <class Value, class Time = double>
struct Trajectory {
  std::vector<Time> times{};
  std::vector<Value> values{};

  [[nodiscard]] std::size_t size() const { return times.size(); }
  [[nodiscard]] bool empty() const { return times.empty(); }
};

/** @brief Trajectory integration result payload. */
template <class Value, class Time = double>
struct TrajectoryResult {
  IntegratorStatus status = IntegratorStatus::Success;
  Trajectory<Value, Time> trajectory{};
  IntegratorStats stats{};
};

/** @brief Optional callback invoked after each recorded output point; return false to stop. */
template <class Value, class Time = double>
using Observer = std::function<bool(Time, const Value&)>;

}  // namespace rk
