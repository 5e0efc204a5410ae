#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "rk/logging.hpp"
#include "rk/rk.hpp"

namespace {

using State = std::vector<double>;

int TestEulerIsOneExplicitEulerStep() {
  auto f = [](double, double y) { return y; };
  for (const double h : {0.5, 0.1, 1e-3}) {
    const auto res = rk::step(rk::Method::Euler, f, 0.0, h, 1.0);
    if (res.status != rk::IntegratorStatus::Success || res.y != 1.0 + h) {
      rk::log::Error("euler step mismatch for h=", h, ": ", res.y);
      return 1;
    }
  }
  return 0;
}

int TestRK4AccuracyAgainstEuler() {
  auto f = [](double, double y) { return y; };
  const double exact = std::exp(0.1);
  const auto rk4 = rk::step(rk::Method::RK4, f, 0.0, 0.1, 1.0);
  const auto euler = rk::step(rk::Method::Euler, f, 0.0, 0.1, 1.0);
  if (rk4.status != rk::IntegratorStatus::Success || euler.status != rk::IntegratorStatus::Success) {
    rk::log::Error("rk4/euler step failed");
    return 1;
  }
  const double e_rk4 = std::abs(rk4.y - exact);
  const double e_euler = std::abs(euler.y - exact);
  // Local truncation error of RK4 is h^5/120 for y' = y.
  if (e_rk4 > 1e-7 || e_rk4 * 1000.0 > e_euler) {
    rk::log::Error("rk4 local error too large: ", e_rk4, " euler: ", e_euler);
    return 1;
  }
  return 0;
}

int TestZeroStepReturnsInput() {
  auto f = [](double t, const State& y) { return State{y[1], -y[0] + t}; };
  const State y0{0.3, -1.2};
  for (const rk::Method method : {rk::Method::Euler, rk::Method::Heun, rk::Method::RK3, rk::Method::RK4,
                                  rk::Method::RKF45, rk::Method::CashKarp45, rk::Method::DormandPrince45}) {
    const auto res = rk::step(method, f, 0.7, 0.0, y0);
    if (res.status != rk::IntegratorStatus::Success || res.y != y0) {
      rk::log::Error(rk::ToString(method), " changed the state over a zero step");
      return 1;
    }
  }
  return 0;
}

int TestStageTimes() {
  std::vector<double> seen;
  auto f = [&seen](double t, double y) {
    seen.push_back(t);
    return y;
  };
  const auto res = rk::step(rk::Method::RK4, f, 1.0, 0.2, 1.0);
  const std::vector<double> expected{1.0, 1.1, 1.1, 1.2};
  if (res.status != rk::IntegratorStatus::Success || seen.size() != expected.size()) {
    rk::log::Error("rk4 made ", seen.size(), " derivative calls");
    return 1;
  }
  for (std::size_t i = 0; i < expected.size(); ++i) {
    if (std::abs(seen[i] - expected[i]) > 1e-15) {
      rk::log::Error("stage ", i, " evaluated at t=", seen[i]);
      return 1;
    }
  }
  return 0;
}

int TestTimeDependentDerivative() {
  auto f = [](double t, double) { return std::cos(t); };
  const auto res = rk::step(rk::Method::RK3, f, 0.0, 0.1, 0.0);
  if (res.status != rk::IntegratorStatus::Success || std::abs(res.y - std::sin(0.1)) > 1e-8) {
    rk::log::Error("rk3 quadrature of cos mismatch: ", res.y);
    return 1;
  }
  return 0;
}

int TestExtendedPrecision() {
  auto f = [](long double, long double y) { return y; };
  const auto res = rk::step(rk::Method::RK4, f, 0.0L, 0.1L, 1.0L);
  if (res.status != rk::IntegratorStatus::Success || std::abs(res.y - std::exp(0.1L)) > 2e-7L) {
    rk::log::Error("long double rk4 step mismatch");
    return 1;
  }
  return 0;
}

int TestStepperReuse() {
  const auto& tab = rk::tableau<double>(rk::Method::Heun);
  rk::ExplicitRKStepper<State> stepper(*tab.table);
  auto f = [](double, const State& y) { return State{-y[0]}; };
  State y{1.0};
  State y_next;
  for (int i = 0; i < 10; ++i) {
    if (stepper.step(f, 0.1 * i, 0.1, y, y_next) != rk::IntegratorStatus::Success) {
      rk::log::Error("heun stepper failed at step ", i);
      return 1;
    }
    y = y_next;
  }
  if (std::abs(y[0] - std::exp(-1.0)) > 2e-3) {
    rk::log::Error("heun decay mismatch: ", y[0]);
    return 1;
  }
  return 0;
}

int TestDerivativeFailures() {
  {
    auto f = [](double, const State&) -> State { throw std::runtime_error("derivative blew up"); };
    bool caught = false;
    try {
      const auto res = rk::step(rk::Method::RK4, f, 0.0, 0.1, State{1.0});
      rk::log::Error("expected exception, got status=", rk::ToString(res.status));
    } catch (const std::runtime_error& e) {
      caught = std::string(e.what()) == "derivative blew up";
    }
    if (!caught) {
      rk::log::Error("derivative exception was not propagated unchanged");
      return 1;
    }
  }

  {
    auto f = [](double, const State& y) { return State(y.size() + 1, 0.0); };
    const auto res = rk::step(rk::Method::RK4, f, 0.0, 0.1, State{1.0, 2.0});
    if (res.status != rk::IntegratorStatus::LengthMismatch) {
      rk::log::Error("expected LengthMismatch, got ", rk::ToString(res.status));
      return 1;
    }
  }

  {
    auto f = [](double t, double y) { return t > 0.05 ? std::numeric_limits<double>::quiet_NaN() : y; };
    const auto res = rk::step(rk::Method::RK4, f, 0.0, 0.1, 1.0);
    if (res.status != rk::IntegratorStatus::NaNDetected) {
      rk::log::Error("expected NaNDetected, got ", rk::ToString(res.status));
      return 1;
    }
  }
  return 0;
}

}  // namespace

int main() {
  int failures = 0;
  failures += TestEulerIsOneExplicitEulerStep();
  failures += TestRK4AccuracyAgainstEuler();
  failures += TestZeroStepReturnsInput();
  failures += TestStageTimes();
  failures += TestTimeDependentDerivative();
  failures += TestExtendedPrecision();
  failures += TestStepperReuse();
  failures += TestDerivativeFailures();
  if (failures != 0) {
    rk::log::Error(failures, " explicit step checks failed");
    return 1;
  }
  return 0;
}
