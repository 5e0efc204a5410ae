#include <algorithm>
#include <array>
#include <cmath>
#include <utility>
#include <vector>

#include "rk/algebra_adapters.hpp"
#include "rk/logging.hpp"
#include "rk/rk.hpp"

namespace {

constexpr double kPi = 3.14159265358979323846;

// Two-component state with no default zero and no indexable container interface.
struct CustomState {
  double x = 0.0;
  double v = 0.0;
};

struct CustomAccessor {
  static std::size_t size(const CustomState&) { return 2; }
  static void assign(CustomState& dst, const CustomState& src) { dst = src; }
  template <class Scalar>
  static CustomState scaled(Scalar a, const CustomState& s) {
    return CustomState{a * s.x, a * s.v};
  }
  template <class Scalar>
  static void axpy(Scalar a, const CustomState& s, CustomState& y) {
    y.x += a * s.x;
    y.v += a * s.v;
  }
  static double max_abs(const CustomState& s) { return std::max(std::abs(s.x), std::abs(s.v)); }
  static bool finite(const CustomState& s) { return std::isfinite(s.x) && std::isfinite(s.v); }
};

}  // namespace

int main() {
  const std::vector<double> times{0.0, kPi, 2.0 * kPi};

  {
    using State = std::array<double, 2>;
    State y0{1.0, 0.0};
    auto rhs = [](double, const State& y) { return State{y[1], -y[0]}; };

    rk::IntegratorOptions opt;
    opt.rtol = 1e-11;
    opt.h_init = 0.05;

    const auto res = rk::integrate<State, double, decltype(rhs), rk::StdArrayAlgebra<2>>(
        rk::Method::DormandPrince45, std::move(rhs), times, y0, opt);
    if (res.status != rk::IntegratorStatus::Success) {
      rk::log::Error("StdArrayAlgebra integration failed: ", rk::ToString(res.status));
      return 1;
    }
    const State& half = res.trajectory.values[1];
    const State& full = res.trajectory.values[2];
    if (std::abs(half[0] + 1.0) > 1e-6 || std::abs(full[0] - 1.0) > 1e-6 || std::abs(full[1]) > 1e-6) {
      rk::log::Error("StdArrayAlgebra mismatch");
      return 1;
    }
  }

  {
    using State = CustomState;
    using Algebra = rk::AccessorAlgebra<CustomAccessor, State>;

    const State y0{1.0, 0.0};
    auto rhs = [](double, const State& y) { return State{y.v, -y.x}; };

    rk::IntegratorOptions opt;
    opt.rtol = 1e-11;
    opt.h_init = 0.05;

    const auto res = rk::integrate<State, double, decltype(rhs), Algebra>(
        rk::Method::RKF45, std::move(rhs), times, y0, opt);
    if (res.status != rk::IntegratorStatus::Success) {
      rk::log::Error("AccessorAlgebra integration failed: ", rk::ToString(res.status));
      return 1;
    }
    const State& full = res.trajectory.values[2];
    if (std::abs(full.x - 1.0) > 1e-6 || std::abs(full.v) > 1e-6) {
      rk::log::Error("AccessorAlgebra mismatch");
      return 1;
    }
  }

  {
    // Scalar and std::vector values through the default algebra.
    if (rk::DefaultAlgebra<double>::max_abs(-3.5) != 3.5 || rk::DefaultAlgebra<double>::size(1.0) != 1) {
      rk::log::Error("scalar default algebra mismatch");
      return 1;
    }
    const std::vector<double> v{1.0, -4.0, 2.0};
    const auto scaled = rk::DefaultAlgebra<std::vector<double>>::scaled(0.5, v);
    if (scaled != std::vector<double>{0.5, -2.0, 1.0} || rk::DefaultAlgebra<std::vector<double>>::max_abs(v) != 4.0) {
      rk::log::Error("vector default algebra mismatch");
      return 1;
    }
  }

  return 0;
}
