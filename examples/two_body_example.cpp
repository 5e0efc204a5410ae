#include <array>
#include <cmath>
#include <numbers>
#include <vector>

#include "rk/algebra_adapters.hpp"
#include "rk/logging.hpp"
#include "rk/rk.hpp"

int main() {
  using State = std::array<double, 6>;  // x y z vx vy vz
  using Algebra = rk::StdArrayAlgebra<6>;

  constexpr double kMu = 398600.4418;  // km^3/s^2 (Earth)
  constexpr double kOrbitalRadiusKm = 7000.0;
  const double kOrbitalSpeedKms = std::sqrt(kMu / kOrbitalRadiusKm);

  const State y0 = {kOrbitalRadiusKm, 0.0, 0.0, 0.0, kOrbitalSpeedKms, 0.0};

  auto rhs = [](double, const State& y) {
    const double r2 = y[0] * y[0] + y[1] * y[1] + y[2] * y[2];
    const double r = std::sqrt(r2);
    const double inv_r3 = 1.0 / (r2 * r);
    return State{y[3], y[4], y[5], -kMu * y[0] * inv_r3, -kMu * y[1] * inv_r3, -kMu * y[2] * inv_r3};
  };

  const double period_s =
      2.0 * std::numbers::pi * std::sqrt((kOrbitalRadiusKm * kOrbitalRadiusKm * kOrbitalRadiusKm) / kMu);

  // Quarter-orbit output grid.
  std::vector<double> times;
  for (int i = 0; i <= 4; ++i) {
    times.push_back(0.25 * period_s * i);
  }

  rk::IntegratorOptions opt;
  opt.rtol = 1e-11;
  opt.h_init = 10.0;
  opt.h_min = 1e-6;
  opt.h_max = 60.0;

  const auto obs = [](double t, const State& y) {
    rk::log::Debug("t=", t, " r=[", y[0], ", ", y[1], ", ", y[2], "] km");
    return true;
  };

  const auto res = rk::integrate<State, double, decltype(rhs)&, Algebra>(
      rk::Method::DormandPrince45, rhs, times, y0, opt, obs);
  if (res.status != rk::IntegratorStatus::Success) {
    rk::log::Error("integration failed: ", rk::log::Summary(res.status, res.stats));
    return 1;
  }

  const State& yf = res.trajectory.values.back();
  rk::log::Info("Final state after ~1 orbit:");
  rk::log::Info("r = [", yf[0], ", ", yf[1], ", ", yf[2], "] km");
  rk::log::Info("v = [", yf[3], ", ", yf[4], ", ", yf[5], "] km/s");
  rk::log::Info("closure error = ", std::abs(yf[0] - y0[0]), " km");
  rk::log::Info(rk::log::Summary(res.status, res.stats));

  return 0;
}
