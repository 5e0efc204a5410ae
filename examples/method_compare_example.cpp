#include <cmath>
#include <string_view>
#include <vector>

#include "rk/logging.hpp"
#include "rk/rk.hpp"

// Integrates y' = -2ty (exact y = exp(-t^2)) with every named method, either
// at a fixed grid or adaptively, and reports the final error of each.
int main(int argc, char** argv) {
  std::vector<rk::Method> methods{rk::Method::Euler,  rk::Method::Heun,       rk::Method::RK3,
                                  rk::Method::RK4,    rk::Method::RKF45,      rk::Method::CashKarp45,
                                  rk::Method::DormandPrince45};
  if (argc > 1) {
    rk::Method parsed{};
    if (!rk::ParseMethod(argv[1], parsed)) {
      rk::log::Error("unknown method '", argv[1], "'");
      return 2;
    }
    methods = {parsed};
  }

  auto rhs = [](double t, const double& y) { return -2.0 * t * y; };

  std::vector<double> times;
  for (int i = 0; i <= 20; ++i) {
    times.push_back(0.1 * i);
  }
  const double exact = std::exp(-times.back() * times.back());

  rk::IntegratorOptions opt;
  opt.rtol = 1e-9;

  for (const rk::Method method : methods) {
    const auto res = rk::integrate(method, rhs, times, 1.0, opt);
    if (res.status != rk::IntegratorStatus::Success) {
      rk::log::Warn(rk::ToString(method), ": ", rk::log::Summary(res.status, res.stats));
      continue;
    }
    rk::log::Info(rk::ToString(method), rk::IsAdaptive(method) ? " (adaptive)" : " (fixed)",
                  " error=", std::abs(res.trajectory.values.back() - exact),
                  " rhs_evals=", res.stats.rhs_evals);
  }
  return 0;
}
