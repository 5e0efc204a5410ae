#include <cmath>
#include <vector>

#include <Eigen/Core>

#include "rk/butcher_table.hpp"
#include "rk/drivers.hpp"
#include "rk/eigen_algebra.hpp"
#include "rk/logging.hpp"

// Propagates the rotation flow Y' = A Y with a user-built Bogacki-Shampine
// 3(2) tableau instead of a named method.
int main() {
  using Mat = rk::eigen::Matrix;

  const auto bs32 = rk::make_tableau<double>({std::vector<double>{}, {0.5}, {0.0, 0.75}, {2.0 / 9.0, 1.0 / 3.0, 4.0 / 9.0}},
                                             {2.0 / 9.0, 1.0 / 3.0, 4.0 / 9.0, 0.0},
                                             {0.0, 0.5, 0.75, 1.0},
                                             {7.0 / 24.0, 0.25, 1.0 / 3.0, 0.125},
                                             2);
  if (!bs32.ok()) {
    rk::log::Error("tableau rejected: ", rk::ToString(bs32.status));
    return 1;
  }

  Mat a(3, 3);
  a << 0.0, -1.0, 0.0,
       1.0, 0.0, 0.0,
       0.0, 0.0, 0.0;
  auto rhs = [&a](double, const Mat& y) -> Mat { return a * y; };

  rk::IntegratorOptions opt;
  opt.rtol = 1e-8;

  const std::vector<double> times{0.0, 1.0, 2.0, 3.0};
  const auto res = rk::integrate_adaptive<Mat, double, decltype(rhs)&, rk::eigen::MatrixAlgebra>(
      rhs, times, Mat::Identity(3, 3), *bs32.table, opt);
  if (res.status != rk::IntegratorStatus::Success) {
    rk::log::Error("integration failed: ", rk::log::Summary(res.status, res.stats));
    return 1;
  }

  for (std::size_t i = 0; i < res.trajectory.size(); ++i) {
    const Mat& y = res.trajectory.values[i];
    const double orthogonality = (y.transpose() * y - Mat::Identity(3, 3)).cwiseAbs().maxCoeff();
    rk::log::Info("t=", res.trajectory.times[i], " angle=", std::atan2(y(1, 0), y(0, 0)),
                  " |Y^T Y - I|=", orthogonality);
  }
  rk::log::Info(rk::log::Summary(res.status, res.stats));
  return 0;
}
