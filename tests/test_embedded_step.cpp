#include <cmath>
#include <vector>

#include "rk/logging.hpp"
#include "rk/rk.hpp"

namespace {

using State = std::vector<double>;

int TestEqualWeightsGiveIdenticalEstimates() {
  using Rows = std::vector<std::vector<double>>;
  const std::vector<double> b{1.0 / 6.0, 1.0 / 3.0, 1.0 / 3.0, 1.0 / 6.0};
  const auto tab = rk::make_tableau<double>(Rows{{}, {0.5}, {0.0, 0.5}, {0.0, 0.0, 1.0}}, b,
                                            {0.0, 0.5, 0.5, 1.0}, b, 4);
  if (!tab.ok()) {
    rk::log::Error("duplicate-weight tableau rejected: ", rk::ToString(tab.status));
    return 1;
  }
  auto f = [](double t, const State& y) { return State{y[1], -y[0] * std::cos(t)}; };
  const auto res = rk::embedded_step(f, 0.2, 0.3, State{1.0, 0.5}, *tab.table);
  if (res.status != rk::IntegratorStatus::Success || res.y_high != res.y_low) {
    rk::log::Error("identical weights produced different estimates");
    return 1;
  }
  if (rk::relative_max_error(res.y_high, res.y_low).ratio != 0.0) {
    rk::log::Error("identical estimates must have zero error ratio");
    return 1;
  }
  return 0;
}

int TestHighEstimateMatchesExplicitStep() {
  const auto& tab = rk::tableau<double>(rk::Method::RKF45);
  auto f = [](double t, const State& y) { return State{y[0] * t, -y[1]}; };
  const State y0{1.0, 2.0};
  const auto dual = rk::embedded_step(f, 0.0, 0.25, y0, *tab.table);
  const auto single = rk::explicit_step(f, 0.0, 0.25, y0, *tab.table);
  if (dual.status != rk::IntegratorStatus::Success || single.status != rk::IntegratorStatus::Success) {
    rk::log::Error("rkf45 steps failed");
    return 1;
  }
  if (dual.y_high != single.y) {
    rk::log::Error("embedded high estimate differs from the explicit step with the same b");
    return 1;
  }
  return 0;
}

int TestEstimatesBracketOrder() {
  auto f = [](double, double y) { return y; };
  for (const rk::Method method : {rk::Method::RKF45, rk::Method::CashKarp45, rk::Method::DormandPrince45}) {
    const auto& tab = rk::tableau<double>(method);
    const auto res = rk::embedded_step(f, 0.0, 0.2, 1.0, *tab.table);
    if (res.status != rk::IntegratorStatus::Success) {
      rk::log::Error(rk::ToString(method), " embedded step failed");
      return 1;
    }
    const double exact = std::exp(0.2);
    const double e_high = std::abs(res.y_high - exact);
    const double e_low = std::abs(res.y_low - exact);
    if (!(e_high < e_low) || res.y_high == res.y_low) {
      rk::log::Error(rk::ToString(method), " high estimate not better: ", e_high, " vs ", e_low);
      return 1;
    }
    const auto err = rk::relative_max_error(res.y_high, res.y_low);
    if (std::abs(err.abs_error - std::abs(res.y_high - res.y_low)) > 1e-18 ||
        std::abs(err.ratio - err.abs_error / std::abs(res.y_high)) > 1e-18) {
      rk::log::Error(rk::ToString(method), " error estimate mismatch");
      return 1;
    }
  }
  return 0;
}

int TestMissingEmbeddedWeights() {
  const auto& tab = rk::tableau<double>(rk::Method::RK4);
  int calls = 0;
  auto f = [&calls](double, double y) {
    ++calls;
    return y;
  };
  const auto res = rk::embedded_step(f, 0.0, 0.1, 1.0, *tab.table);
  if (res.status != rk::IntegratorStatus::MissingEmbeddedWeights || calls != 0) {
    rk::log::Error("expected MissingEmbeddedWeights without derivative calls, got ", rk::ToString(res.status));
    return 1;
  }
  if (!rk::IsConfigurationError(res.status)) {
    rk::log::Error("MissingEmbeddedWeights must classify as a configuration error");
    return 1;
  }
  return 0;
}

int TestDegenerateErrorEstimate() {
  const auto zero = rk::relative_max_error(State{0.0, 0.0}, State{0.0, 0.0});
  if (zero.ratio != 0.0 || zero.abs_error != 0.0 || zero.reference != 0.0) {
    rk::log::Error("zero error over zero reference must be an exact accept");
    return 1;
  }
  const auto blowup = rk::relative_max_error(State{0.0, 0.0}, State{1e-3, 0.0});
  if (!std::isinf(blowup.ratio)) {
    rk::log::Error("non-zero error over zero reference must be infinite");
    return 1;
  }
  const auto mixed = rk::relative_max_error(State{4.0, -2.0}, State{3.5, -2.25});
  if (mixed.abs_error != 0.5 || mixed.reference != 4.0 || mixed.ratio != 0.125) {
    rk::log::Error("max-norm error estimate mismatch: ", mixed.ratio);
    return 1;
  }
  return 0;
}

}  // namespace

int main() {
  int failures = 0;
  failures += TestEqualWeightsGiveIdenticalEstimates();
  failures += TestHighEstimateMatchesExplicitStep();
  failures += TestEstimatesBracketOrder();
  failures += TestMissingEmbeddedWeights();
  failures += TestDegenerateErrorEstimate();
  if (failures != 0) {
    rk::log::Error(failures, " embedded step checks failed");
    return 1;
  }
  return 0;
}
