/**
 * @file butcher_table.hpp
 * @brief Immutable Butcher tableau description of an explicit Runge-Kutta method.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "rk/types.hpp"

namespace rk {

template <class Scalar>
class ButcherTable;

template <class Scalar>
struct TableauResult {
  IntegratorStatus status = IntegratorStatus::Success;
  std::optional<ButcherTable<Scalar>> table{};

  [[nodiscard]] bool ok() const { return status == IntegratorStatus::Success && table.has_value(); }
};

namespace detail {

template <class Scalar>
[[nodiscard]] inline Scalar ratio(long long num, long long den) {
  return static_cast<Scalar>(num) / static_cast<Scalar>(den);
}

template <class Scalar>
[[nodiscard]] inline bool all_finite(std::span<const Scalar> v) {
  for (const Scalar& x : v) {
    if (!std::isfinite(static_cast<double>(x))) {
      return false;
    }
  }
  return true;
}

}  // namespace detail

/**
 * @brief Check the structural invariants of a tableau description.
 *
 * Row i of @p a must hold exactly i entries, @p b and @p c one entry per
 * stage, @p b2 is either empty or one entry per stage, and @p order is 0
 * (unknown) or positive. Every coefficient must be finite.
 */
template <class Scalar>
[[nodiscard]] IntegratorStatus validate_tableau(const std::vector<std::vector<Scalar>>& a,
                                                const std::vector<Scalar>& b,
                                                const std::vector<Scalar>& c,
                                                const std::vector<Scalar>& b2,
                                                int order) {
  const std::size_t stages = a.size();
  if (stages == 0 || b.size() != stages || c.size() != stages) {
    return IntegratorStatus::InvalidTableau;
  }
  for (std::size_t i = 0; i < stages; ++i) {
    if (a[i].size() != i || !detail::all_finite<Scalar>(a[i])) {
      return IntegratorStatus::InvalidTableau;
    }
  }
  if (!b2.empty() && b2.size() != stages) {
    return IntegratorStatus::InvalidTableau;
  }
  if (order < 0) {
    return IntegratorStatus::InvalidTableau;
  }
  if (!detail::all_finite<Scalar>(b) || !detail::all_finite<Scalar>(c) || !detail::all_finite<Scalar>(b2)) {
    return IntegratorStatus::InvalidTableau;
  }
  return IntegratorStatus::Success;
}

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> make_tableau(std::vector<std::vector<Scalar>> a,
                                                 std::vector<Scalar> b,
                                                 std::vector<Scalar> c,
                                                 std::vector<Scalar> b2 = {},
                                                 int order = 0);

/**
 * @brief Validated stage coefficients of one explicit RK method.
 *
 * Instances are only produced by make_tableau(), so every table in
 * circulation satisfies the invariants checked by validate_tableau().
 */
template <class Scalar = double>
class ButcherTable {
 public:
  [[nodiscard]] std::size_t stages() const { return c_.size(); }

  /** @brief Row i of the stage matrix; holds exactly i coefficients. */
  [[nodiscard]] std::span<const Scalar> a(std::size_t i) const { return a_[i]; }
  [[nodiscard]] std::span<const Scalar> b() const { return b_; }
  [[nodiscard]] std::span<const Scalar> c() const { return c_; }
  [[nodiscard]] std::span<const Scalar> b2() const { return b2_; }

  [[nodiscard]] bool has_embedded() const { return !b2_.empty(); }
  [[nodiscard]] bool has_order() const { return order_ > 0; }
  /** @brief Order of the lower-order embedded estimate, 0 when unknown. */
  [[nodiscard]] int order() const { return order_; }

 private:
  ButcherTable(std::vector<std::vector<Scalar>> a,
               std::vector<Scalar> b,
               std::vector<Scalar> c,
               std::vector<Scalar> b2,
               int order)
      : a_(std::move(a)), b_(std::move(b)), c_(std::move(c)), b2_(std::move(b2)), order_(order) {}

  friend TableauResult<Scalar> make_tableau<Scalar>(std::vector<std::vector<Scalar>>,
                                                    std::vector<Scalar>,
                                                    std::vector<Scalar>,
                                                    std::vector<Scalar>,
                                                    int);

  std::vector<std::vector<Scalar>> a_;
  std::vector<Scalar> b_;
  std::vector<Scalar> c_;
  std::vector<Scalar> b2_;
  int order_ = 0;
};

/** @brief Validate a tableau description and build the immutable table on success. */
template <class Scalar>
[[nodiscard]] TableauResult<Scalar> make_tableau(std::vector<std::vector<Scalar>> a,
                                                 std::vector<Scalar> b,
                                                 std::vector<Scalar> c,
                                                 std::vector<Scalar> b2,
                                                 int order) {
  TableauResult<Scalar> out{};
  out.status = validate_tableau<Scalar>(a, b, c, b2, order);
  if (out.status != IntegratorStatus::Success) {
    return out;
  }
  out.table = ButcherTable<Scalar>(std::move(a), std::move(b), std::move(c), std::move(b2), order);
  return out;
}

}  // namespace rk
