/**
 * @file eigen_algebra.hpp
 * @brief Algebra adapter for dense Eigen vectors and matrices (vector and tensor valued states).
 */
#pragma once

#include <cmath>
#include <cstddef>

#include <Eigen/Core>

namespace rk {

template <class Value>
struct EigenAlgebra {
  using Scalar = typename Value::Scalar;

  static std::size_t size(const Value& x) { return static_cast<std::size_t>(x.size()); }
  static void assign(Value& dst, const Value& src) { dst = src; }

  template <class S>
  [[nodiscard]] static Value scaled(S a, const Value& x) {
    return static_cast<Scalar>(a) * x;
  }

  template <class S>
  static void axpy(S a, const Value& x, Value& y) {
    y += static_cast<Scalar>(a) * x;
  }

  static double max_abs(const Value& x) {
    if (x.size() == 0) {
      return 0.0;
    }
    return static_cast<double>(x.cwiseAbs().maxCoeff());
  }

  static bool finite(const Value& x) { return x.allFinite(); }
};

namespace eigen {

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

using VectorAlgebra = EigenAlgebra<Vector>;
using MatrixAlgebra = EigenAlgebra<Matrix>;

}  // namespace eigen

}  // namespace rk
