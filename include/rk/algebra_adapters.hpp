/**
 * @file algebra_adapters.hpp
 * @brief Optional algebra adapters for fixed-size arrays and custom accessors.
 */
#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace rk {

template <std::size_t N, class Real = double>
struct StdArrayAlgebra {
  using Value = std::array<Real, N>;

  static constexpr std::size_t size(const Value&) { return N; }
  static void assign(Value& dst, const Value& src) { dst = src; }

  template <class Scalar>
  [[nodiscard]] static Value scaled(Scalar a, const Value& x) {
    Value out;
    for (std::size_t i = 0; i < N; ++i) {
      out[i] = static_cast<Real>(a * x[i]);
    }
    return out;
  }

  template <class Scalar>
  static void axpy(Scalar a, const Value& x, Value& y) {
    for (std::size_t i = 0; i < N; ++i) {
      y[i] += static_cast<Real>(a * x[i]);
    }
  }

  static double max_abs(const Value& x) {
    double m = 0.0;
    for (Real v : x) {
      m = std::max(m, std::abs(static_cast<double>(v)));
    }
    return m;
  }

  static bool finite(const Value& x) {
    for (Real v : x) {
      if (!std::isfinite(static_cast<double>(v))) {
        return false;
      }
    }
    return true;
  }
};

/** @brief Forwards every algebra operation to a user-provided accessor type. */
template <class Accessor, class Value>
struct AccessorAlgebra {
  static std::size_t size(const Value& x) { return Accessor::size(x); }
  static void assign(Value& dst, const Value& src) { Accessor::assign(dst, src); }

  template <class Scalar>
  [[nodiscard]] static Value scaled(Scalar a, const Value& x) {
    return Accessor::scaled(a, x);
  }

  template <class Scalar>
  static void axpy(Scalar a, const Value& x, Value& y) {
    Accessor::axpy(a, x, y);
  }

  static double max_abs(const Value& x) { return Accessor::max_abs(x); }
  static bool finite(const Value& x) { return Accessor::finite(x); }
};

}  // namespace rk
