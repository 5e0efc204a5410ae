/**
 * @file algebra.hpp
 * @brief Value algebra adapter and concept for generic scalar and container support.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <type_traits>

namespace rk {

/**
 * @brief Default algebra for arithmetic scalars and indexable containers of reals.
 *
 * Only scaling and accumulation are needed by the RK engine; no operation
 * assumes the value type has a zero element.
 */
template <class Value>
struct DefaultAlgebra {
  static std::size_t size(const Value& x) {
    if constexpr (std::is_arithmetic_v<Value>) {
      return 1;
    } else {
      return x.size();
    }
  }

  static void assign(Value& dst, const Value& src) { dst = src; }

  template <class Scalar>
  [[nodiscard]] static Value scaled(Scalar a, const Value& x) {
    if constexpr (std::is_arithmetic_v<Value>) {
      return static_cast<Value>(a * x);
    } else {
      Value out = x;
      const auto n = size(out);
      for (std::size_t i = 0; i < n; ++i) {
        out[i] = a * out[i];
      }
      return out;
    }
  }

  template <class Scalar>
  static void axpy(Scalar a, const Value& x, Value& y) {
    if constexpr (std::is_arithmetic_v<Value>) {
      y += static_cast<Value>(a * x);
    } else {
      const auto n = size(y);
      if constexpr (requires { x.data(); y.data(); }) {
        const auto* xp = x.data();
        auto* yp = y.data();
        for (std::size_t i = 0; i < n; ++i) {
          yp[i] += a * xp[i];
        }
      } else {
        for (std::size_t i = 0; i < n; ++i) {
          y[i] += a * x[i];
        }
      }
    }
  }

  /** @brief Largest per-component magnitude. */
  static double max_abs(const Value& x) {
    if constexpr (std::is_arithmetic_v<Value>) {
      return std::abs(static_cast<double>(x));
    } else {
      double m = 0.0;
      for (const auto v : x) {
        m = std::max(m, std::abs(static_cast<double>(v)));
      }
      return m;
    }
  }

  static bool finite(const Value& x) {
    if constexpr (std::is_arithmetic_v<Value>) {
      return std::isfinite(static_cast<double>(x));
    } else {
      for (const auto v : x) {
        if (!std::isfinite(static_cast<double>(v))) {
          return false;
        }
      }
      return true;
    }
  }
};

/** @brief Concept describing the value operations required by the RK engine. */
template <class Algebra, class Value, class Scalar = double>
concept AlgebraFor = requires(Value a, const Value b, Scalar s) {
  { Algebra::size(b) } -> std::convertible_to<std::size_t>;
  { Algebra::assign(a, b) };
  { Algebra::scaled(s, b) } -> std::convertible_to<Value>;
  { Algebra::axpy(s, b, a) };
  { Algebra::max_abs(b) } -> std::convertible_to<double>;
  { Algebra::finite(b) } -> std::convertible_to<bool>;
};

}  // namespace rk
