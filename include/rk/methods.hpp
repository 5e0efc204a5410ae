/**
 * @file methods.hpp
 * @brief Static mapping from named methods to their Butcher tableaus.
 */
#pragma once

#include <string_view>

#include "rk/butcher_table.hpp"
#include "rk/tableaus/cash_karp45.hpp"
#include "rk/tableaus/dormand_prince45.hpp"
#include "rk/tableaus/euler.hpp"
#include "rk/tableaus/heun.hpp"
#include "rk/tableaus/rk3.hpp"
#include "rk/tableaus/rk4.hpp"
#include "rk/tableaus/rkf45.hpp"
#include "rk/types.hpp"

namespace rk {

/** @brief Convert Method to the token accepted by ParseMethod. */
[[nodiscard]] inline const char* ToString(Method method) {
  switch (method) {
    case Method::Euler:
      return "euler";
    case Method::Heun:
      return "heun";
    case Method::RK3:
      return "rk3";
    case Method::RK4:
      return "rk4";
    case Method::RKF45:
      return "rkf45";
    case Method::CashKarp45:
      return "cash_karp45";
    case Method::DormandPrince45:
      return "dormand_prince45";
  }
  return "unknown";
}

/** @brief Look up a method by its ToString token; leaves @p out untouched on failure. */
[[nodiscard]] inline bool ParseMethod(std::string_view name, Method& out) {
  constexpr Method kAll[] = {Method::Euler, Method::Heun, Method::RK3, Method::RK4,
                             Method::RKF45, Method::CashKarp45, Method::DormandPrince45};
  for (const Method m : kAll) {
    if (name == ToString(m)) {
      out = m;
      return true;
    }
  }
  return false;
}

/** @brief True for methods whose tableau carries embedded weights and an error order. */
[[nodiscard]] inline bool IsAdaptive(Method method) {
  switch (method) {
    case Method::RKF45:
    case Method::CashKarp45:
    case Method::DormandPrince45:
      return true;
    case Method::Euler:
    case Method::Heun:
    case Method::RK3:
    case Method::RK4:
      return false;
  }
  return false;
}

/** @brief Tableau of a named method at the given scalar precision, built once per process. */
template <class Scalar = double>
[[nodiscard]] const TableauResult<Scalar>& tableau(Method method) {
  switch (method) {
    case Method::Euler: {
      static const TableauResult<Scalar> t = euler_tableau<Scalar>();
      return t;
    }
    case Method::Heun: {
      static const TableauResult<Scalar> t = heun_tableau<Scalar>();
      return t;
    }
    case Method::RK3: {
      static const TableauResult<Scalar> t = rk3_tableau<Scalar>();
      return t;
    }
    case Method::RK4: {
      static const TableauResult<Scalar> t = rk4_tableau<Scalar>();
      return t;
    }
    case Method::RKF45: {
      static const TableauResult<Scalar> t = rkf45_tableau<Scalar>();
      return t;
    }
    case Method::CashKarp45: {
      static const TableauResult<Scalar> t = cash_karp45_tableau<Scalar>();
      return t;
    }
    case Method::DormandPrince45: {
      static const TableauResult<Scalar> t = dormand_prince45_tableau<Scalar>();
      return t;
    }
  }

  static const TableauResult<Scalar> unknown{IntegratorStatus::InvalidTableau, {}};
  return unknown;
}

}  // namespace rk
