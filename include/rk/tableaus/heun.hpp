/**
 * @file heun.hpp
 * @brief Two-stage second-order Heun (explicit trapezoidal) tableau.
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> heun_tableau() {
  const Scalar half = detail::ratio<Scalar>(1, 2);
  return make_tableau<Scalar>(
      {
          {},
          {Scalar(1)},
      },
      {half, half},
      {Scalar(0), Scalar(1)});
}

}  // namespace rk
