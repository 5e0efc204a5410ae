/**
 * @file rk3.hpp
 * @brief Kutta's three-stage third-order tableau.
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> rk3_tableau() {
  const Scalar half = detail::ratio<Scalar>(1, 2);
  return make_tableau<Scalar>(
      {
          {},
          {half},
          {Scalar(-1), Scalar(2)},
      },
      {detail::ratio<Scalar>(1, 6), detail::ratio<Scalar>(2, 3), detail::ratio<Scalar>(1, 6)},
      {Scalar(0), half, Scalar(1)});
}

}  // namespace rk
