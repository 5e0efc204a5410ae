/**
 * @file rk4.hpp
 * @brief Classic 4-stage 4th-order fixed-step Runge-Kutta tableau.
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

/** @brief Classical RK4 tableau. */
template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> rk4_tableau() {
  const Scalar half = detail::ratio<Scalar>(1, 2);
  const Scalar sixth = detail::ratio<Scalar>(1, 6);
  const Scalar third = detail::ratio<Scalar>(1, 3);
  return make_tableau<Scalar>(
      {
          {},
          {half},
          {Scalar(0), half},
          {Scalar(0), Scalar(0), Scalar(1)},
      },
      {sixth, third, third, sixth},
      {Scalar(0), half, half, Scalar(1)});
}

}  // namespace rk
