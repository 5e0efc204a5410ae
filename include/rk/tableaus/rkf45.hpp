/**
 * @file rkf45.hpp
 * @brief Fehlberg 4(5) embedded explicit Runge-Kutta tableau.
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

/** @brief Standard RKF45 tableau with 5th-order accepted solution and 4th-order embedded estimate. */
template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> rkf45_tableau() {
  using detail::ratio;
  return make_tableau<Scalar>(
      {
          {},
          {ratio<Scalar>(1, 4)},
          {ratio<Scalar>(3, 32), ratio<Scalar>(9, 32)},
          {ratio<Scalar>(1932, 2197), ratio<Scalar>(-7200, 2197), ratio<Scalar>(7296, 2197)},
          {ratio<Scalar>(439, 216), Scalar(-8), ratio<Scalar>(3680, 513), ratio<Scalar>(-845, 4104)},
          {ratio<Scalar>(-8, 27), Scalar(2), ratio<Scalar>(-3544, 2565), ratio<Scalar>(1859, 4104),
           ratio<Scalar>(-11, 40)},
      },
      {
          ratio<Scalar>(16, 135),
          Scalar(0),
          ratio<Scalar>(6656, 12825),
          ratio<Scalar>(28561, 56430),
          ratio<Scalar>(-9, 50),
          ratio<Scalar>(2, 55),
      },
      {
          Scalar(0),
          ratio<Scalar>(1, 4),
          ratio<Scalar>(3, 8),
          ratio<Scalar>(12, 13),
          Scalar(1),
          ratio<Scalar>(1, 2),
      },
      {
          ratio<Scalar>(25, 216),
          Scalar(0),
          ratio<Scalar>(1408, 2565),
          ratio<Scalar>(2197, 4104),
          ratio<Scalar>(-1, 5),
          Scalar(0),
      },
      4);
}

}  // namespace rk
