/**
 * @file dormand_prince45.hpp
 * @brief Dormand-Prince 5(4) embedded tableau (7 stages, last row equals the 5th-order weights).
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> dormand_prince45_tableau() {
  using detail::ratio;
  // The 7th stage is evaluated at the 5th-order solution, so the 4th-order weights use it.
  return make_tableau<Scalar>(
      {
          {},
          {ratio<Scalar>(1, 5)},
          {ratio<Scalar>(3, 40), ratio<Scalar>(9, 40)},
          {ratio<Scalar>(44, 45), ratio<Scalar>(-56, 15), ratio<Scalar>(32, 9)},
          {ratio<Scalar>(19372, 6561), ratio<Scalar>(-25360, 2187), ratio<Scalar>(64448, 6561),
           ratio<Scalar>(-212, 729)},
          {ratio<Scalar>(9017, 3168), ratio<Scalar>(-355, 33), ratio<Scalar>(46732, 5247), ratio<Scalar>(49, 176),
           ratio<Scalar>(-5103, 18656)},
          {ratio<Scalar>(35, 384), Scalar(0), ratio<Scalar>(500, 1113), ratio<Scalar>(125, 192),
           ratio<Scalar>(-2187, 6784), ratio<Scalar>(11, 84)},
      },
      {
          ratio<Scalar>(35, 384),
          Scalar(0),
          ratio<Scalar>(500, 1113),
          ratio<Scalar>(125, 192),
          ratio<Scalar>(-2187, 6784),
          ratio<Scalar>(11, 84),
          Scalar(0),
      },
      {
          Scalar(0),
          ratio<Scalar>(1, 5),
          ratio<Scalar>(3, 10),
          ratio<Scalar>(4, 5),
          ratio<Scalar>(8, 9),
          Scalar(1),
          Scalar(1),
      },
      {
          ratio<Scalar>(5179, 57600),
          Scalar(0),
          ratio<Scalar>(7571, 16695),
          ratio<Scalar>(393, 640),
          ratio<Scalar>(-92097, 339200),
          ratio<Scalar>(187, 2100),
          ratio<Scalar>(1, 40),
      },
      4);
}

}  // namespace rk
