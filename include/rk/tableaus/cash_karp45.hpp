/**
 * @file cash_karp45.hpp
 * @brief Cash-Karp 4(5) embedded tableau.
 */
#pragma once

#include "rk/butcher_table.hpp"

namespace rk {

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> cash_karp45_tableau() {
  using detail::ratio;
  return make_tableau<Scalar>(
      {
          {},
          {ratio<Scalar>(1, 5)},
          {ratio<Scalar>(3, 40), ratio<Scalar>(9, 40)},
          {ratio<Scalar>(3, 10), ratio<Scalar>(-9, 10), ratio<Scalar>(6, 5)},
          {ratio<Scalar>(-11, 54), ratio<Scalar>(5, 2), ratio<Scalar>(-70, 27), ratio<Scalar>(35, 27)},
          {ratio<Scalar>(1631, 55296), ratio<Scalar>(175, 512), ratio<Scalar>(575, 13824),
           ratio<Scalar>(44275, 110592), ratio<Scalar>(253, 4096)},
      },
      {
          ratio<Scalar>(37, 378),
          Scalar(0),
          ratio<Scalar>(250, 621),
          ratio<Scalar>(125, 594),
          Scalar(0),
          ratio<Scalar>(512, 1771),
      },
      {
          Scalar(0),
          ratio<Scalar>(1, 5),
          ratio<Scalar>(3, 10),
          ratio<Scalar>(3, 5),
          Scalar(1),
          ratio<Scalar>(7, 8),
      },
      {
          ratio<Scalar>(2825, 27648),
          Scalar(0),
          ratio<Scalar>(18575, 48384),
          ratio<Scalar>(13525, 55296),
          ratio<Scalar>(277, 14336),
          ratio<Scalar>(1, 4),
      },
      4);
}

}  // namespace rk
