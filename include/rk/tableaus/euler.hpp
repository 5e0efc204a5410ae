/**
 * @file euler.hpp
 * @brief Single-stage explicit Euler tableau.
 */
#pragma once

#include <vector>

#include "rk/butcher_table.hpp"

namespace rk {

template <class Scalar = double>
[[nodiscard]] TableauResult<Scalar> euler_tableau() {
  return make_tableau<Scalar>({std::vector<Scalar>{}}, {Scalar(1)}, {Scalar(0)});
}

}  // namespace rk
