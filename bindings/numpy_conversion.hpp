#pragma once

/**
 * @file numpy_conversion.hpp
 * @brief NumPy array to std::vector conversion for the bindings
 *
 * Arguments are declared as ContiguousArray so pybind11 hands over a
 * C-contiguous float64 buffer, copying strided or non-float64 input first.
 */

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include <vector>

namespace thermolog {
namespace bindings {

using ContiguousArray =
    pybind11::array_t<double, pybind11::array::c_style | pybind11::array::forcecast>;

/// Copy a contiguous array into a vector, flattened in C order
inline std::vector<double> to_vector(const ContiguousArray &data) {
  const double *ptr = data.data();
  return std::vector<double>(ptr, ptr + data.size());
}

} // namespace bindings
} // namespace thermolog
