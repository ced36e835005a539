#include "thermolog/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void init_data_bindings(py::module &m);
void bind_processing(py::module &m);

namespace thermolog {
void init_core_bindings(py::module &m);
}

/// Main Python module definition
PYBIND11_MODULE(thermolog_cpp, m) {
  m.doc() = "thermolog C++ core - post-processing of heat-pump data-logger "
            "measurements";

  // Version information
  m.attr("__version__") = thermolog::Version::get_version_string();
  m.def("get_version", &thermolog::Version::get_version_string,
        "Get library version string");

  // Errors, units, quantities, session
  thermolog::init_core_bindings(m);

  // Dataset, CSV options, name table
  init_data_bindings(m);

  // Segmentation, binning, filters, validation
  bind_processing(m);
}
